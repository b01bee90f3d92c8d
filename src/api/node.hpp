/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_NODE_HPP_INCLUDED__
#define __QLINK_NODE_HPP_INCLUDED__

#include "core/io_thread.hpp"
#include "core/options.hpp"
#include "pubsub/router.hpp"
#include "session/connection_manager.hpp"
#include "utils/condition_variable.hpp"
#include "utils/macros.hpp"
#include "utils/mutex.hpp"
#include "qlink.hpp"

#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace qlink
{
class ctx_t;

//  One messaging endpoint: an I/O thread with its connection manager and
//  pub/sub router. Application threads call in through the methods below,
//  which marshal onto the I/O thread; the manager and router report back
//  through the interfaces it implements.

class node_t QLINK_FINAL : public i_manager_events, public i_router_sink
{
  public:
    node_t (ctx_t *ctx_, const char *name_);
    ~node_t ();

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    int connect (const std::string &endpoint_, connection_id_t *connection_);
    int bind (const std::string &endpoint_);
    std::string last_endpoint () const;
    int accept (connection_id_t *connection_, int timeout_);

    int send (connection_id_t connection_,
              int type_,
              uint64_t correlation_id_,
              const void *data_,
              size_t size_);
    int send_async (connection_id_t connection_,
                    const void *data_,
                    size_t size_,
                    uint64_t *op_,
                    const completion_t &done_);
    int cancel (uint64_t op_);
    int send_all (const void *data_, size_t size_);

    int request (connection_id_t connection_,
                 const void *data_,
                 size_t size_,
                 std::string *reply_,
                 int timeout_);

    int publish (const std::string &topic_,
                 const void *data_,
                 size_t size_,
                 uint64_t *op_);
    int subscribe (const std::string &topic_,
                   const filter_t &filter_,
                   subscription_id_t *id_);
    int subscribe_connection (connection_id_t connection_,
                              const std::string &topic_,
                              const filter_t &filter_,
                              subscription_id_t *id_);
    int unsubscribe (subscription_id_t id_);

    void set_handler (i_event_handler *handler_);
    int recv_event (event_t *event_, int timeout_);

    int close_connection (connection_id_t connection_);
    int state (connection_id_t connection_, int *state_);
    int open_stream (connection_id_t connection_, stream_id_t *stream_);

    //  Stops the I/O thread. Idempotent; later calls fail with
    //  QLINK_ETERM.
    int close ();

    //  i_manager_events implementation
    void connection_up (connection_id_t id_,
                        const std::string &identity_,
                        const std::string &address_,
                        bool initiated_) QLINK_OVERRIDE;
    void connection_down (connection_id_t id_, int reason_) QLINK_OVERRIDE;
    void connection_reconnecting (connection_id_t id_,
                                  int attempt_,
                                  int ivl_) QLINK_OVERRIDE;
    void connection_unreachable (connection_id_t id_) QLINK_OVERRIDE;
    void connection_degraded (connection_id_t id_,
                              bool degraded_) QLINK_OVERRIDE;
    void message_received (connection_id_t id_,
                           const msg_t &msg_) QLINK_OVERRIDE;
    void stream_malformed (connection_id_t id_,
                           stream_id_t stream_) QLINK_OVERRIDE;

    //  i_router_sink implementation
    void async_deliver (connection_id_t connection_,
                        uint64_t op_,
                        const msg_ptr_t &msg_,
                        const send_completion_t &done_) QLINK_OVERRIDE;
    bool can_block () QLINK_OVERRIDE;
    void delivery_dropped (connection_id_t connection_,
                           uint64_t handle_,
                           const std::string &topic_) QLINK_OVERRIDE;

  private:
    //  Local subscription to a topic published by peers.
    struct local_subscription_t
    {
        std::string topic;
        filter_t filter;
    };

    //  Request waiting for its reply.
    struct request_t
    {
        connection_id_t connection;
        bool done;
        int error;
        std::string reply;
    };

    //  Fails with QLINK_ETERM after close and with EDEADLK when called on
    //  the I/O thread for an operation that waits.
    int check (bool blocking_) const;

    uint64_t next_id ();

    //  Starts sending msg_ on the I/O thread.
    int start_send (connection_id_t connection_,
                    uint64_t op_,
                    const msg_t &msg_,
                    const send_completion_t &done_);
    void send_done (uint64_t op_);

    void send_subscriptions (connection_id_t connection_);
    void send_control (connection_id_t connection_,
                       int type_,
                       uint64_t handle_,
                       const std::string &topic_);
    void remote_subscribe (connection_id_t connection_, const msg_t &msg_);
    void remote_unsubscribe (connection_id_t connection_, const msg_t &msg_);
    void deliver_publish (connection_id_t connection_, const msg_t &msg_);
    void complete_request (const msg_t &msg_);
    void fail_requests (connection_id_t connection_, int error_);

    void emit (const event_t &event_);

    ctx_t *const _ctx;
    io_thread_t _io_thread;
    connection_manager_t *_manager;
    router_t _router;

    //  Guards the state shared with application threads below.
    mutable mutex_t _sync;
    options_t _options;
    bool _terminated;
    uint64_t _next_id;
    std::string _last_endpoint;
    i_event_handler *_handler;

    std::deque<event_t> _inbox;
    condition_variable_t _inbox_cond;

    //  Accepted connections so far, signalled through _accept_cond.
    uint64_t _accepts;
    condition_variable_t _accept_cond;

    typedef std::map<uint64_t, std::shared_ptr<request_t> > requests_t;
    requests_t _requests;
    condition_variable_t _request_cond;

    //  State below is only touched on the I/O thread.

    //  Connection of each send in progress, for cancel.
    std::map<uint64_t, connection_id_t> _sends;

    typedef std::map<subscription_id_t, local_subscription_t> locals_t;
    locals_t _locals;

    //  Publisher-side subscriptions: local id to router handle.
    std::map<subscription_id_t, uint64_t> _routed;

    //  Subscriptions of peers: (connection, peer handle) to router handle.
    typedef std::map<std::pair<connection_id_t, uint64_t>, uint64_t> remotes_t;
    remotes_t _remotes;

    QLINK_NON_COPYABLE_NOR_MOVABLE (node_t)
};
}

#endif
