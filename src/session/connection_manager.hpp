/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_CONNECTION_MANAGER_HPP_INCLUDED__
#define __QLINK_CONNECTION_MANAGER_HPP_INCLUDED__

#include "core/options.hpp"
#include "session/connection.hpp"
#include "transports/i_mux_transport.hpp"
#include "transports/tls/tls_context.hpp"
#include "utils/macros.hpp"

#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace qlink
{
class ctx_t;
class io_thread_t;

//  Connection lifecycle notifications, raised on the I/O thread.
struct i_manager_events
{
    virtual ~i_manager_events () {}

    virtual void connection_up (connection_id_t id_,
                                const std::string &identity_,
                                const std::string &address_,
                                bool initiated_) = 0;

    //  reason_ is 0 for an explicit close.
    virtual void connection_down (connection_id_t id_, int reason_) = 0;

    virtual void
    connection_reconnecting (connection_id_t id_, int attempt_, int ivl_) = 0;

    virtual void connection_unreachable (connection_id_t id_) = 0;

    virtual void connection_degraded (connection_id_t id_, bool degraded_) = 0;

    virtual void message_received (connection_id_t id_, const msg_t &msg_) = 0;

    virtual void stream_malformed (connection_id_t id_,
                                   stream_id_t stream_) = 0;
};

//  Owns every connection of a node: establishes them, accepts inbound
//  ones, keeps them alive and reconnects lost initiated ones with
//  backoff. All methods must be called on the I/O thread.

class connection_manager_t QLINK_FINAL : public i_connection_events
{
  public:
    //  Outcome of connect: 0 and the connection id once the handshake
    //  completed, otherwise the errno and 0.
    typedef std::function<void (int, connection_id_t)> connect_handler_t;

    connection_manager_t (io_thread_t *io_thread_,
                          ctx_t *ctx_,
                          i_manager_events *events_);
    ~connection_manager_t ();

    //  Options apply to connections created afterwards and to timers armed
    //  afterwards on existing ones.
    void set_options (const options_t &options_);
    const options_t &options () const { return _options; }

    //  Starts connecting to endpoint_. Returns -1 with errno EINVAL or
    //  EPROTONOSUPPORT if the endpoint is unusable; otherwise handler_
    //  reports the first attempt.
    int connect (const std::string &endpoint_,
                 const connect_handler_t &handler_);

    //  Starts listening. The bound address, with the actual port for
    //  tcp port 0, is stored in bound_.
    int listen (const std::string &endpoint_, std::string *bound_);

    //  Pops the oldest accepted connection that completed its handshake.
    //  Returns -1 with errno EAGAIN if there is none.
    int accept (connection_id_t *id_);

    //  The following return -1 with errno ENOTCONN for an unknown id.
    int open_stream (connection_id_t id_, stream_id_t *stream_);
    int send (connection_id_t id_,
              uint64_t op_,
              const msg_t &msg_,
              const send_completion_t &done_);
    int cancel (connection_id_t id_, uint64_t op_);
    int close (connection_id_t id_);
    int health (connection_id_t id_, int *health_);

    //  Ids of live or degraded connections.
    void live_connections (std::vector<connection_id_t> *ids_) const;

    //  Closes listeners and connections without raising events. Pending
    //  connects complete with QLINK_ETERM.
    void terminate ();

    //  i_connection_events implementation
    void connection_live (connection_t *connection_) QLINK_OVERRIDE;
    void connection_degraded (connection_t *connection_,
                              bool degraded_) QLINK_OVERRIDE;
    void connection_failed (connection_t *connection_,
                            int reason_,
                            bool was_up_) QLINK_OVERRIDE;
    void connection_message (connection_t *connection_,
                             const msg_t &msg_) QLINK_OVERRIDE;
    void connection_malformed (connection_t *connection_,
                               stream_id_t stream_) QLINK_OVERRIDE;
    void connection_reconnect (connection_t *connection_) QLINK_OVERRIDE;

  private:
    connection_t *find (connection_id_t id_) const;
    void start_attempt (connection_t *connection_);
    void transport_connected (connection_id_t id_,
                              uint64_t attempt_,
                              const boost::system::error_code &ec_,
                              const mux_connection_ptr_t &transport_);
    void accepted (const mux_connection_ptr_t &transport_);
    void schedule_reconnect (connection_t *connection_);
    void retire (connection_t *connection_);
    int tls_client_context (tls_context_ptr_t *context_);

    io_thread_t *const _io_thread;
    ctx_t *const _ctx;
    i_manager_events *const _events;

    options_t _options;

    //  Built on the first tls:// connect; dropped when options change.
    tls_context_ptr_t _tls_client;

    typedef std::map<connection_id_t, connection_t *> connections_t;
    connections_t _connections;
    connection_id_t _next_id;

    //  Connects whose first attempt has not completed.
    typedef std::map<connection_id_t, connect_handler_t> pending_t;
    pending_t _pending;

    std::deque<connection_id_t> _accepted;
    std::vector<mux_listener_ptr_t> _listeners;

    bool _terminated;

    QLINK_NON_COPYABLE_NOR_MOVABLE (connection_manager_t)
};
}

#endif
