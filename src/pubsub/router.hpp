/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_ROUTER_HPP_INCLUDED__
#define __QLINK_ROUTER_HPP_INCLUDED__

#include "core/msg.hpp"
#include "session/connection.hpp"
#include "utils/condition_variable.hpp"
#include "utils/macros.hpp"
#include "utils/mutex.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace qlink
{
typedef std::shared_ptr<const msg_t> msg_ptr_t;

//  Decides whether a published message goes to a subscription.
typedef std::function<bool (const msg_t &)> router_filter_t;

//  Where the router hands deliveries. Implemented by the node, which
//  forwards them to the connection manager.
struct i_router_sink
{
    virtual ~i_router_sink () {}

    //  Sends msg_ to connection_ as operation op_. done_ must be invoked
    //  exactly once, from any thread, with the send outcome.
    virtual void async_deliver (connection_id_t connection_,
                                uint64_t op_,
                                const msg_ptr_t &msg_,
                                const send_completion_t &done_) = 0;

    //  False on threads that must never wait, i.e. the I/O thread.
    virtual bool can_block () = 0;

    //  A queued message was discarded by the drop_oldest policy.
    virtual void delivery_dropped (connection_id_t connection_,
                                   uint64_t handle_,
                                   const std::string &topic_) = 0;
};

//  Bounded delivery queue of one subscription. depth bounds the messages
//  waiting in queue; the one handed to the sink and not yet completed is
//  no longer queued and does not count, so a stalled subscriber holds at
//  most depth + 1 undelivered messages.
struct subscription_t
{
    struct entry_t
    {
        msg_ptr_t msg;
        uint64_t op;
    };

    uint64_t handle;
    std::string topic;
    connection_id_t connection;
    router_filter_t filter;
    int policy;
    size_t depth;
    int publish_timeout;

    //  Guards everything below.
    mutex_t sync;
    condition_variable_t cond;

    std::deque<entry_t> queue;
    bool in_flight;
    uint64_t in_flight_op;
    bool paused;
    bool removed;
};

//  Maps topic subscriptions to connections and fans published messages
//  out to them. Safe to use from any thread; the index lock is never held
//  while delivering.

class router_t
{
  public:
    explicit router_t (i_router_sink *sink_);
    ~router_t ();

    //  Registers a subscription of connection_ to topic_ and returns its
    //  handle. depth_ of 0 is treated as 1.
    uint64_t subscribe (const std::string &topic_,
                        connection_id_t connection_,
                        const router_filter_t &filter_,
                        int policy_,
                        int depth_,
                        int publish_timeout_);

    //  Returns -1 with errno ENOENT if handle_ is unknown.
    int unsubscribe (uint64_t handle_);

    //  Queues msg_ for every matching connection once and starts delivery.
    //  Returns the number of connections it was queued for, or -1 with
    //  errno EAGAIN if a blocking subscription stayed full.
    int publish (const msg_ptr_t &msg_, uint64_t op_);

    //  Holds (true) or releases (false) deliveries to connection_.
    void pause (connection_id_t connection_, bool paused_);

    //  Removes every subscription of connection_.
    void connection_dead (connection_id_t connection_);

    //  Same as connection_dead, for a peer that was given up on.
    void peer_unreachable (connection_id_t connection_);

    //  Drops queued deliveries of publish op_ and stores the connections
    //  where it is already being sent in in_flight_. Returns the number of
    //  deliveries affected.
    int cancel (uint64_t op_, std::vector<connection_id_t> *in_flight_);

    //  Number of subscriptions for topic_.
    size_t subscribers (const std::string &topic_);

  private:
    typedef std::shared_ptr<subscription_t> subscription_ptr_t;

    //  Returns 0 if queued, 1 if the subscription went away and -1 with
    //  errno EAGAIN if it stayed full.
    int enqueue (const subscription_ptr_t &subscription_,
                 const msg_ptr_t &msg_,
                 uint64_t op_);
    void try_send (const subscription_ptr_t &subscription_);
    void delivered (const subscription_ptr_t &subscription_, int error_);
    void remove_connection (connection_id_t connection_);
    static void mark_removed (const subscription_ptr_t &subscription_);

    i_router_sink *const _sink;

    typedef std::unordered_map<uint64_t, subscription_ptr_t> handles_t;
    typedef std::unordered_map<std::string, handles_t> topics_t;
    typedef std::unordered_map<connection_id_t, std::set<uint64_t> >
      connections_t;

    //  Guards the index below, never held across a delivery.
    mutex_t _sync;
    topics_t _topics;
    handles_t _handles;
    connections_t _connections;
    std::set<connection_id_t> _paused;
    uint64_t _next_handle;

    QLINK_NON_COPYABLE_NOR_MOVABLE (router_t)
};
}

#endif
