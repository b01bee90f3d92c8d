/* SPDX-License-Identifier: MPL-2.0 */

#include "pubsub/router.hpp"
#include "utils/clock.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"
#include "qlink.h"

qlink::router_t::router_t (i_router_sink *sink_) :
    _sink (sink_),
    _next_handle (1)
{
}

qlink::router_t::~router_t ()
{
    scoped_lock_t lock (_sync);
    for (handles_t::iterator it = _handles.begin (); it != _handles.end ();
         ++it)
        mark_removed (it->second);
}

uint64_t qlink::router_t::subscribe (const std::string &topic_,
                                     connection_id_t connection_,
                                     const router_filter_t &filter_,
                                     int policy_,
                                     int depth_,
                                     int publish_timeout_)
{
    const subscription_ptr_t subscription =
      std::make_shared<subscription_t> ();
    subscription->topic = topic_;
    subscription->connection = connection_;
    subscription->filter = filter_;
    subscription->policy = policy_;
    subscription->depth = depth_ > 0 ? static_cast<size_t> (depth_) : 1;
    subscription->publish_timeout = publish_timeout_;
    subscription->in_flight = false;
    subscription->in_flight_op = 0;
    subscription->removed = false;

    scoped_lock_t lock (_sync);
    subscription->handle = _next_handle++;
    subscription->paused = _paused.count (connection_) > 0;
    _topics[topic_][subscription->handle] = subscription;
    _handles[subscription->handle] = subscription;
    _connections[connection_].insert (subscription->handle);

    QLINK_DBG_ROUTER ("subscribe %llu: '%s' for connection %llu",
                      static_cast<unsigned long long> (subscription->handle),
                      topic_.c_str (),
                      static_cast<unsigned long long> (connection_));
    return subscription->handle;
}

int qlink::router_t::unsubscribe (uint64_t handle_)
{
    subscription_ptr_t subscription;
    {
        scoped_lock_t lock (_sync);
        const handles_t::iterator it = _handles.find (handle_);
        if (it == _handles.end ()) {
            errno = ENOENT;
            return -1;
        }
        subscription = it->second;
        _handles.erase (it);

        const topics_t::iterator tit = _topics.find (subscription->topic);
        if (tit != _topics.end ()) {
            tit->second.erase (handle_);
            if (tit->second.empty ())
                _topics.erase (tit);
        }
        const connections_t::iterator cit =
          _connections.find (subscription->connection);
        if (cit != _connections.end ()) {
            cit->second.erase (handle_);
            if (cit->second.empty ())
                _connections.erase (cit);
        }
    }
    mark_removed (subscription);
    return 0;
}

int qlink::router_t::publish (const msg_ptr_t &msg_, uint64_t op_)
{
    std::vector<subscription_ptr_t> candidates;
    {
        scoped_lock_t lock (_sync);
        const topics_t::iterator it = _topics.find (msg_->topic ());
        if (it == _topics.end ())
            return 0;
        candidates.reserve (it->second.size ());
        for (handles_t::iterator hit = it->second.begin ();
             hit != it->second.end (); ++hit)
            candidates.push_back (hit->second);
    }

    //  Filters run without the index lock; they are user code.
    std::set<connection_id_t> seen;
    std::vector<subscription_ptr_t> targets;
    for (std::vector<subscription_ptr_t>::iterator it = candidates.begin ();
         it != candidates.end (); ++it) {
        const subscription_ptr_t &subscription = *it;
        if (seen.count (subscription->connection))
            continue;
        if (subscription->filter && !subscription->filter (*msg_))
            continue;
        seen.insert (subscription->connection);
        targets.push_back (subscription);
    }

    int queued = 0;
    bool full = false;
    for (std::vector<subscription_ptr_t>::iterator it = targets.begin ();
         it != targets.end (); ++it) {
        const int rc = enqueue (*it, msg_, op_);
        if (rc == 0) {
            queued++;
            try_send (*it);
        } else if (rc == -1)
            full = true;
    }

    if (full) {
        errno = EAGAIN;
        return -1;
    }
    return queued;
}

void qlink::router_t::pause (connection_id_t connection_, bool paused_)
{
    std::vector<subscription_ptr_t> affected;
    {
        scoped_lock_t lock (_sync);
        if (paused_)
            _paused.insert (connection_);
        else
            _paused.erase (connection_);

        const connections_t::iterator it = _connections.find (connection_);
        if (it != _connections.end ())
            for (std::set<uint64_t>::iterator hit = it->second.begin ();
                 hit != it->second.end (); ++hit)
                affected.push_back (_handles[*hit]);
    }

    for (std::vector<subscription_ptr_t>::iterator it = affected.begin ();
         it != affected.end (); ++it) {
        {
            scoped_lock_t lock ((*it)->sync);
            (*it)->paused = paused_;
        }
        if (!paused_)
            try_send (*it);
    }
}

void qlink::router_t::connection_dead (connection_id_t connection_)
{
    remove_connection (connection_);
}

void qlink::router_t::peer_unreachable (connection_id_t connection_)
{
    QLINK_DBG_ROUTER ("connection %llu unreachable, dropping subscriptions",
                      static_cast<unsigned long long> (connection_));
    remove_connection (connection_);
}

int qlink::router_t::cancel (uint64_t op_,
                              std::vector<connection_id_t> *in_flight_)
{
    std::vector<subscription_ptr_t> all;
    {
        scoped_lock_t lock (_sync);
        all.reserve (_handles.size ());
        for (handles_t::iterator it = _handles.begin (); it != _handles.end ();
             ++it)
            all.push_back (it->second);
    }

    int affected = 0;
    for (std::vector<subscription_ptr_t>::iterator it = all.begin ();
         it != all.end (); ++it) {
        subscription_t &subscription = **it;
        scoped_lock_t lock (subscription.sync);
        for (std::deque<subscription_t::entry_t>::iterator eit =
               subscription.queue.begin ();
             eit != subscription.queue.end ();) {
            if (eit->op == op_) {
                eit = subscription.queue.erase (eit);
                affected++;
            } else
                ++eit;
        }
        if (subscription.in_flight && subscription.in_flight_op == op_) {
            in_flight_->push_back (subscription.connection);
            affected++;
        }
        subscription.cond.broadcast ();
    }
    return affected;
}

size_t qlink::router_t::subscribers (const std::string &topic_)
{
    scoped_lock_t lock (_sync);
    const topics_t::iterator it = _topics.find (topic_);
    return it == _topics.end () ? 0 : it->second.size ();
}

int qlink::router_t::enqueue (const subscription_ptr_t &subscription_,
                              const msg_ptr_t &msg_,
                              uint64_t op_)
{
    subscription_t &subscription = *subscription_;
    bool dropped = false;
    {
        scoped_lock_t lock (subscription.sync);
        if (subscription.removed)
            return 1;

        if (subscription.queue.size () >= subscription.depth) {
            if (subscription.policy == QLINK_BACKPRESSURE_DROP_OLDEST) {
                subscription.queue.pop_front ();
                dropped = true;
            } else {
                if (!_sink->can_block ()) {
                    errno = EAGAIN;
                    return -1;
                }
                const uint64_t deadline =
                  clock_t::now_ms () + subscription.publish_timeout;
                while (subscription.queue.size () >= subscription.depth
                       && !subscription.removed) {
                    const uint64_t now = clock_t::now_ms ();
                    if (now >= deadline) {
                        errno = EAGAIN;
                        return -1;
                    }
                    subscription.cond.wait (&subscription.sync,
                                            static_cast<int> (deadline - now));
                }
                if (subscription.removed)
                    return 1;
            }
        }

        subscription_t::entry_t entry;
        entry.msg = msg_;
        entry.op = op_;
        subscription.queue.push_back (entry);
    }

    if (dropped) {
        QLINK_DBG_ROUTER ("queue of %llu full, oldest dropped",
                          static_cast<unsigned long long> (subscription.handle));
        _sink->delivery_dropped (subscription.connection, subscription.handle,
                                 subscription.topic);
    }
    return 0;
}

void qlink::router_t::try_send (const subscription_ptr_t &subscription_)
{
    subscription_t::entry_t entry;
    {
        scoped_lock_t lock (subscription_->sync);
        if (subscription_->in_flight || subscription_->paused
            || subscription_->removed || subscription_->queue.empty ())
            return;
        entry = subscription_->queue.front ();
        subscription_->queue.pop_front ();
        subscription_->in_flight = true;
        subscription_->in_flight_op = entry.op;
        subscription_->cond.broadcast ();
    }

    router_t *self = this;
    const subscription_ptr_t subscription = subscription_;
    _sink->async_deliver (subscription_->connection, entry.op, entry.msg,
                          [self, subscription] (int error_) {
                              self->delivered (subscription, error_);
                          });
}

void qlink::router_t::delivered (const subscription_ptr_t &subscription_,
                                 int error_)
{
    if (error_ != 0)
        QLINK_DBG_ROUTER ("delivery to %llu failed: %s",
                          static_cast<unsigned long long> (
                            subscription_->connection),
                          errno_to_string (error_));
    {
        scoped_lock_t lock (subscription_->sync);
        subscription_->in_flight = false;
        subscription_->in_flight_op = 0;
        subscription_->cond.broadcast ();
    }
    try_send (subscription_);
}

void qlink::router_t::remove_connection (connection_id_t connection_)
{
    std::vector<subscription_ptr_t> removed;
    {
        scoped_lock_t lock (_sync);
        _paused.erase (connection_);
        const connections_t::iterator it = _connections.find (connection_);
        if (it == _connections.end ())
            return;

        for (std::set<uint64_t>::iterator hit = it->second.begin ();
             hit != it->second.end (); ++hit) {
            const handles_t::iterator sit = _handles.find (*hit);
            if (sit == _handles.end ())
                continue;
            const subscription_ptr_t subscription = sit->second;
            _handles.erase (sit);
            const topics_t::iterator tit = _topics.find (subscription->topic);
            if (tit != _topics.end ()) {
                tit->second.erase (*hit);
                if (tit->second.empty ())
                    _topics.erase (tit);
            }
            removed.push_back (subscription);
        }
        _connections.erase (it);
    }

    for (std::vector<subscription_ptr_t>::iterator it = removed.begin ();
         it != removed.end (); ++it)
        mark_removed (*it);
}

void qlink::router_t::mark_removed (const subscription_ptr_t &subscription_)
{
    //  Wakes publishers blocked on the queue; queued messages are lost.
    scoped_lock_t lock (subscription_->sync);
    subscription_->removed = true;
    subscription_->queue.clear ();
    subscription_->cond.broadcast ();
}
