/* SPDX-License-Identifier: MPL-2.0 */

#include "api/node.hpp"
#include "utils/clock.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

namespace
{
//  Completion slot for an application thread waiting on the I/O thread.
struct waiter_t
{
    waiter_t () : done (false), error (0), id (0) {}

    void complete (int error_, uint64_t id_)
    {
        qlink::scoped_lock_t lock (sync);
        done = true;
        error = error_;
        id = id_;
        cond.broadcast ();
    }

    int wait ()
    {
        qlink::scoped_lock_t lock (sync);
        while (!done) {
            const int rc = cond.wait (&sync, -1);
            errno_assert (rc == 0);
        }
        return error;
    }

    qlink::mutex_t sync;
    qlink::condition_variable_t cond;
    bool done;
    int error;
    uint64_t id;
};

//  Remaining milliseconds until deadline_, 0 once passed.
int remaining (uint64_t deadline_)
{
    const uint64_t now = qlink::clock_t::now_ms ();
    return now >= deadline_ ? 0 : static_cast<int> (deadline_ - now);
}
}

qlink::node_t::node_t (ctx_t *ctx_, const char *name_) :
    _ctx (ctx_),
    _manager (NULL),
    _router (this),
    _terminated (false),
    _next_id (1),
    _handler (NULL),
    _accepts (0)
{
    _manager = new (std::nothrow) connection_manager_t (&_io_thread, _ctx, this);
    alloc_assert (_manager);
    _manager->set_options (_options);
    _io_thread.start (name_);
}

qlink::node_t::~node_t ()
{
    const int rc = close ();
    errno_assert (rc == 0);
}

int qlink::node_t::setopt (int option_, const void *optval_, size_t optvallen_)
{
    if (check (false) != 0)
        return -1;

    options_t options;
    {
        scoped_lock_t lock (_sync);
        if (_options.setopt (option_, optval_, optvallen_) != 0)
            return -1;
        options = _options;
    }
    _io_thread.call ([this, &options] () { _manager->set_options (options); });
    return 0;
}

int qlink::node_t::getopt (int option_, void *optval_, size_t *optvallen_) const
{
    scoped_lock_t lock (_sync);
    return _options.getopt (option_, optval_, optvallen_);
}

int qlink::node_t::connect (const std::string &endpoint_,
                            connection_id_t *connection_)
{
    if (check (true) != 0)
        return -1;

    const std::shared_ptr<waiter_t> waiter = std::make_shared<waiter_t> ();
    int rc = 0;
    int err = 0;
    _io_thread.call ([&] () {
        rc = _manager->connect (endpoint_,
                                [waiter] (int error_, connection_id_t id_) {
                                    waiter->complete (error_, id_);
                                });
        if (rc != 0)
            err = errno;
    });
    if (rc != 0) {
        errno = err;
        return -1;
    }

    const int error = waiter->wait ();
    if (error != 0) {
        errno = error;
        return -1;
    }
    *connection_ = waiter->id;
    return 0;
}

int qlink::node_t::bind (const std::string &endpoint_)
{
    if (check (false) != 0)
        return -1;

    int rc = 0;
    int err = 0;
    std::string bound;
    _io_thread.call ([&] () {
        rc = _manager->listen (endpoint_, &bound);
        if (rc != 0)
            err = errno;
    });
    if (rc != 0) {
        errno = err;
        return -1;
    }

    scoped_lock_t lock (_sync);
    _last_endpoint = bound;
    return 0;
}

std::string qlink::node_t::last_endpoint () const
{
    scoped_lock_t lock (_sync);
    return _last_endpoint;
}

int qlink::node_t::accept (connection_id_t *connection_, int timeout_)
{
    if (check (true) != 0)
        return -1;

    const uint64_t deadline =
      timeout_ < 0 ? 0 : clock_t::now_ms () + static_cast<uint64_t> (timeout_);
    while (true) {
        uint64_t accepts;
        {
            scoped_lock_t lock (_sync);
            accepts = _accepts;
        }

        int rc = 0;
        connection_id_t id = 0;
        _io_thread.call ([&] () { rc = _manager->accept (&id); });
        if (rc == 0) {
            *connection_ = id;
            return 0;
        }

        scoped_lock_t lock (_sync);
        while (_accepts == accepts) {
            if (_terminated) {
                errno = QLINK_ETERM;
                return -1;
            }
            if (timeout_ < 0) {
                const int wrc = _accept_cond.wait (&_sync, -1);
                errno_assert (wrc == 0);
                continue;
            }
            const int left = remaining (deadline);
            if (left == 0) {
                errno = EAGAIN;
                return -1;
            }
            _accept_cond.wait (&_sync, left);
        }
    }
}

int qlink::node_t::send (connection_id_t connection_,
                         int type_,
                         uint64_t correlation_id_,
                         const void *data_,
                         size_t size_)
{
    if (check (false) != 0)
        return -1;

    const msg_t msg (type_, correlation_id_, std::string (), data_, size_);
    const uint64_t op = next_id ();

    //  Inside an event handler the send is only started.
    if (_io_thread.in_this_thread ())
        return start_send (connection_, op, msg, send_completion_t ());

    const std::shared_ptr<waiter_t> waiter = std::make_shared<waiter_t> ();
    int rc = 0;
    int err = 0;
    _io_thread.call ([&] () {
        rc = start_send (connection_, op, msg,
                         [waiter] (int error_) { waiter->complete (error_, 0); });
        if (rc != 0)
            err = errno;
    });
    if (rc != 0) {
        errno = err;
        return -1;
    }

    const int error = waiter->wait ();
    if (error != 0) {
        errno = error;
        return -1;
    }
    return 0;
}

int qlink::node_t::send_async (connection_id_t connection_,
                               const void *data_,
                               size_t size_,
                               uint64_t *op_,
                               const completion_t &done_)
{
    if (check (false) != 0)
        return -1;

    const msg_t msg (QLINK_MSG_DATA, 0, std::string (), data_, size_);
    const uint64_t op = next_id ();
    int rc = 0;
    int err = 0;
    _io_thread.call ([&] () {
        rc = start_send (connection_, op, msg, done_);
        if (rc != 0)
            err = errno;
    });
    if (rc != 0) {
        errno = err;
        return -1;
    }
    if (op_)
        *op_ = op;
    return 0;
}

int qlink::node_t::cancel (uint64_t op_)
{
    if (check (false) != 0)
        return -1;

    int rc = 0;
    int err = 0;
    _io_thread.call ([&] () {
        const std::map<uint64_t, connection_id_t>::iterator it =
          _sends.find (op_);
        if (it != _sends.end ()) {
            rc = _manager->cancel (it->second, op_);
            if (rc != 0)
                err = errno;
            return;
        }

        //  Not a send, maybe a publish.
        std::vector<connection_id_t> in_flight;
        if (_router.cancel (op_, &in_flight) == 0) {
            rc = -1;
            err = ENOENT;
            return;
        }
        for (std::vector<connection_id_t>::iterator cit = in_flight.begin ();
             cit != in_flight.end (); ++cit)
            if (_manager->cancel (*cit, op_) != 0)
                QLINK_DBG_NODE ("publish %llu already sent to %llu",
                                static_cast<unsigned long long> (op_),
                                static_cast<unsigned long long> (*cit));
    });
    if (rc != 0) {
        errno = err;
        return -1;
    }
    return 0;
}

int qlink::node_t::send_all (const void *data_, size_t size_)
{
    if (check (false) != 0)
        return -1;

    const msg_t msg (QLINK_MSG_DATA, 0, std::string (), data_, size_);
    int sent = 0;
    _io_thread.call ([&] () {
        std::vector<connection_id_t> ids;
        _manager->live_connections (&ids);
        for (std::vector<connection_id_t>::iterator it = ids.begin ();
             it != ids.end (); ++it)
            if (start_send (*it, next_id (), msg, send_completion_t ()) == 0)
                sent++;
    });
    return sent;
}

int qlink::node_t::request (connection_id_t connection_,
                            const void *data_,
                            size_t size_,
                            std::string *reply_,
                            int timeout_)
{
    if (check (true) != 0)
        return -1;

    const uint64_t correlation_id = next_id ();
    const std::shared_ptr<request_t> request = std::make_shared<request_t> ();
    request->connection = connection_;
    request->done = false;
    request->error = 0;
    int timeout;
    {
        scoped_lock_t lock (_sync);
        timeout = timeout_ < 0 ? _options.request_timeout : timeout_;
        _requests[correlation_id] = request;
    }
    const uint64_t deadline =
      clock_t::now_ms () + static_cast<uint64_t> (timeout);

    if (send (connection_, QLINK_MSG_REQUEST, correlation_id, data_, size_)
        != 0) {
        const int err = errno;
        scoped_lock_t lock (_sync);
        _requests.erase (correlation_id);
        errno = err;
        return -1;
    }

    scoped_lock_t lock (_sync);
    while (!request->done) {
        if (_terminated) {
            request->done = true;
            request->error = QLINK_ETERM;
            break;
        }
        const int left = remaining (deadline);
        if (left == 0) {
            request->done = true;
            request->error = ETIMEDOUT;
            break;
        }
        _request_cond.wait (&_sync, left);
    }
    _requests.erase (correlation_id);

    if (request->error != 0) {
        errno = request->error;
        return -1;
    }
    reply_->swap (request->reply);
    return 0;
}

int qlink::node_t::publish (const std::string &topic_,
                            const void *data_,
                            size_t size_,
                            uint64_t *op_)
{
    if (check (false) != 0)
        return -1;
    if (topic_.size () > msg_max_topic_size) {
        errno = EINVAL;
        return -1;
    }

    const uint64_t op = next_id ();
    const msg_ptr_t msg = std::make_shared<const msg_t> (
      QLINK_MSG_PUBLISH, 0, topic_, data_, size_);
    if (op_)
        *op_ = op;
    return _router.publish (msg, op);
}

int qlink::node_t::subscribe (const std::string &topic_,
                              const filter_t &filter_,
                              subscription_id_t *id_)
{
    if (check (false) != 0)
        return -1;
    if (topic_.size () > msg_max_topic_size) {
        errno = EINVAL;
        return -1;
    }

    const subscription_id_t id = next_id ();
    _io_thread.call ([&] () {
        local_subscription_t local;
        local.topic = topic_;
        local.filter = filter_;
        _locals[id] = local;

        std::vector<connection_id_t> ids;
        _manager->live_connections (&ids);
        for (std::vector<connection_id_t>::iterator it = ids.begin ();
             it != ids.end (); ++it)
            send_control (*it, QLINK_MSG_SUBSCRIBE, id, topic_);
    });
    if (id_)
        *id_ = id;
    return 0;
}

int qlink::node_t::subscribe_connection (connection_id_t connection_,
                                         const std::string &topic_,
                                         const filter_t &filter_,
                                         subscription_id_t *id_)
{
    if (check (false) != 0)
        return -1;

    int policy, depth, publish_timeout;
    {
        scoped_lock_t lock (_sync);
        policy = _options.backpressure;
        depth = _options.sub_queue_depth;
        publish_timeout = _options.publish_timeout;
    }

    router_filter_t filter;
    if (filter_)
        filter = [filter_] (const msg_t &msg_) {
            return filter_ (msg_.topic (), msg_.body ());
        };

    const subscription_id_t id = next_id ();
    int rc = 0;
    int err = 0;
    _io_thread.call ([&] () {
        int health;
        rc = _manager->health (connection_, &health);
        if (rc != 0) {
            err = errno;
            return;
        }
        _routed[id] = _router.subscribe (topic_, connection_, filter, policy,
                                         depth, publish_timeout);
    });
    if (rc != 0) {
        errno = err;
        return -1;
    }
    if (id_)
        *id_ = id;
    return 0;
}

int qlink::node_t::unsubscribe (subscription_id_t id_)
{
    if (check (false) != 0)
        return -1;

    int rc = 0;
    int err = 0;
    _io_thread.call ([&] () {
        const locals_t::iterator it = _locals.find (id_);
        if (it != _locals.end ()) {
            const std::string topic = it->second.topic;
            _locals.erase (it);

            std::vector<connection_id_t> ids;
            _manager->live_connections (&ids);
            for (std::vector<connection_id_t>::iterator cit = ids.begin ();
                 cit != ids.end (); ++cit)
                send_control (*cit, QLINK_MSG_UNSUBSCRIBE, id_, topic);
            return;
        }

        const std::map<subscription_id_t, uint64_t>::iterator rit =
          _routed.find (id_);
        if (rit == _routed.end ()) {
            rc = -1;
            err = ENOENT;
            return;
        }
        const uint64_t handle = rit->second;
        _routed.erase (rit);
        //  Already gone if the connection died.
        if (_router.unsubscribe (handle) != 0)
            QLINK_DBG_NODE ("subscription %llu was already dropped",
                            static_cast<unsigned long long> (id_));
    });
    if (rc != 0) {
        errno = err;
        return -1;
    }
    return 0;
}

void qlink::node_t::set_handler (i_event_handler *handler_)
{
    scoped_lock_t lock (_sync);
    _handler = handler_;
}

int qlink::node_t::recv_event (event_t *event_, int timeout_)
{
    if (check (timeout_ != 0) != 0)
        return -1;

    const uint64_t deadline =
      timeout_ < 0 ? 0 : clock_t::now_ms () + static_cast<uint64_t> (timeout_);

    scoped_lock_t lock (_sync);
    while (_inbox.empty ()) {
        if (_terminated) {
            errno = QLINK_ETERM;
            return -1;
        }
        if (timeout_ < 0) {
            const int rc = _inbox_cond.wait (&_sync, -1);
            errno_assert (rc == 0);
            continue;
        }
        const int left = remaining (deadline);
        if (left == 0) {
            errno = EAGAIN;
            return -1;
        }
        _inbox_cond.wait (&_sync, left);
    }
    *event_ = _inbox.front ();
    _inbox.pop_front ();
    return 0;
}

int qlink::node_t::close_connection (connection_id_t connection_)
{
    if (check (false) != 0)
        return -1;

    int rc = 0;
    int err = 0;
    _io_thread.call ([&] () {
        rc = _manager->close (connection_);
        if (rc != 0)
            err = errno;
    });
    if (rc != 0) {
        errno = err;
        return -1;
    }
    return 0;
}

int qlink::node_t::state (connection_id_t connection_, int *state_)
{
    if (check (false) != 0)
        return -1;

    int rc = 0;
    int err = 0;
    _io_thread.call ([&] () {
        rc = _manager->health (connection_, state_);
        if (rc != 0)
            err = errno;
    });
    if (rc != 0) {
        errno = err;
        return -1;
    }
    return 0;
}

int qlink::node_t::open_stream (connection_id_t connection_,
                                stream_id_t *stream_)
{
    if (check (false) != 0)
        return -1;

    int rc = 0;
    int err = 0;
    _io_thread.call ([&] () {
        rc = _manager->open_stream (connection_, stream_);
        if (rc != 0)
            err = errno;
    });
    if (rc != 0) {
        errno = err;
        return -1;
    }
    return 0;
}

int qlink::node_t::close ()
{
    {
        scoped_lock_t lock (_sync);
        if (_terminated)
            return 0;
        if (_io_thread.in_this_thread ()) {
            errno = EDEADLK;
            return -1;
        }
        _terminated = true;
    }

    _io_thread.call ([this] () { _manager->terminate (); });
    //  Lets the completions posted by terminate run before the loop stops.
    _io_thread.call ([] () {});
    _io_thread.stop ();
    delete _manager;
    _manager = NULL;

    scoped_lock_t lock (_sync);
    for (requests_t::iterator it = _requests.begin (); it != _requests.end ();
         ++it) {
        if (!it->second->done) {
            it->second->done = true;
            it->second->error = QLINK_ETERM;
        }
    }
    _request_cond.broadcast ();
    _inbox_cond.broadcast ();
    _accept_cond.broadcast ();
    return 0;
}

void qlink::node_t::connection_up (connection_id_t id_,
                                   const std::string &identity_,
                                   const std::string &address_,
                                   bool initiated_)
{
    if (!initiated_) {
        scoped_lock_t lock (_sync);
        _accepts++;
        _accept_cond.broadcast ();
    }
    send_subscriptions (id_);

    event_t event;
    event.event = QLINK_EVENT_CONNECTED;
    event.connection = id_;
    event.address = address_;
    event.identity = identity_;
    event.value = initiated_ ? 1 : 0;
    emit (event);
}

void qlink::node_t::connection_down (connection_id_t id_, int reason_)
{
    _router.connection_dead (id_);
    for (remotes_t::iterator it = _remotes.begin (); it != _remotes.end ();) {
        if (it->first.first == id_)
            _remotes.erase (it++);
        else
            ++it;
    }
    fail_requests (id_, ECONNRESET);

    event_t event;
    event.event = QLINK_EVENT_DISCONNECTED;
    event.connection = id_;
    event.value = reason_;
    emit (event);
}

void qlink::node_t::connection_reconnecting (connection_id_t id_,
                                             int attempt_,
                                             int ivl_)
{
    QLINK_DBG_NODE ("reconnecting %llu in %d ms",
                    static_cast<unsigned long long> (id_), ivl_);
    LIBQLINK_UNUSED (ivl_);

    event_t event;
    event.event = QLINK_EVENT_RECONNECTING;
    event.connection = id_;
    event.value = attempt_;
    emit (event);
}

void qlink::node_t::connection_unreachable (connection_id_t id_)
{
    _router.peer_unreachable (id_);
    fail_requests (id_, QLINK_EUNREACHABLE);

    event_t event;
    event.event = QLINK_EVENT_UNREACHABLE;
    event.connection = id_;
    emit (event);
}

void qlink::node_t::connection_degraded (connection_id_t id_, bool degraded_)
{
    _router.pause (id_, degraded_);

    event_t event;
    event.event = QLINK_EVENT_DEGRADED;
    event.connection = id_;
    event.value = degraded_ ? 1 : 0;
    emit (event);
}

void qlink::node_t::message_received (connection_id_t id_, const msg_t &msg_)
{
    switch (msg_.type ()) {
        case QLINK_MSG_SUBSCRIBE:
            remote_subscribe (id_, msg_);
            return;
        case QLINK_MSG_UNSUBSCRIBE:
            remote_unsubscribe (id_, msg_);
            return;
        case QLINK_MSG_REPLY:
            complete_request (msg_);
            return;
        case QLINK_MSG_PUBLISH:
            deliver_publish (id_, msg_);
            return;
        default:
            break;
    }

    event_t event;
    event.event = QLINK_EVENT_MESSAGE_RECEIVED;
    event.connection = id_;
    event.message_type = msg_.type ();
    event.correlation_id = msg_.correlation_id ();
    event.topic = msg_.topic ();
    event.data = msg_.body ();
    emit (event);
}

void qlink::node_t::stream_malformed (connection_id_t id_, stream_id_t stream_)
{
    event_t event;
    event.event = QLINK_EVENT_MALFORMED_CHUNK;
    event.connection = id_;
    event.value = stream_;
    emit (event);
}

void qlink::node_t::async_deliver (connection_id_t connection_,
                                   uint64_t op_,
                                   const msg_ptr_t &msg_,
                                   const send_completion_t &done_)
{
    if (!_io_thread.in_this_thread ()) {
        _io_thread.post ([this, connection_, op_, msg_, done_] () {
            async_deliver (connection_, op_, msg_, done_);
        });
        return;
    }

    if (_manager->send (connection_, op_, *msg_, done_) != 0) {
        const int error = errno;
        _io_thread.post ([done_, error] () { done_ (error); });
    }
}

bool qlink::node_t::can_block ()
{
    return !_io_thread.in_this_thread ();
}

void qlink::node_t::delivery_dropped (connection_id_t connection_,
                                      uint64_t handle_,
                                      const std::string &topic_)
{
    event_t event;
    event.event = QLINK_EVENT_MESSAGE_DROPPED;
    event.connection = connection_;
    event.topic = topic_;
    event.value = static_cast<int64_t> (handle_);

    if (_io_thread.in_this_thread ())
        emit (event);
    else
        _io_thread.post ([this, event] () { emit (event); });
}

int qlink::node_t::check (bool blocking_) const
{
    scoped_lock_t lock (_sync);
    if (_terminated) {
        errno = QLINK_ETERM;
        return -1;
    }
    if (blocking_ && _io_thread.in_this_thread ()) {
        errno = EDEADLK;
        return -1;
    }
    return 0;
}

uint64_t qlink::node_t::next_id ()
{
    scoped_lock_t lock (_sync);
    return _next_id++;
}

int qlink::node_t::start_send (connection_id_t connection_,
                               uint64_t op_,
                               const msg_t &msg_,
                               const send_completion_t &done_)
{
    const int rc = _manager->send (
      connection_, op_, msg_, [this, op_, done_] (int error_) {
          send_done (op_);
          if (done_)
              done_ (error_);
      });
    if (rc != 0) {
        QLINK_DBG_NODE ("connection %llu not available: %s",
                        static_cast<unsigned long long> (connection_),
                        errno_to_string (errno));
        return -1;
    }
    _sends[op_] = connection_;
    return 0;
}

void qlink::node_t::send_done (uint64_t op_)
{
    _sends.erase (op_);
}

void qlink::node_t::send_subscriptions (connection_id_t connection_)
{
    for (locals_t::iterator it = _locals.begin (); it != _locals.end (); ++it)
        send_control (connection_, QLINK_MSG_SUBSCRIBE, it->first,
                      it->second.topic);
}

void qlink::node_t::send_control (connection_id_t connection_,
                                  int type_,
                                  uint64_t handle_,
                                  const std::string &topic_)
{
    const msg_t msg (type_, handle_, topic_, NULL, 0);
    if (start_send (connection_, next_id (), msg, send_completion_t ()) != 0)
        QLINK_DBG_NODE ("subscription update to %llu lost",
                        static_cast<unsigned long long> (connection_));
}

void qlink::node_t::remote_subscribe (connection_id_t connection_,
                                      const msg_t &msg_)
{
    const remotes_t::key_type key (connection_, msg_.correlation_id ());
    if (_remotes.count (key))
        return;

    int policy, depth, publish_timeout;
    {
        scoped_lock_t lock (_sync);
        policy = _options.backpressure;
        depth = _options.sub_queue_depth;
        publish_timeout = _options.publish_timeout;
    }
    _remotes[key] = _router.subscribe (msg_.topic (), connection_,
                                       router_filter_t (), policy, depth,
                                       publish_timeout);
}

void qlink::node_t::remote_unsubscribe (connection_id_t connection_,
                                        const msg_t &msg_)
{
    const remotes_t::iterator it =
      _remotes.find (remotes_t::key_type (connection_, msg_.correlation_id ()));
    if (it == _remotes.end ())
        return;
    const uint64_t handle = it->second;
    _remotes.erase (it);
    if (_router.unsubscribe (handle) != 0)
        QLINK_DBG_NODE ("peer subscription %llu already dropped",
                        static_cast<unsigned long long> (handle));
}

void qlink::node_t::deliver_publish (connection_id_t connection_,
                                     const msg_t &msg_)
{
    //  Publishes for topics without a local subscription were routed here
    //  by the publisher itself and always pass.
    bool subscribed = false;
    bool accepted = false;
    for (locals_t::iterator it = _locals.begin (); it != _locals.end ();
         ++it) {
        if (it->second.topic != msg_.topic ())
            continue;
        subscribed = true;
        if (!it->second.filter
            || it->second.filter (msg_.topic (), msg_.body ())) {
            accepted = true;
            break;
        }
    }
    if (subscribed && !accepted)
        return;

    event_t event;
    event.event = QLINK_EVENT_MESSAGE_RECEIVED;
    event.connection = connection_;
    event.message_type = QLINK_MSG_PUBLISH;
    event.topic = msg_.topic ();
    event.data = msg_.body ();
    emit (event);
}

void qlink::node_t::complete_request (const msg_t &msg_)
{
    scoped_lock_t lock (_sync);
    const requests_t::iterator it = _requests.find (msg_.correlation_id ());
    if (it == _requests.end () || it->second->done) {
        QLINK_DBG_NODE ("late reply %llu dropped",
                        static_cast<unsigned long long> (
                          msg_.correlation_id ()));
        return;
    }
    it->second->done = true;
    it->second->reply = msg_.body ();
    _request_cond.broadcast ();
}

void qlink::node_t::fail_requests (connection_id_t connection_, int error_)
{
    scoped_lock_t lock (_sync);
    for (requests_t::iterator it = _requests.begin (); it != _requests.end ();
         ++it) {
        if (it->second->connection == connection_ && !it->second->done) {
            it->second->done = true;
            it->second->error = error_;
        }
    }
    _request_cond.broadcast ();
}

void qlink::node_t::emit (const event_t &event_)
{
    i_event_handler *handler;
    {
        scoped_lock_t lock (_sync);
        if (!(_options.events & event_.event))
            return;
        handler = _handler;
        if (!handler) {
            _inbox.push_back (event_);
            _inbox_cond.broadcast ();
            return;
        }
    }
    handler->on_event (event_);
}
