/* SPDX-License-Identifier: MPL-2.0 */

#include "session/connection_manager.hpp"
#include "core/ctx.hpp"
#include "core/io_thread.hpp"
#include "transports/address.hpp"
#include "transports/inproc/inproc_mux.hpp"
#include "transports/tcp/tcp_mux.hpp"
#include "transports/tls/tls_context.hpp"
#include "utils/clock.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

qlink::connection_manager_t::connection_manager_t (io_thread_t *io_thread_,
                                                   ctx_t *ctx_,
                                                   i_manager_events *events_) :
    _io_thread (io_thread_),
    _ctx (ctx_),
    _events (events_),
    _next_id (1),
    _terminated (false)
{
}

qlink::connection_manager_t::~connection_manager_t ()
{
    //  Runs after the I/O thread stopped.
    for (connections_t::iterator it = _connections.begin ();
         it != _connections.end (); ++it) {
        it->second->close ();
        delete it->second;
    }
    _connections.clear ();
}

void qlink::connection_manager_t::set_options (const options_t &options_)
{
    _options = options_;
    _tls_client.reset ();
}

int qlink::connection_manager_t::tls_client_context (
  tls_context_ptr_t *context_)
{
    if (!_tls_client && create_tls_client_context (_options, &_tls_client) != 0)
        return -1;
    *context_ = _tls_client;
    return 0;
}

int qlink::connection_manager_t::connect (const std::string &endpoint_,
                                          const connect_handler_t &handler_)
{
    if (_terminated) {
        errno = QLINK_ETERM;
        return -1;
    }

    address_t address;
    if (address.parse (endpoint_) != 0)
        return -1;
    if (address.is_stream ()) {
        std::string host, port;
        if (address.host_port (&host, &port) != 0)
            return -1;
    }
    if (address.protocol == protocol_name::tls) {
        tls_context_ptr_t context;
        if (tls_client_context (&context) != 0)
            return -1;
    }

    const connection_id_t id = _next_id++;
    connection_t *connection = new (std::nothrow)
      connection_t (_io_thread, _options, this, id, true, endpoint_);
    alloc_assert (connection);
    _connections.insert (connections_t::value_type (id, connection));
    _pending.insert (pending_t::value_type (id, handler_));

    QLINK_DBG_MANAGER ("connecting %llu to %s",
                       static_cast<unsigned long long> (id),
                       endpoint_.c_str ());
    start_attempt (connection);
    return 0;
}

int qlink::connection_manager_t::listen (const std::string &endpoint_,
                                         std::string *bound_)
{
    if (_terminated) {
        errno = QLINK_ETERM;
        return -1;
    }

    address_t address;
    if (address.parse (endpoint_) != 0)
        return -1;

    const accept_handler_t handler =
      [this] (const mux_connection_ptr_t &transport_) {
          accepted (transport_);
      };

    mux_listener_ptr_t listener;
    if (address.protocol == protocol_name::inproc) {
        if (inproc_listener_t::listen (_ctx, _io_thread->get_io_context (),
                                       address.address, handler, &listener)
            != 0)
            return -1;
    } else {
        std::string host, port;
        if (address.host_port (&host, &port) != 0)
            return -1;
        tls_context_ptr_t context;
        if (address.protocol == protocol_name::tls
            && create_tls_server_context (_options, &context) != 0)
            return -1;
        if (tcp_listener_t::listen (_io_thread->get_io_context (), host, port,
                                    context, _options.handshake_ivl, handler,
                                    &listener)
            != 0)
            return -1;
    }

    _listeners.push_back (listener);
    if (bound_)
        *bound_ = listener->local_address ();
    return 0;
}

int qlink::connection_manager_t::accept (connection_id_t *id_)
{
    if (_accepted.empty ()) {
        errno = EAGAIN;
        return -1;
    }
    *id_ = _accepted.front ();
    _accepted.pop_front ();
    return 0;
}

int qlink::connection_manager_t::open_stream (connection_id_t id_,
                                              stream_id_t *stream_)
{
    connection_t *connection = find (id_);
    if (!connection) {
        errno = ENOTCONN;
        return -1;
    }
    return connection->open_stream (stream_);
}

int qlink::connection_manager_t::send (connection_id_t id_,
                                       uint64_t op_,
                                       const msg_t &msg_,
                                       const send_completion_t &done_)
{
    connection_t *connection = find (id_);
    if (!connection) {
        errno = ENOTCONN;
        return -1;
    }
    return connection->send (op_, msg_, done_);
}

int qlink::connection_manager_t::cancel (connection_id_t id_, uint64_t op_)
{
    connection_t *connection = find (id_);
    if (!connection) {
        errno = ENOTCONN;
        return -1;
    }
    return connection->cancel (op_);
}

int qlink::connection_manager_t::close (connection_id_t id_)
{
    connection_t *connection = find (id_);
    if (!connection) {
        errno = ENOTCONN;
        return -1;
    }

    const bool was_up = connection->health () == connection_t::live
                        || connection->health () == connection_t::degraded;
    const pending_t::iterator pit = _pending.find (id_);
    if (pit != _pending.end ()) {
        const connect_handler_t handler = pit->second;
        _pending.erase (pit);
        handler (QLINK_ECANCELED, 0);
    }
    retire (connection);
    if (was_up)
        _events->connection_down (id_, 0);
    return 0;
}

int qlink::connection_manager_t::health (connection_id_t id_, int *health_)
{
    connection_t *connection = find (id_);
    if (!connection) {
        errno = ENOTCONN;
        return -1;
    }
    *health_ = connection->health ();
    return 0;
}

void qlink::connection_manager_t::live_connections (
  std::vector<connection_id_t> *ids_) const
{
    for (connections_t::const_iterator it = _connections.begin ();
         it != _connections.end (); ++it) {
        const connection_t::health_t health = it->second->health ();
        if (health == connection_t::live || health == connection_t::degraded)
            ids_->push_back (it->first);
    }
}

void qlink::connection_manager_t::terminate ()
{
    if (_terminated)
        return;
    _terminated = true;

    for (std::vector<mux_listener_ptr_t>::iterator it = _listeners.begin ();
         it != _listeners.end (); ++it)
        (*it)->close ();
    _listeners.clear ();

    pending_t pending;
    pending.swap (_pending);
    for (pending_t::iterator it = pending.begin (); it != pending.end (); ++it)
        it->second (QLINK_ETERM, 0);

    while (!_connections.empty ())
        retire (_connections.begin ()->second);
    _accepted.clear ();
}

void qlink::connection_manager_t::connection_live (connection_t *connection_)
{
    const connection_id_t id = connection_->id ();
    connection_->backoff ().reset (clock_t::now_ms ());

    const pending_t::iterator it = _pending.find (id);
    if (it != _pending.end ()) {
        const connect_handler_t handler = it->second;
        _pending.erase (it);
        handler (0, id);
    }
    if (!connection_->initiator ())
        _accepted.push_back (id);

    _events->connection_up (id, connection_->identity (),
                            connection_->address (),
                            connection_->initiator ());
}

void qlink::connection_manager_t::connection_degraded (
  connection_t *connection_, bool degraded_)
{
    _events->connection_degraded (connection_->id (), degraded_);
}

void qlink::connection_manager_t::connection_failed (connection_t *connection_,
                                                     int reason_,
                                                     bool was_up_)
{
    const connection_id_t id = connection_->id ();
    QLINK_DBG_MANAGER ("connection %llu failed: %s",
                       static_cast<unsigned long long> (id),
                       errno_to_string (reason_));

    if (was_up_) {
        _events->connection_down (id, reason_);
        //  The handler may have closed the connection.
        if (find (id) != connection_)
            return;
    }

    const pending_t::iterator it = _pending.find (id);
    if (it != _pending.end ()) {
        const connect_handler_t handler = it->second;
        _pending.erase (it);
        retire (connection_);
        handler (QLINK_ECONNECTION, 0);
        return;
    }

    if (!connection_->initiator () || !connection_->ever_live ()
        || _terminated) {
        retire (connection_);
        return;
    }

    //  A session that was up starts a new reconnection episode; a failed
    //  reconnect attempt continues the current one.
    if (was_up_)
        connection_->backoff ().reset (clock_t::now_ms ());
    schedule_reconnect (connection_);
}

void qlink::connection_manager_t::connection_message (connection_t *connection_,
                                                      const msg_t &msg_)
{
    _events->message_received (connection_->id (), msg_);
}

void qlink::connection_manager_t::connection_malformed (
  connection_t *connection_, stream_id_t stream_)
{
    _events->stream_malformed (connection_->id (), stream_);
}

void qlink::connection_manager_t::connection_reconnect (
  connection_t *connection_)
{
    if (_terminated)
        return;
    start_attempt (connection_);
}

qlink::connection_t *
qlink::connection_manager_t::find (connection_id_t id_) const
{
    const connections_t::const_iterator it = _connections.find (id_);
    return it == _connections.end () ? NULL : it->second;
}

void qlink::connection_manager_t::start_attempt (connection_t *connection_)
{
    connection_->begin_attempt ();

    address_t address;
    const int rc = address.parse (connection_->address ());
    errno_assert (rc == 0);

    const connection_id_t id = connection_->id ();
    const uint64_t attempt = connection_->attempt ();
    const qlink::connect_handler_t handler =
      [this, id, attempt] (const boost::system::error_code &ec_,
                           const mux_connection_ptr_t &transport_) {
          transport_connected (id, attempt, ec_, transport_);
      };

    if (address.protocol == protocol_name::inproc)
        inproc_mux_t::connect (_ctx, _io_thread->get_io_context (),
                               address.address, handler);
    else {
        std::string host, port;
        const int hp_rc = address.host_port (&host, &port);
        errno_assert (hp_rc == 0);
        tls_context_ptr_t context;
        if (address.protocol == protocol_name::tls
            && tls_client_context (&context) != 0) {
            const boost::system::error_code ec =
              boost::asio::error::make_error_code (
                boost::asio::error::no_protocol_option);
            QLINK_DBG_MANAGER ("tls context: %s", tls_error_string ().c_str ());
            boost::asio::post (_io_thread->get_io_context (),
                               [handler, ec] () {
                                   handler (ec, mux_connection_ptr_t ());
                               });
            return;
        }
        tcp_mux_t::connect (_io_thread->get_io_context (), host, port,
                            context, _options.tls_hostname, handler);
    }
}

void qlink::connection_manager_t::transport_connected (
  connection_id_t id_,
  uint64_t attempt_,
  const boost::system::error_code &ec_,
  const mux_connection_ptr_t &transport_)
{
    connection_t *connection = find (id_);
    if (!connection || connection->attempt () != attempt_
        || connection->health () != connection_t::connecting) {
        //  The attempt was abandoned meanwhile.
        if (transport_)
            transport_->close ();
        return;
    }

    if (ec_) {
        QLINK_DBG_MANAGER ("connect %llu failed: %s",
                           static_cast<unsigned long long> (id_),
                           ec_.message ().c_str ());
        connection->attempt_failed (QLINK_ECONNECTION);
        return;
    }
    connection->attach (transport_);
}

void qlink::connection_manager_t::accepted (
  const mux_connection_ptr_t &transport_)
{
    if (_terminated) {
        transport_->close ();
        return;
    }

    const connection_id_t id = _next_id++;
    connection_t *connection = new (std::nothrow) connection_t (
      _io_thread, _options, this, id, false, transport_->remote_address ());
    alloc_assert (connection);
    _connections.insert (connections_t::value_type (id, connection));

    QLINK_DBG_MANAGER ("accepted %llu from %s",
                       static_cast<unsigned long long> (id),
                       connection->address ().c_str ());
    connection->begin_attempt ();
    connection->attach (transport_);
}

void qlink::connection_manager_t::schedule_reconnect (
  connection_t *connection_)
{
    reconnect_backoff_t &backoff = connection_->backoff ();
    const int ivl = backoff.next (clock_t::now_ms ());
    const connection_id_t id = connection_->id ();

    if (ivl < 0) {
        QLINK_DBG_MANAGER ("connection %llu unreachable after %d attempts",
                           static_cast<unsigned long long> (id),
                           backoff.attempts ());
        retire (connection_);
        _events->connection_unreachable (id);
        return;
    }

    connection_->schedule_reconnect (ivl);
    _events->connection_reconnecting (id, backoff.attempts (), ivl);
}

void qlink::connection_manager_t::retire (connection_t *connection_)
{
    const connection_id_t id = connection_->id ();
    _connections.erase (id);
    for (std::deque<connection_id_t>::iterator it = _accepted.begin ();
         it != _accepted.end (); ++it) {
        if (*it == id) {
            _accepted.erase (it);
            break;
        }
    }
    connection_->close ();
    _io_thread->retire (connection_);
}
