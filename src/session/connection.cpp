/* SPDX-License-Identifier: MPL-2.0 */

#include "session/connection.hpp"
#include "core/io_thread.hpp"
#include "core/options.hpp"
#include "protocol/chunk_codec.hpp"
#include "protocol/heartbeat.hpp"
#include "protocol/stream_reassembler.hpp"
#include "utils/clock.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <boost/asio/post.hpp>

#include <climits>

qlink::connection_t::connection_t (io_thread_t *io_thread_,
                                   const options_t &options_,
                                   i_connection_events *events_,
                                   connection_id_t id_,
                                   bool initiator_,
                                   const std::string &address_) :
    io_object_t (io_thread_),
    _options (options_),
    _events (events_),
    _id (id_),
    _initiator (initiator_),
    _address (address_),
    _health (connecting),
    _ever_live (false),
    _closed (false),
    _session (0),
    _attempt (0),
    _control (0),
    _awaiting_ack (false),
    _recv_since_ping (false),
    _missed (0),
    _last_ack_ms (0),
    _last_recv_ms (0),
    _backoff (options_)
{
}

qlink::connection_t::~connection_t ()
{
    cancel_timers ();
    teardown (ECONNABORTED);
}

void qlink::connection_t::begin_attempt ()
{
    qlink_assert (!_transport);
    _attempt++;
    _health = connecting;
    add_timer (_options.handshake_ivl, handshake_timer_id);
}

void qlink::connection_t::attach (const mux_connection_ptr_t &transport_)
{
    qlink_assert (_health == connecting && !_transport);
    _transport = transport_;
    _session++;

    //  Hello goes out before events start so it precedes anything we send
    //  in reaction to the peer.
    _control = _transport->open_stream ();
    send_hello ();
    _transport->start (this);
}

void qlink::connection_t::attempt_failed (int reason_)
{
    if (_health != connecting || _closed)
        return;
    fail (reason_);
}

int qlink::connection_t::open_stream (stream_id_t *stream_)
{
    if (!_transport) {
        errno = ENOTCONN;
        return -1;
    }
    if (_streams.size () >= static_cast<size_t> (_options.max_streams)) {
        errno = QLINK_ESTREAMLIMIT;
        return -1;
    }
    const stream_id_t stream = _transport->open_stream ();
    _streams.insert (streams_t::value_type (stream, false));
    *stream_ = stream;
    return 0;
}

int qlink::connection_t::send (uint64_t op_,
                               const msg_t &msg_,
                               const send_completion_t &done_)
{
    if (_health != live && _health != degraded) {
        errno = ENOTCONN;
        return -1;
    }

    std::vector<unsigned char> encoded;
    msg_.encode (&encoded);
    std::vector<chunk_t> chunks;
    int rc = encode_message (encoded.empty () ? NULL : &encoded[0],
                             encoded.size (), _options.max_chunk_size,
                             message_id_t::generate (), &chunks);
    if (rc != 0)
        return -1;

    send_op_t *op = new (std::nothrow) send_op_t ();
    alloc_assert (op);
    op->id = op_;
    op->done = done_;
    op->stream = 0;
    op->pending = 0;
    op->error = 0;
    op->chunks.reserve (chunks.size ());
    for (size_t i = 0; i < chunks.size (); i++) {
        std::shared_ptr<std::vector<unsigned char> > buffer =
          std::make_shared<std::vector<unsigned char> > ();
        encode_chunk (chunks[i], buffer.get ());
        op->chunks.push_back (buffer);
    }

    stream_id_t stream;
    if (_queued.empty () && acquire_stream (&stream)) {
        op->stream = stream;
        start_op (op);
    } else {
        QLINK_DBG_CONN ("send %llu queued, streams busy",
                        static_cast<unsigned long long> (op_));
        _queued.push_back (op);
    }
    return 0;
}

int qlink::connection_t::cancel (uint64_t op_)
{
    for (std::deque<send_op_t *>::iterator it = _queued.begin ();
         it != _queued.end (); ++it) {
        if ((*it)->id == op_) {
            send_op_t *op = *it;
            _queued.erase (it);
            complete_op (op, QLINK_ECANCELED);
            return 0;
        }
    }

    const active_t::iterator it = _active.find (op_);
    if (it == _active.end ()) {
        errno = ENOENT;
        return -1;
    }

    //  Unflushed chunks are dropped and the peer discards the partial
    //  message. The stream is not reused.
    send_op_t *op = it->second;
    _active.erase (it);
    _streams.erase (op->stream);
    if (_transport)
        _transport->reset_stream (op->stream);
    complete_op (op, QLINK_ECANCELED);
    pump ();
    return 0;
}

void qlink::connection_t::close ()
{
    if (_closed)
        return;
    _closed = true;
    cancel_timers ();
    teardown (ECONNABORTED);
    _health = dead;
}

void qlink::connection_t::schedule_reconnect (int ivl_)
{
    add_timer (ivl_, reconnect_timer_id);
}

void qlink::connection_t::stream_data (stream_id_t stream_,
                                       const unsigned char *data_,
                                       size_t size_)
{
    _recv_since_ping = true;
    if (_options.heartbeat_data_liveness)
        _last_recv_ms = clock_t::now_ms ();

    //  Our own streams only carry data towards the peer.
    if (stream_ == _control || _streams.count (stream_)) {
        QLINK_DBG_STREAM ("data on local stream %u ignored", stream_);
        return;
    }

    inbound_t::iterator it = _inbound.find (stream_);
    if (it == _inbound.end ()) {
        //  The peer gets its control stream plus max_streams data streams.
        if (_inbound.size () > static_cast<size_t> (_options.max_streams)) {
            QLINK_DBG_STREAM ("peer stream %u over the limit, resetting",
                              stream_);
            if (_transport)
                _transport->reset_stream (stream_);
            return;
        }
        stream_reassembler_t *reassembler = new (std::nothrow)
          stream_reassembler_t (static_cast<size_t> (_options.max_chunk_size));
        alloc_assert (reassembler);
        it = _inbound.insert (inbound_t::value_type (stream_, reassembler))
               .first;
    }

    const uint64_t session = _session;
    size_t offset = 0;
    while (offset < size_) {
        stream_reassembler_t *reassembler = it->second;
        size_t processed = 0;
        const int rc =
          reassembler->decode (data_ + offset, size_ - offset, &processed);
        offset += processed;
        if (rc == -1) {
            poison (stream_);
            return;
        }
        if (rc == 0)
            break;

        message_id_t id;
        std::string payload;
        const int take_rc = reassembler->take (&id, &payload);
        errno_assert (take_rc == 0);
        process_message (stream_, id, payload);

        //  Handling the message may have torn down the session or the
        //  stream.
        if (_session != session)
            return;
        it = _inbound.find (stream_);
        if (it == _inbound.end ())
            return;
    }
}

void qlink::connection_t::stream_reset (stream_id_t stream_)
{
    const streams_t::iterator sit = _streams.find (stream_);
    if (sit != _streams.end ()) {
        //  The peer refused one of our streams.
        _streams.erase (sit);
        for (active_t::iterator it = _active.begin (); it != _active.end ();
             ++it) {
            if (it->second->stream == stream_) {
                send_op_t *op = it->second;
                _active.erase (it);
                complete_op (op, ECONNRESET);
                break;
            }
        }
        pump ();
        return;
    }

    const inbound_t::iterator it = _inbound.find (stream_);
    if (it != _inbound.end ()) {
        QLINK_DBG_STREAM ("stream %u reset by peer, partial data dropped",
                          stream_);
        delete it->second;
        _inbound.erase (it);
    }
}

void qlink::connection_t::connection_lost (const boost::system::error_code &ec_)
{
    QLINK_DBG_CONN ("transport lost: %s", ec_.message ().c_str ());
    LIBQLINK_UNUSED (ec_);
    _transport.reset ();
    fail (ECONNRESET);
}

void qlink::connection_t::timer_event (int id_)
{
    switch (id_) {
        case handshake_timer_id:
            QLINK_DBG_CONN ("handshake timed out");
            fail (QLINK_ECONNECTION);
            break;

        case heartbeat_ivl_timer_id:
            send_ping ();
            break;

        case heartbeat_timeout_timer_id:
            if (_options.heartbeat_data_liveness && _recv_since_ping)
                heartbeat_ack ();
            else
                heartbeat_missed ();
            break;

        case heartbeat_deadline_timer_id:
            heartbeat_deadline ();
            break;

        case reconnect_timer_id:
            _events->connection_reconnect (this);
            break;

        default:
            qlink_assert (false);
    }
}

void qlink::connection_t::send_hello ()
{
    const msg_t hello (QLINK_MSG_HELLO, 0, std::string (),
                       _options.identity.data (), _options.identity.size ());
    std::vector<unsigned char> encoded;
    hello.encode (&encoded);

    std::vector<chunk_t> chunks;
    const int rc =
      encode_message (&encoded[0], encoded.size (), _options.max_chunk_size,
                      message_id_t::generate (), &chunks);
    errno_assert (rc == 0);
    for (size_t i = 0; i < chunks.size (); i++)
        write_control (chunks[i]);
}

void qlink::connection_t::handshake_done (const std::string &identity_)
{
    cancel_timer (handshake_timer_id);
    _identity = identity_;
    _health = live;
    _ever_live = true;
    _missed = 0;
    _awaiting_ack = false;
    _last_ack_ms = clock_t::now_ms ();
    _last_recv_ms = _last_ack_ms;

    QLINK_DBG_CONN ("connection %llu live, peer identity '%s'",
                    static_cast<unsigned long long> (_id), _identity.c_str ());
    if (_options.heartbeat_ivl > 0) {
        add_timer (_options.heartbeat_ivl, heartbeat_ivl_timer_id);
        add_timer (dead_after (), heartbeat_deadline_timer_id);
    }
    _events->connection_live (this);
}

void qlink::connection_t::write_control (const chunk_t &chunk_)
{
    if (!_transport)
        return;
    std::shared_ptr<std::vector<unsigned char> > buffer =
      std::make_shared<std::vector<unsigned char> > ();
    encode_chunk (chunk_, buffer.get ());

    const liveness_t token = liveness ();
    _transport->async_write (
      _control, buffer,
      [token] (const boost::system::error_code &ec_, std::size_t) {
          //  Control writes only fail with the transport, which reports
          //  the loss itself.
          if (ec_ && resolve (token))
              QLINK_GLOBAL_WARN ("control write failed: %s",
                                 ec_.message ().c_str ());
      });
}

void qlink::connection_t::send_ping ()
{
    write_control (make_heartbeat_ping ());

    //  Only the oldest unanswered ping is timed.
    if (!_awaiting_ack) {
        _awaiting_ack = true;
        _recv_since_ping = false;
        add_timer (_options.effective_heartbeat_timeout (),
                   heartbeat_timeout_timer_id);
    }
    add_timer (_options.heartbeat_ivl, heartbeat_ivl_timer_id);
}

void qlink::connection_t::heartbeat_ack ()
{
    if (_health != live && _health != degraded)
        return;
    if (_awaiting_ack) {
        _awaiting_ack = false;
        cancel_timer (heartbeat_timeout_timer_id);
    }
    _last_ack_ms = clock_t::now_ms ();
    _missed = 0;
    add_timer (dead_after (), heartbeat_deadline_timer_id);

    if (_health == degraded) {
        QLINK_DBG_CONN ("connection %llu restored",
                        static_cast<unsigned long long> (_id));
        _health = live;
        _events->connection_degraded (this, false);
    }
}

void qlink::connection_t::heartbeat_missed ()
{
    _awaiting_ack = false;
    _missed++;
    QLINK_DBG_CONN ("heartbeat missed %d", _missed);

    if (_health == live) {
        _health = degraded;
        _events->connection_degraded (this, true);
    }
}

void qlink::connection_t::heartbeat_deadline ()
{
    uint64_t last = _last_ack_ms;
    if (_options.heartbeat_data_liveness && _last_recv_ms > last)
        last = _last_recv_ms;

    const uint64_t now = clock_t::now_ms ();
    const uint64_t limit = static_cast<uint64_t> (dead_after ());
    if (now - last < limit) {
        add_timer (static_cast<int> (limit - (now - last)),
                   heartbeat_deadline_timer_id);
        return;
    }

    //  Dead is always preceded by degraded.
    if (_health == live) {
        _health = degraded;
        _events->connection_degraded (this, true);
        if (_health != degraded)
            return;
    }
    fail (QLINK_EHEARTBEAT);
}

int qlink::connection_t::dead_after () const
{
    const int64_t limit = static_cast<int64_t> (_options.heartbeat_ivl)
                          * _options.heartbeat_missed;
    return limit > INT_MAX ? INT_MAX : static_cast<int> (limit);
}

void qlink::connection_t::process_message (stream_id_t stream_,
                                           const message_id_t &id_,
                                           const std::string &payload_)
{
    if (id_.is_zero ()) {
        if (is_heartbeat_ping (id_, payload_))
            write_control (make_heartbeat_pong ());
        else if (is_heartbeat_pong (id_, payload_))
            heartbeat_ack ();
        else
            poison (stream_);
        return;
    }

    msg_t msg;
    if (msg_t::decode (reinterpret_cast<const unsigned char *> (payload_.data ()),
                       payload_.size (), &msg)
        != 0) {
        poison (stream_);
        return;
    }

    if (msg.type () == QLINK_MSG_HELLO) {
        if (_health == connecting)
            handshake_done (msg.body ());
        return;
    }
    if (_health != live && _health != degraded) {
        QLINK_DBG_CONN ("message before handshake dropped");
        return;
    }
    _events->connection_message (this, msg);
}

void qlink::connection_t::poison (stream_id_t stream_)
{
    QLINK_DBG_STREAM ("malformed chunk on stream %u, resetting", stream_);
    const inbound_t::iterator it = _inbound.find (stream_);
    if (it != _inbound.end ()) {
        delete it->second;
        _inbound.erase (it);
    }
    if (_transport)
        _transport->reset_stream (stream_);
    _events->connection_malformed (this, stream_);
}

bool qlink::connection_t::acquire_stream (stream_id_t *stream_)
{
    for (streams_t::iterator it = _streams.begin (); it != _streams.end ();
         ++it) {
        if (!it->second) {
            it->second = true;
            *stream_ = it->first;
            return true;
        }
    }
    stream_id_t stream;
    if (open_stream (&stream) != 0)
        return false;
    _streams[stream] = true;
    *stream_ = stream;
    return true;
}

void qlink::connection_t::start_op (send_op_t *op_)
{
    _active.insert (active_t::value_type (op_->id, op_));
    op_->pending = op_->chunks.size ();

    const liveness_t token = liveness ();
    const uint64_t session = _session;
    const uint64_t op_id = op_->id;
    for (size_t i = 0; i < op_->chunks.size (); i++) {
        _transport->async_write (
          op_->stream, op_->chunks[i],
          [token, session, op_id] (const boost::system::error_code &ec_,
                                   std::size_t) {
              connection_t *self = static_cast<connection_t *> (resolve (token));
              if (self)
                  self->write_done (session, op_id, ec_);
          });
    }
}

void qlink::connection_t::write_done (uint64_t session_,
                                      uint64_t op_,
                                      const boost::system::error_code &ec_)
{
    if (session_ != _session)
        return;
    const active_t::iterator it = _active.find (op_);
    if (it == _active.end ())
        return;

    send_op_t *op = it->second;
    if (ec_ && op->error == 0)
        op->error = ECONNABORTED;
    if (--op->pending > 0)
        return;

    _active.erase (it);
    const streams_t::iterator sit = _streams.find (op->stream);
    if (sit != _streams.end ())
        sit->second = false;
    complete_op (op, op->error);
    pump ();
}

void qlink::connection_t::complete_op (send_op_t *op_, int error_)
{
    //  Completions run from the loop, never from inside our own call
    //  stack.
    const send_completion_t done = op_->done;
    delete op_;
    if (done)
        boost::asio::post (get_io_thread ()->get_io_context (),
                           [done, error_] () { done (error_); });
}

void qlink::connection_t::pump ()
{
    while (!_queued.empty () && _transport) {
        stream_id_t stream;
        if (!acquire_stream (&stream))
            return;
        send_op_t *op = _queued.front ();
        _queued.pop_front ();
        op->stream = stream;
        start_op (op);
    }
}

void qlink::connection_t::teardown (int error_)
{
    cancel_timer (handshake_timer_id);
    cancel_timer (heartbeat_ivl_timer_id);
    cancel_timer (heartbeat_timeout_timer_id);
    cancel_timer (heartbeat_deadline_timer_id);
    _session++;

    if (_transport) {
        _transport->close ();
        _transport.reset ();
    }

    //  Buffered and unsent chunks are lost here.
    for (active_t::iterator it = _active.begin (); it != _active.end (); ++it)
        complete_op (it->second, error_);
    _active.clear ();
    while (!_queued.empty ()) {
        complete_op (_queued.front (), error_);
        _queued.pop_front ();
    }

    _streams.clear ();
    for (inbound_t::iterator it = _inbound.begin (); it != _inbound.end ();
         ++it)
        delete it->second;
    _inbound.clear ();

    _control = 0;
    _awaiting_ack = false;
    _recv_since_ping = false;
    _missed = 0;
}

void qlink::connection_t::fail (int reason_)
{
    if (_closed)
        return;
    const bool was_up = _health == live || _health == degraded;
    teardown (ECONNABORTED);
    _health = dead;
    QLINK_DBG_CONN ("connection %llu dead: %s",
                    static_cast<unsigned long long> (_id),
                    errno_to_string (reason_));
    _events->connection_failed (this, reason_, was_up);
}
