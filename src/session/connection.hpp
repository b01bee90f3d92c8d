/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_CONNECTION_HPP_INCLUDED__
#define __QLINK_CONNECTION_HPP_INCLUDED__

#include "core/io_object.hpp"
#include "core/msg.hpp"
#include "protocol/chunk.hpp"
#include "session/reconnect_backoff.hpp"
#include "transports/i_mux_transport.hpp"
#include "utils/macros.hpp"
#include "qlink.h"

#include <deque>
#include <functional>
#include <map>
#include <string>

namespace qlink
{
class connection_t;
class stream_reassembler_t;
struct options_t;

typedef uint64_t connection_id_t;

//  Completion of a send operation: 0 once every chunk was handed to the
//  transport, otherwise the errno describing why it was not.
typedef std::function<void (int)> send_completion_t;

//  Notifications from a connection to its manager.
struct i_connection_events
{
    virtual ~i_connection_events () {}

    //  Handshake completed.
    virtual void connection_live (connection_t *connection_) = 0;

    virtual void connection_degraded (connection_t *connection_,
                                      bool degraded_) = 0;

    //  The connection was torn down. was_up_ tells whether it had been
    //  live or degraded, i.e. whether this ends an established session.
    virtual void
    connection_failed (connection_t *connection_, int reason_, bool was_up_) = 0;

    virtual void connection_message (connection_t *connection_,
                                     const msg_t &msg_) = 0;

    //  An inbound stream was poisoned and reset.
    virtual void connection_malformed (connection_t *connection_,
                                       stream_id_t stream_) = 0;

    //  The reconnect timer fired.
    virtual void connection_reconnect (connection_t *connection_) = 0;
};

//  State of one peer connection. Owns the transport, the outbound stream
//  pool, one reassembler per inbound stream and the keep-alive protocol.
//  Lives on the manager's I/O thread and is only touched there.

class connection_t QLINK_FINAL : public io_object_t, public i_mux_events
{
  public:
    enum health_t
    {
        connecting = QLINK_STATE_CONNECTING,
        live = QLINK_STATE_LIVE,
        degraded = QLINK_STATE_DEGRADED,
        dead = QLINK_STATE_DEAD
    };

    connection_t (io_thread_t *io_thread_,
                  const options_t &options_,
                  i_connection_events *events_,
                  connection_id_t id_,
                  bool initiator_,
                  const std::string &address_);
    ~connection_t () QLINK_OVERRIDE;

    connection_id_t id () const { return _id; }
    bool initiator () const { return _initiator; }
    const std::string &address () const { return _address; }
    const std::string &identity () const { return _identity; }
    health_t health () const { return _health; }
    bool ever_live () const { return _ever_live; }
    uint64_t attempt () const { return _attempt; }
    reconnect_backoff_t &backoff () { return _backoff; }

    //  Starts a connection attempt: state connecting, handshake timer
    //  armed. The timer also bounds the transport connect.
    void begin_attempt ();

    //  Takes over a connected transport and sends hello.
    void attach (const mux_connection_ptr_t &transport_);

    //  The transport could not be established.
    void attempt_failed (int reason_);

    //  Opens an idle outbound stream for later sends. Returns -1 with errno
    //  QLINK_ESTREAMLIMIT at the cap and ENOTCONN without a transport.
    int open_stream (stream_id_t *stream_);

    //  Chunks msg_ onto one stream. Waits for a free stream when all are
    //  busy and the cap is reached. Returns -1 with errno ENOTCONN unless
    //  live or degraded; otherwise done_ reports the outcome later.
    int send (uint64_t op_, const msg_t &msg_, const send_completion_t &done_);

    //  Cancels a pending or writing send; its completion reports
    //  QLINK_ECANCELED. Returns -1 with errno ENOENT if op_ is unknown or
    //  already complete.
    int cancel (uint64_t op_);

    //  Explicit close. Pending sends fail with ECONNABORTED, no event is
    //  raised and the connection never reconnects.
    void close ();

    void schedule_reconnect (int ivl_);

    //  i_mux_events implementation
    void stream_data (stream_id_t stream_,
                      const unsigned char *data_,
                      size_t size_) QLINK_OVERRIDE;
    void stream_reset (stream_id_t stream_) QLINK_OVERRIDE;
    void connection_lost (const boost::system::error_code &ec_) QLINK_OVERRIDE;

  private:
    enum
    {
        handshake_timer_id = 0x40,
        heartbeat_ivl_timer_id = 0x80,
        heartbeat_timeout_timer_id = 0x81,
        reconnect_timer_id = 0x82,
        heartbeat_deadline_timer_id = 0x83
    };

    struct send_op_t
    {
        uint64_t id;
        std::vector<buffer_ptr_t> chunks;
        send_completion_t done;
        stream_id_t stream;
        size_t pending;
        int error;
    };

    //  io_object_t implementation
    void timer_event (int id_) QLINK_OVERRIDE;

    void send_hello ();
    void handshake_done (const std::string &identity_);
    void write_control (const chunk_t &chunk_);

    void send_ping ();
    void heartbeat_ack ();
    void heartbeat_missed ();
    void heartbeat_deadline ();
    int dead_after () const;

    void process_message (stream_id_t stream_,
                          const message_id_t &id_,
                          const std::string &payload_);
    void poison (stream_id_t stream_);

    bool acquire_stream (stream_id_t *stream_);
    void start_op (send_op_t *op_);
    void write_done (uint64_t session_,
                     uint64_t op_,
                     const boost::system::error_code &ec_);
    void complete_op (send_op_t *op_, int error_);
    void pump ();

    void teardown (int error_);
    void fail (int reason_);

    const options_t &_options;
    i_connection_events *const _events;
    const connection_id_t _id;
    const bool _initiator;
    const std::string _address;

    std::string _identity;
    health_t _health;
    bool _ever_live;
    bool _closed;

    mux_connection_ptr_t _transport;

    //  Incremented per transport so stale completions are recognised.
    uint64_t _session;
    uint64_t _attempt;

    stream_id_t _control;

    //  Outbound streams opened by us; true while a send owns the stream.
    typedef std::map<stream_id_t, bool> streams_t;
    streams_t _streams;

    typedef std::map<stream_id_t, stream_reassembler_t *> inbound_t;
    inbound_t _inbound;

    typedef std::map<uint64_t, send_op_t *> active_t;
    active_t _active;
    std::deque<send_op_t *> _queued;

    //  Keep-alive bookkeeping. Pings go out every heartbeat_ivl whether
    //  or not the previous one was answered; the connection is dead once
    //  nothing proved the peer alive for heartbeat_missed intervals.
    bool _awaiting_ack;
    bool _recv_since_ping;
    int _missed;
    uint64_t _last_ack_ms;
    uint64_t _last_recv_ms;

    reconnect_backoff_t _backoff;

    QLINK_NON_COPYABLE_NOR_MOVABLE (connection_t)
};
}

#endif
