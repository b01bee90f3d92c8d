/* SPDX-License-Identifier: MPL-2.0 */

#include "core/io_thread.hpp"
#include "core/msg.hpp"
#include "core/options.hpp"
#include "protocol/chunk_codec.hpp"
#include "session/connection.hpp"
#include "qlink.h"

#include <unity.h>
#include <errno.h>
#include <string.h>
#include <time.h>

#include <boost/asio/post.hpp>

#include <memory>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static void msleep (int milliseconds_)
{
    struct timespec ts;
    ts.tv_sec = milliseconds_ / 1000;
    ts.tv_nsec = (milliseconds_ % 1000) * 1000000L;
    nanosleep (&ts, NULL);
}

//  Transport that hands every write over at once and never answers. The
//  test plays the peer by feeding stream events in directly. Only touched
//  on the I/O thread.
class silent_mux_t : public qlink::i_mux_connection
{
  public:
    explicit silent_mux_t (boost::asio::io_context &io_context_) :
        events (NULL),
        control_writes (0),
        _io_context (io_context_),
        _next_stream (1),
        _open (true)
    {
    }

    void start (qlink::i_mux_events *events_) { events = events_; }

    qlink::stream_id_t open_stream ()
    {
        const qlink::stream_id_t stream = _next_stream;
        _next_stream += 2;
        return stream;
    }

    void async_write (qlink::stream_id_t stream_,
                      const qlink::buffer_ptr_t &buffer_,
                      const completion_handler_t &handler_)
    {
        //  The first stream opened is the control stream.
        if (stream_ == 1)
            control_writes++;
        const std::size_t size = buffer_->size ();
        boost::asio::post (_io_context, [handler_, size] () {
            handler_ (boost::system::error_code (), size);
        });
    }

    void reset_stream (qlink::stream_id_t stream_)
    {
        resets.push_back (stream_);
    }

    void close () { _open = false; }
    bool is_open () const { return _open; }
    std::string remote_address () const { return "inproc://silent"; }

    qlink::i_mux_events *events;
    int control_writes;
    std::vector<qlink::stream_id_t> resets;

  private:
    boost::asio::io_context &_io_context;
    qlink::stream_id_t _next_stream;
    bool _open;
};

struct recorder_t : public qlink::i_connection_events
{
    recorder_t () : live (0), degraded (0), restored (0), failed (0), reason (0)
    {
    }

    void connection_live (qlink::connection_t *) { live++; }

    void connection_degraded (qlink::connection_t *, bool degraded_)
    {
        if (degraded_)
            degraded++;
        else
            restored++;
    }

    void connection_failed (qlink::connection_t *, int reason_, bool)
    {
        failed++;
        reason = reason_;
    }

    void connection_message (qlink::connection_t *, const qlink::msg_t &msg_)
    {
        bodies.push_back (msg_.body ());
    }

    void connection_malformed (qlink::connection_t *, qlink::stream_id_t stream_)
    {
        malformed.push_back (stream_);
    }

    void connection_reconnect (qlink::connection_t *) {}

    int live;
    int degraded;
    int restored;
    int failed;
    int reason;
    std::vector<std::string> bodies;
    std::vector<qlink::stream_id_t> malformed;
};

//  Copy of what the connection reported, taken on the I/O thread so the
//  assertions run on the test thread.
struct snapshot_t
{
    recorder_t events;
    int health;
    int control_writes;
    std::vector<qlink::stream_id_t> resets;
};

//  Wire bytes of msg_ as the peer would write them on a stream.
static std::vector<unsigned char> wire (const qlink::msg_t &msg_)
{
    std::vector<unsigned char> encoded;
    msg_.encode (&encoded);
    std::vector<qlink::chunk_t> chunks;
    TEST_ASSERT_EQUAL_INT (
      0, qlink::encode_message (&encoded[0], encoded.size (), 16384,
                                qlink::message_id_t::generate (), &chunks));
    std::vector<unsigned char> bytes;
    for (size_t i = 0; i < chunks.size (); i++)
        qlink::encode_chunk (chunks[i], &bytes);
    return bytes;
}

static std::vector<unsigned char> data_wire (const char *body_)
{
    return wire (
      qlink::msg_t (QLINK_MSG_DATA, 0, std::string (), body_, strlen (body_)));
}

//  A connection on its own I/O thread, attached to a silent_mux_t and past
//  the handshake.
struct harness_t
{
    explicit harness_t (const qlink::options_t &options_) :
        options (options_), connection (NULL)
    {
        thread.start ("connection");
        mux = std::make_shared<silent_mux_t> (thread.get_io_context ());
        thread.call ([this] () {
            connection = new (std::nothrow) qlink::connection_t (
              &thread, options, &events, 1, true, "inproc://silent");
            connection->begin_attempt ();
            connection->attach (mux);
        });
        const std::string identity = "peer";
        feed (2, wire (qlink::msg_t (QLINK_MSG_HELLO, 0, std::string (),
                                     identity.data (), identity.size ())));
        TEST_ASSERT_EQUAL_INT (1, snapshot ().events.live);
    }

    ~harness_t ()
    {
        thread.call ([this] () { delete connection; });
        thread.stop ();
    }

    void feed (qlink::stream_id_t stream_,
               const std::vector<unsigned char> &bytes_)
    {
        thread.call ([this, stream_, &bytes_] () {
            if (mux->events)
                mux->events->stream_data (stream_, &bytes_[0], bytes_.size ());
        });
    }

    void peer_reset (qlink::stream_id_t stream_)
    {
        thread.call ([this, stream_] () {
            if (mux->events)
                mux->events->stream_reset (stream_);
        });
    }

    snapshot_t snapshot ()
    {
        snapshot_t result;
        thread.call ([this, &result] () {
            result.events = events;
            result.health = connection->health ();
            result.control_writes = mux->control_writes;
            result.resets = mux->resets;
        });
        return result;
    }

    //  Runs open_stream on the I/O thread; returns its errno on failure.
    int open_stream (qlink::stream_id_t *stream_)
    {
        int rc = 0;
        thread.call ([this, stream_, &rc] () {
            rc = connection->open_stream (stream_) == 0 ? 0 : errno;
        });
        return rc;
    }

    qlink::options_t options;
    qlink::io_thread_t thread;
    std::shared_ptr<silent_mux_t> mux;
    recorder_t events;
    qlink::connection_t *connection;
};

static qlink::options_t heartbeat_options (bool data_liveness_)
{
    qlink::options_t options;
    options.heartbeat_ivl = 50;
    options.heartbeat_timeout = 50;
    options.heartbeat_missed = 3;
    options.heartbeat_data_liveness = data_liveness_;
    return options;
}

//  Pings go unanswered while the peer keeps sending data.
static void run_pongless_traffic (harness_t &harness_)
{
    const std::vector<unsigned char> bytes = data_wire ("x");
    for (int i = 0; i < 20; i++) {
        harness_.feed (4, bytes);
        msleep (20);
    }
}

void test_data_counts_as_liveness_when_enabled ()
{
    harness_t harness (heartbeat_options (true));
    run_pongless_traffic (harness);

    snapshot_t state = harness.snapshot ();
    TEST_ASSERT_TRUE (state.control_writes > 5);
    TEST_ASSERT_EQUAL_INT (20, static_cast<int> (state.events.bodies.size ()));
    TEST_ASSERT_EQUAL_INT (0, state.events.degraded);
    TEST_ASSERT_EQUAL_INT (0, state.events.failed);
    TEST_ASSERT_EQUAL_INT (qlink::connection_t::live, state.health);

    //  Once the data stops, so does the liveness it provided.
    msleep (400);
    state = harness.snapshot ();
    TEST_ASSERT_EQUAL_INT (1, state.events.degraded);
    TEST_ASSERT_EQUAL_INT (1, state.events.failed);
    TEST_ASSERT_EQUAL_INT (QLINK_EHEARTBEAT, state.events.reason);
}

void test_data_ignored_for_liveness_when_disabled ()
{
    harness_t harness (heartbeat_options (false));
    run_pongless_traffic (harness);

    const snapshot_t state = harness.snapshot ();
    TEST_ASSERT_EQUAL_INT (1, state.events.degraded);
    TEST_ASSERT_EQUAL_INT (1, state.events.failed);
    TEST_ASSERT_EQUAL_INT (QLINK_EHEARTBEAT, state.events.reason);
    TEST_ASSERT_EQUAL_INT (qlink::connection_t::dead, state.health);
}

void test_pong_restores_degraded ()
{
    qlink::options_t options = heartbeat_options (false);
    options.heartbeat_missed = 6;
    harness_t harness (options);

    //  Past the first ping timeout, short of six silent intervals.
    msleep (150);
    snapshot_t state = harness.snapshot ();
    TEST_ASSERT_EQUAL_INT (1, state.events.degraded);
    TEST_ASSERT_EQUAL_INT (0, state.events.failed);

    qlink::chunk_t pong;
    pong.id = qlink::message_id_t::zero ();
    pong.sequence = 0;
    pong.total = 1;
    pong.payload.assign (1, '\x01');
    std::vector<unsigned char> bytes;
    qlink::encode_chunk (pong, &bytes);
    harness.feed (2, bytes);

    state = harness.snapshot ();
    TEST_ASSERT_EQUAL_INT (1, state.events.restored);
    TEST_ASSERT_EQUAL_INT (qlink::connection_t::live, state.health);
}

void test_open_stream_limit_excludes_control ()
{
    qlink::options_t options;
    options.max_streams = 2;
    harness_t harness (options);

    //  The control stream took id 1.
    qlink::stream_id_t first, second, third;
    TEST_ASSERT_EQUAL_INT (0, harness.open_stream (&first));
    TEST_ASSERT_EQUAL_INT (0, harness.open_stream (&second));
    TEST_ASSERT_EQUAL_UINT32 (3, first);
    TEST_ASSERT_EQUAL_UINT32 (5, second);
    TEST_ASSERT_EQUAL_INT (QLINK_ESTREAMLIMIT, harness.open_stream (&third));
}

void test_peer_streams_beyond_limit_are_reset ()
{
    qlink::options_t options;
    options.max_streams = 2;
    harness_t harness (options);

    //  Stream 2 is the peer's control stream; 4 and 6 fill the cap.
    harness.feed (4, data_wire ("a"));
    harness.feed (6, data_wire ("b"));
    harness.feed (8, data_wire ("c"));
    snapshot_t state = harness.snapshot ();
    TEST_ASSERT_EQUAL_INT (2, static_cast<int> (state.events.bodies.size ()));
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (state.resets.size ()));
    TEST_ASSERT_EQUAL_UINT32 (8, state.resets[0]);
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (state.events.malformed.size ()));

    //  A stream the peer closes frees its slot.
    harness.peer_reset (4);
    harness.feed (10, data_wire ("d"));
    state = harness.snapshot ();
    TEST_ASSERT_EQUAL_INT (3, static_cast<int> (state.events.bodies.size ()));
    TEST_ASSERT_EQUAL_STRING ("d", state.events.bodies[2].c_str ());
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (state.resets.size ()));
}

void test_malformed_stream_is_reset_and_released ()
{
    qlink::options_t options;
    options.max_streams = 1;
    harness_t harness (options);

    //  A second message starts before the first one is complete.
    qlink::chunk_t chunk;
    chunk.id = qlink::message_id_t::generate ();
    chunk.sequence = 0;
    chunk.total = 2;
    chunk.payload = "partial";
    std::vector<unsigned char> bytes;
    qlink::encode_chunk (chunk, &bytes);
    chunk.id = qlink::message_id_t::generate ();
    qlink::encode_chunk (chunk, &bytes);
    harness.feed (4, bytes);

    snapshot_t state = harness.snapshot ();
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (state.events.malformed.size ()));
    TEST_ASSERT_EQUAL_UINT32 (4, state.events.malformed[0]);
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (state.resets.size ()));
    TEST_ASSERT_EQUAL_UINT32 (4, state.resets[0]);
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (state.events.bodies.size ()));

    //  The poisoned stream no longer holds the only slot.
    harness.feed (6, data_wire ("after"));
    state = harness.snapshot ();
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (state.events.bodies.size ()));
    TEST_ASSERT_EQUAL_STRING ("after", state.events.bodies[0].c_str ());
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_data_counts_as_liveness_when_enabled);
    RUN_TEST (test_data_ignored_for_liveness_when_disabled);
    RUN_TEST (test_pong_restores_degraded);
    RUN_TEST (test_open_stream_limit_excludes_control);
    RUN_TEST (test_peer_streams_beyond_limit_are_reset);
    RUN_TEST (test_malformed_stream_is_reset_and_released);
    return UNITY_END ();
}
