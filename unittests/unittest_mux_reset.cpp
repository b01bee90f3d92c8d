/* SPDX-License-Identifier: MPL-2.0 */

#include "core/ctx.hpp"
#include "core/io_thread.hpp"
#include "transports/inproc/inproc_mux.hpp"
#include "transports/tcp/tcp_mux.hpp"

#include <unity.h>
#include <string.h>
#include <time.h>

#include <functional>
#include <map>
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

struct stream_log_t : public qlink::i_mux_events
{
    stream_log_t () : lost (0) {}

    void stream_data (qlink::stream_id_t stream_,
                      const unsigned char *data_,
                      size_t size_)
    {
        data[stream_].append (reinterpret_cast<const char *> (data_), size_);
    }

    void stream_reset (qlink::stream_id_t stream_)
    {
        resets.push_back (stream_);
    }

    void connection_lost (const boost::system::error_code &) { lost++; }

    std::map<qlink::stream_id_t, std::string> data;
    std::vector<qlink::stream_id_t> resets;
    int lost;
};

static qlink::buffer_ptr_t make_buffer (const char *text_)
{
    return std::make_shared<const std::vector<unsigned char> > (
      text_, text_ + strlen (text_));
}

static void ignore_completion (const boost::system::error_code &, std::size_t)
{
}

//  Two connected ends of one transport on a private I/O thread. Everything
//  but the constructor's wait runs on that thread.
struct mux_pair_t
{
    explicit mux_pair_t (bool tcp_) : tcp (tcp_)
    {
        thread.start ("mux");
        int rc = -1;
        thread.call ([this, &rc] () {
            boost::asio::io_context &io_context = thread.get_io_context ();
            if (tcp) {
                rc = qlink::tcp_listener_t::listen (
                  io_context, "127.0.0.1", "0", qlink::tls_context_ptr_t (),
                  1000,
                  [this] (const qlink::mux_connection_ptr_t &mux_) {
                      server = mux_;
                      server->start (&server_log);
                  },
                  &listener);
                if (rc != 0)
                    return;
                const std::string endpoint = listener->local_address ();
                const std::string port =
                  endpoint.substr (endpoint.rfind (':') + 1);
                qlink::tcp_mux_t::connect (
                  io_context, "127.0.0.1", port, qlink::tls_context_ptr_t (),
                  std::string (), [this] (const boost::system::error_code &,
                                          const qlink::mux_connection_ptr_t &mux_) {
                      client = mux_;
                      if (client)
                          client->start (&client_log);
                  });
            } else {
                rc = qlink::inproc_listener_t::listen (
                  &ctx, io_context, "mux-reset",
                  [this] (const qlink::mux_connection_ptr_t &mux_) {
                      server = mux_;
                      server->start (&server_log);
                  },
                  &listener);
                if (rc != 0)
                    return;
                qlink::inproc_mux_t::connect (
                  &ctx, io_context, "mux-reset",
                  [this] (const boost::system::error_code &,
                          const qlink::mux_connection_ptr_t &mux_) {
                      client = mux_;
                      if (client)
                          client->start (&client_log);
                  });
            }
        });
        TEST_ASSERT_EQUAL_INT (0, rc);
        TEST_ASSERT_TRUE (wait_until ([this] () { return client && server; }));
    }

    ~mux_pair_t ()
    {
        thread.call ([this] () {
            if (client)
                client->close ();
            if (server)
                server->close ();
            if (listener)
                listener->close ();
        });
        thread.stop ();
    }

    //  Polls cond_ on the I/O thread for up to two seconds.
    bool wait_until (const std::function<bool ()> &cond_)
    {
        for (int i = 0; i < 200; i++) {
            bool done = false;
            thread.call ([&done, &cond_] () { done = cond_ (); });
            if (done)
                return true;
            msleep (10);
        }
        return false;
    }

    size_t pending_resets (const qlink::mux_connection_ptr_t &mux_) const
    {
        if (tcp)
            return std::static_pointer_cast<qlink::tcp_mux_t> (mux_)
              ->pending_resets ();
        return std::static_pointer_cast<qlink::inproc_mux_t> (mux_)
          ->pending_resets ();
    }

    const bool tcp;
    qlink::ctx_t ctx;
    qlink::io_thread_t thread;
    qlink::mux_listener_ptr_t listener;
    qlink::mux_connection_ptr_t client;
    qlink::mux_connection_ptr_t server;
    stream_log_t client_log;
    stream_log_t server_log;
};

static void check_reset_is_answered (bool tcp_)
{
    mux_pair_t pair (tcp_);
    qlink::stream_id_t stream = 0;
    pair.thread.call ([&pair, &stream] () {
        stream = pair.client->open_stream ();
        pair.client->async_write (stream, make_buffer ("abc"),
                                  ignore_completion);
        pair.client->reset_stream (stream);
    });

    TEST_ASSERT_TRUE (pair.wait_until ([&pair] () {
        return pair.server_log.resets.size () == 1
               && pair.pending_resets (pair.client) == 0;
    }));

    std::string received;
    size_t server_pending = 1;
    size_t client_resets = 1;
    pair.thread.call ([&] () {
        received = pair.server_log.data[stream];
        server_pending = pair.pending_resets (pair.server);
        client_resets = pair.client_log.resets.size ();
    });
    TEST_ASSERT_EQUAL_STRING ("abc", received.c_str ());
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (server_pending));
    //  The answer is absorbed by the end that reset.
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (client_resets));
}

static void check_late_data_is_dropped (bool tcp_)
{
    mux_pair_t pair (tcp_);
    qlink::stream_id_t stream = 0;
    pair.thread.call ([&pair, &stream] () {
        stream = pair.client->open_stream ();
        pair.client->async_write (stream, make_buffer ("first"),
                                  ignore_completion);
    });
    TEST_ASSERT_TRUE (pair.wait_until ([&pair, stream] () {
        return pair.server_log.data[stream] == "first";
    }));

    //  The server writes before it has seen the reset.
    pair.thread.call ([&pair, stream] () {
        pair.client->reset_stream (stream);
        pair.server->async_write (stream, make_buffer ("late"),
                                  ignore_completion);
    });
    TEST_ASSERT_TRUE (pair.wait_until ([&pair] () {
        return pair.server_log.resets.size () == 1
               && pair.pending_resets (pair.client) == 0;
    }));

    size_t late = 1;
    pair.thread.call ([&] () { late = pair.client_log.data.count (stream); });
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (late));
}

static void check_crossing_resets (bool tcp_)
{
    mux_pair_t pair (tcp_);
    qlink::stream_id_t stream = 0;
    pair.thread.call ([&pair, &stream] () {
        stream = pair.client->open_stream ();
        pair.client->async_write (stream, make_buffer ("x"), ignore_completion);
    });
    TEST_ASSERT_TRUE (pair.wait_until ([&pair, stream] () {
        return pair.server_log.data.count (stream) == 1;
    }));

    //  Each reset doubles as the answer to the other one.
    pair.thread.call ([&pair, stream] () {
        pair.client->reset_stream (stream);
        pair.server->reset_stream (stream);
    });
    TEST_ASSERT_TRUE (pair.wait_until ([&pair] () {
        return pair.pending_resets (pair.client) == 0
               && pair.pending_resets (pair.server) == 0;
    }));

    msleep (50);
    size_t events = 1;
    pair.thread.call ([&] () {
        events = pair.client_log.resets.size () + pair.server_log.resets.size ();
    });
    TEST_ASSERT_EQUAL_INT (0, static_cast<int> (events));
}

void test_inproc_reset_is_answered ()
{
    check_reset_is_answered (false);
}

void test_inproc_late_data_is_dropped ()
{
    check_late_data_is_dropped (false);
}

void test_inproc_crossing_resets ()
{
    check_crossing_resets (false);
}

void test_tcp_reset_is_answered ()
{
    check_reset_is_answered (true);
}

void test_tcp_late_data_is_dropped ()
{
    check_late_data_is_dropped (true);
}

void test_tcp_crossing_resets ()
{
    check_crossing_resets (true);
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_inproc_reset_is_answered);
    RUN_TEST (test_inproc_late_data_is_dropped);
    RUN_TEST (test_inproc_crossing_resets);
    RUN_TEST (test_tcp_reset_is_answered);
    RUN_TEST (test_tcp_late_data_is_dropped);
    RUN_TEST (test_tcp_crossing_resets);
    return UNITY_END ();
}
