/* SPDX-License-Identifier: MPL-2.0 */

#include "core/thread.hpp"
#include "pubsub/router.hpp"
#include "utils/mutex.hpp"
#include "qlink.h"

#include <unity.h>
#include <time.h>

#include <deque>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

//  Records deliveries. Completes them at once, or holds them until
//  complete_one is called.
struct fake_sink_t : public qlink::i_router_sink
{
    fake_sink_t () : hold (false), blocking (true), dropped (0) {}

    void async_deliver (qlink::connection_id_t connection_,
                        uint64_t op_,
                        const qlink::msg_ptr_t &msg_,
                        const qlink::send_completion_t &done_)
    {
        bool complete_now;
        {
            qlink::scoped_lock_t lock (sync);
            bodies.push_back (msg_->body ());
            connections.push_back (connection_);
            ops.push_back (op_);
            complete_now = !hold;
            if (!complete_now)
                pending.push_back (done_);
        }
        if (complete_now)
            done_ (0);
    }

    bool can_block () { return blocking; }

    void delivery_dropped (qlink::connection_id_t, uint64_t, const std::string &)
    {
        qlink::scoped_lock_t lock (sync);
        dropped++;
    }

    void complete_one ()
    {
        qlink::send_completion_t done;
        {
            qlink::scoped_lock_t lock (sync);
            TEST_ASSERT_FALSE (pending.empty ());
            done = pending.front ();
            pending.pop_front ();
        }
        done (0);
    }

    void release ()
    {
        {
            qlink::scoped_lock_t lock (sync);
            hold = false;
        }
        while (true) {
            {
                qlink::scoped_lock_t lock (sync);
                if (pending.empty ())
                    return;
            }
            complete_one ();
        }
    }

    size_t delivered ()
    {
        qlink::scoped_lock_t lock (sync);
        return bodies.size ();
    }

    qlink::mutex_t sync;
    bool hold;
    bool blocking;
    int dropped;
    std::vector<std::string> bodies;
    std::vector<qlink::connection_id_t> connections;
    std::vector<uint64_t> ops;
    std::deque<qlink::send_completion_t> pending;
};

static qlink::msg_ptr_t make_publish (const std::string &topic_,
                                      const std::string &body_)
{
    return std::make_shared<const qlink::msg_t> (
      QLINK_MSG_PUBLISH, 0, topic_, body_.data (), body_.size ());
}

static uint64_t subscribe (qlink::router_t &router_,
                           const std::string &topic_,
                           qlink::connection_id_t connection_,
                           int policy_ = QLINK_BACKPRESSURE_DROP_OLDEST,
                           int depth_ = 16,
                           const qlink::router_filter_t &filter_ =
                             qlink::router_filter_t ())
{
    return router_.subscribe (topic_, connection_, filter_, policy_, depth_,
                              50);
}

void test_publish_reaches_topic_subscribers_only ()
{
    fake_sink_t sink;
    qlink::router_t router (&sink);
    subscribe (router, "ticks", 1);
    subscribe (router, "trades", 2);

    TEST_ASSERT_EQUAL_INT (1, router.publish (make_publish ("ticks", "t1"), 1));
    TEST_ASSERT_EQUAL_UINT (1, sink.delivered ());
    TEST_ASSERT_EQUAL_UINT64 (1, sink.connections[0]);
    TEST_ASSERT_EQUAL_STRING ("t1", sink.bodies[0].c_str ());

    TEST_ASSERT_EQUAL_INT (0, router.publish (make_publish ("quotes", "q"), 2));
    TEST_ASSERT_EQUAL_UINT (1, sink.delivered ());
}

void test_one_delivery_per_connection ()
{
    fake_sink_t sink;
    qlink::router_t router (&sink);
    subscribe (router, "ticks", 1);
    subscribe (router, "ticks", 1);
    subscribe (router, "ticks", 2);

    TEST_ASSERT_EQUAL_INT (2, router.publish (make_publish ("ticks", "t"), 1));
    TEST_ASSERT_EQUAL_UINT (2, sink.delivered ());
    TEST_ASSERT_TRUE (sink.connections[0] != sink.connections[1]);
}

static bool large_only (const qlink::msg_t &msg_)
{
    return msg_.body ().size () > 3;
}

void test_filter_selects_messages ()
{
    fake_sink_t sink;
    qlink::router_t router (&sink);
    subscribe (router, "trades", 1, QLINK_BACKPRESSURE_DROP_OLDEST, 16,
               large_only);

    TEST_ASSERT_EQUAL_INT (0, router.publish (make_publish ("trades", "s"), 1));
    TEST_ASSERT_EQUAL_INT (
      1, router.publish (make_publish ("trades", "large"), 2));
    TEST_ASSERT_EQUAL_UINT (1, sink.delivered ());
    TEST_ASSERT_EQUAL_STRING ("large", sink.bodies[0].c_str ());
}

void test_one_delivery_in_flight_per_subscription ()
{
    fake_sink_t sink;
    sink.hold = true;
    qlink::router_t router (&sink);
    subscribe (router, "ticks", 1);

    for (int i = 0; i < 3; i++)
        TEST_ASSERT_EQUAL_INT (
          1, router.publish (make_publish ("ticks", std::string (1, 'a' + i)),
                             i + 1));
    TEST_ASSERT_EQUAL_UINT (1, sink.delivered ());

    sink.complete_one ();
    TEST_ASSERT_EQUAL_UINT (2, sink.delivered ());
    sink.release ();
    TEST_ASSERT_EQUAL_UINT (3, sink.delivered ());
    TEST_ASSERT_EQUAL_STRING ("a", sink.bodies[0].c_str ());
    TEST_ASSERT_EQUAL_STRING ("b", sink.bodies[1].c_str ());
    TEST_ASSERT_EQUAL_STRING ("c", sink.bodies[2].c_str ());
}

void test_drop_oldest_keeps_the_newest ()
{
    const int depth = 3;
    const int extra = 4;

    fake_sink_t sink;
    qlink::router_t router (&sink);
    subscribe (router, "ticks", 1, QLINK_BACKPRESSURE_DROP_OLDEST, depth);

    //  A paused connection drains nothing.
    router.pause (1, true);
    for (int i = 0; i < depth + extra; i++)
        TEST_ASSERT_EQUAL_INT (
          1, router.publish (make_publish ("ticks", std::string (1, 'a' + i)),
                             i + 1));
    TEST_ASSERT_EQUAL_UINT (0, sink.delivered ());
    TEST_ASSERT_EQUAL_INT (extra, sink.dropped);

    router.pause (1, false);
    TEST_ASSERT_EQUAL_UINT (depth, sink.delivered ());
    TEST_ASSERT_EQUAL_STRING ("e", sink.bodies[0].c_str ());
    TEST_ASSERT_EQUAL_STRING ("f", sink.bodies[1].c_str ());
    TEST_ASSERT_EQUAL_STRING ("g", sink.bodies[2].c_str ());
}

void test_in_flight_delivery_is_outside_depth ()
{
    const int depth = 3;

    fake_sink_t sink;
    sink.hold = true;
    qlink::router_t router (&sink);
    subscribe (router, "ticks", 1, QLINK_BACKPRESSURE_DROP_OLDEST, depth);

    //  "a" goes straight to the sink and stalls there; the queue then
    //  keeps the newest three of the rest.
    for (int i = 0; i < 7; i++)
        TEST_ASSERT_EQUAL_INT (
          1, router.publish (make_publish ("ticks", std::string (1, 'a' + i)),
                             i + 1));
    TEST_ASSERT_EQUAL_UINT (1, sink.delivered ());
    TEST_ASSERT_EQUAL_INT (3, sink.dropped);

    sink.release ();
    TEST_ASSERT_EQUAL_UINT (depth + 1, sink.delivered ());
    TEST_ASSERT_EQUAL_STRING ("a", sink.bodies[0].c_str ());
    TEST_ASSERT_EQUAL_STRING ("e", sink.bodies[1].c_str ());
    TEST_ASSERT_EQUAL_STRING ("f", sink.bodies[2].c_str ());
    TEST_ASSERT_EQUAL_STRING ("g", sink.bodies[3].c_str ());
}

void test_block_times_out_when_full ()
{
    fake_sink_t sink;
    sink.hold = true;
    qlink::router_t router (&sink);
    subscribe (router, "ticks", 1, QLINK_BACKPRESSURE_BLOCK, 1);

    //  One in flight, one queued.
    TEST_ASSERT_EQUAL_INT (1, router.publish (make_publish ("ticks", "a"), 1));
    TEST_ASSERT_EQUAL_INT (1, router.publish (make_publish ("ticks", "b"), 2));

    const time_t started = time (NULL);
    TEST_ASSERT_EQUAL_INT (-1, router.publish (make_publish ("ticks", "c"), 3));
    TEST_ASSERT_EQUAL_INT (EAGAIN, errno);
    TEST_ASSERT_TRUE (time (NULL) - started < 5);
    TEST_ASSERT_EQUAL_INT (0, sink.dropped);

    sink.release ();
    TEST_ASSERT_EQUAL_UINT (2, sink.delivered ());
}

void test_block_never_waits_where_blocking_is_forbidden ()
{
    fake_sink_t sink;
    sink.hold = true;
    sink.blocking = false;
    qlink::router_t router (&sink);
    subscribe (router, "ticks", 1, QLINK_BACKPRESSURE_BLOCK, 1);

    TEST_ASSERT_EQUAL_INT (1, router.publish (make_publish ("ticks", "a"), 1));
    TEST_ASSERT_EQUAL_INT (1, router.publish (make_publish ("ticks", "b"), 2));
    TEST_ASSERT_EQUAL_INT (-1, router.publish (make_publish ("ticks", "c"), 3));
    TEST_ASSERT_EQUAL_INT (EAGAIN, errno);
    sink.release ();
}

static void complete_later (void *arg_)
{
    struct timespec ts = {0, 20 * 1000000L};
    nanosleep (&ts, NULL);
    static_cast<fake_sink_t *> (arg_)->complete_one ();
}

void test_block_resumes_once_room_frees ()
{
    fake_sink_t sink;
    sink.hold = true;
    qlink::router_t router (&sink);
    router.subscribe ("ticks", 1, qlink::router_filter_t (),
                      QLINK_BACKPRESSURE_BLOCK, 1, 5000);

    TEST_ASSERT_EQUAL_INT (1, router.publish (make_publish ("ticks", "a"), 1));
    TEST_ASSERT_EQUAL_INT (1, router.publish (make_publish ("ticks", "b"), 2));

    qlink::thread_t completer;
    completer.start (complete_later, &sink, "completer");
    TEST_ASSERT_EQUAL_INT (1, router.publish (make_publish ("ticks", "c"), 3));
    completer.stop ();

    sink.release ();
    TEST_ASSERT_EQUAL_UINT (3, sink.delivered ());
    TEST_ASSERT_EQUAL_STRING ("c", sink.bodies[2].c_str ());
}

void test_connection_dead_removes_subscriptions ()
{
    fake_sink_t sink;
    qlink::router_t router (&sink);
    subscribe (router, "ticks", 1);
    subscribe (router, "trades", 1);
    subscribe (router, "ticks", 2);
    TEST_ASSERT_EQUAL_UINT (2, router.subscribers ("ticks"));

    router.connection_dead (1);
    TEST_ASSERT_EQUAL_UINT (1, router.subscribers ("ticks"));
    TEST_ASSERT_EQUAL_UINT (0, router.subscribers ("trades"));
    TEST_ASSERT_EQUAL_INT (0, router.publish (make_publish ("trades", "x"), 1));

    router.peer_unreachable (2);
    TEST_ASSERT_EQUAL_INT (0, router.publish (make_publish ("ticks", "x"), 2));
}

void test_unsubscribe ()
{
    fake_sink_t sink;
    qlink::router_t router (&sink);
    const uint64_t handle = subscribe (router, "ticks", 1);

    TEST_ASSERT_EQUAL_INT (0, router.unsubscribe (handle));
    TEST_ASSERT_EQUAL_INT (0, router.publish (make_publish ("ticks", "x"), 1));
    TEST_ASSERT_EQUAL_INT (-1, router.unsubscribe (handle));
    TEST_ASSERT_EQUAL_INT (ENOENT, errno);
}

void test_cancel_drops_queued_deliveries ()
{
    fake_sink_t sink;
    sink.hold = true;
    qlink::router_t router (&sink);
    subscribe (router, "ticks", 1);
    subscribe (router, "ticks", 2);
    router.pause (2, true);

    TEST_ASSERT_EQUAL_INT (2, router.publish (make_publish ("ticks", "x"), 7));

    //  In flight on connection 1, queued on the paused connection 2.
    std::vector<qlink::connection_id_t> in_flight;
    TEST_ASSERT_EQUAL_INT (2, router.cancel (7, &in_flight));
    TEST_ASSERT_EQUAL_UINT (1, in_flight.size ());
    TEST_ASSERT_EQUAL_UINT64 (1, in_flight[0]);

    router.pause (2, false);
    sink.release ();
    TEST_ASSERT_EQUAL_UINT (1, sink.delivered ());

    in_flight.clear ();
    TEST_ASSERT_EQUAL_INT (0, router.cancel (99, &in_flight));
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_publish_reaches_topic_subscribers_only);
    RUN_TEST (test_one_delivery_per_connection);
    RUN_TEST (test_filter_selects_messages);
    RUN_TEST (test_one_delivery_in_flight_per_subscription);
    RUN_TEST (test_drop_oldest_keeps_the_newest);
    RUN_TEST (test_in_flight_delivery_is_outside_depth);
    RUN_TEST (test_block_times_out_when_full);
    RUN_TEST (test_block_never_waits_where_blocking_is_forbidden);
    RUN_TEST (test_block_resumes_once_room_frees);
    RUN_TEST (test_connection_dead_removes_subscriptions);
    RUN_TEST (test_unsubscribe);
    RUN_TEST (test_cancel_drops_queued_deliveries);
    return UNITY_END ();
}
