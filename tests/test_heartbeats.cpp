/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

void setUp ()
{
}

void tearDown ()
{
}

void test_silent_peer_is_declared_dead ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    set_fast_timers (server);
    set_fast_timers (client);

    qlink::subscription_id_t sub;
    TEST_ASSERT_SUCCESS_ERRNO (client.subscribe ("ticks", &sub));
    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://silent", &client_side,
                  &server_side);
    msleep (SETTLE_TIME);
    TEST_ASSERT_EQUAL_INT (1, server.publish ("ticks", "T", 1));

    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://silent", true));

    qlink::event_t event;
    expect_event (server, QLINK_EVENT_DEGRADED, &event);
    TEST_ASSERT_EQUAL_UINT64 (server_side, event.connection);
    TEST_ASSERT_EQUAL_INT (1, event.value);

    expect_event (server, QLINK_EVENT_DISCONNECTED, &event);
    TEST_ASSERT_EQUAL_UINT64 (server_side, event.connection);
    TEST_ASSERT_EQUAL_INT (QLINK_EHEARTBEAT, event.value);

    //  The subscriber went with its connection.
    TEST_ASSERT_EQUAL_INT (0, server.publish ("ticks", "T", 1));
    TEST_ASSERT_EQUAL_INT (
      0, count_events (server, QLINK_EVENT_DISCONNECTED, SETTLE_TIME));

    expect_event (client, QLINK_EVENT_DISCONNECTED, &event);
    TEST_ASSERT_EQUAL_INT (QLINK_EHEARTBEAT, event.value);

    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://silent", false));
}

void test_degraded_connection_recovers ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    set_fast_timers (server);
    set_fast_timers (client);
    //  Long enough to stay degraded while the link is cut.
    TEST_ASSERT_SUCCESS_ERRNO (server.set (QLINK_HEARTBEAT_MISSED, 1000));
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_HEARTBEAT_MISSED, 1000));

    qlink::subscription_id_t sub;
    TEST_ASSERT_SUCCESS_ERRNO (client.subscribe ("ticks", &sub));
    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://flaky", &client_side,
                  &server_side);
    msleep (SETTLE_TIME);

    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://flaky", true));

    qlink::event_t event;
    expect_event (server, QLINK_EVENT_DEGRADED, &event);
    TEST_ASSERT_EQUAL_INT (1, event.value);
    int state;
    TEST_ASSERT_SUCCESS_ERRNO (server.state (server_side, &state));
    TEST_ASSERT_EQUAL_INT (QLINK_STATE_DEGRADED, state);

    //  Held back while degraded instead of being lost on the cut link.
    TEST_ASSERT_EQUAL_INT (1, server.publish ("ticks", "held", 4));

    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://flaky", false));
    expect_event (server, QLINK_EVENT_DEGRADED, &event);
    TEST_ASSERT_EQUAL_INT (0, event.value);
    TEST_ASSERT_SUCCESS_ERRNO (server.state (server_side, &state));
    TEST_ASSERT_EQUAL_INT (QLINK_STATE_LIVE, state);

    TEST_ASSERT_EQUAL_STRING ("held", recv_message (client).c_str ());
}

void test_heartbeats_disabled ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    TEST_ASSERT_SUCCESS_ERRNO (server.set (QLINK_HEARTBEAT_IVL, 0));
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_HEARTBEAT_IVL, 0));

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://quiet", &client_side,
                  &server_side);
    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://quiet", true));

    TEST_ASSERT_EQUAL_INT (
      0, count_events (server, QLINK_EVENT_DISCONNECTED, SETTLE_TIME));
    int state;
    TEST_ASSERT_SUCCESS_ERRNO (server.state (server_side, &state));
    TEST_ASSERT_EQUAL_INT (QLINK_STATE_LIVE, state);

    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://quiet", false));
}

void test_dead_within_missed_intervals ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    qlink::peer_t *peers[] = {&server, &client};
    for (int i = 0; i < 2; i++) {
        TEST_ASSERT_SUCCESS_ERRNO (peers[i]->set (QLINK_HEARTBEAT_IVL, 100));
        TEST_ASSERT_SUCCESS_ERRNO (
          peers[i]->set (QLINK_HEARTBEAT_TIMEOUT, 100));
        TEST_ASSERT_SUCCESS_ERRNO (peers[i]->set (QLINK_HEARTBEAT_MISSED, 3));
    }

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://deadline", &client_side,
                  &server_side);
    msleep (SETTLE_TIME);

    const int64_t cut = now_ms ();
    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://deadline", true));

    qlink::event_t event;
    expect_event (server, QLINK_EVENT_DISCONNECTED, &event);
    const int64_t elapsed = now_ms () - cut;
    TEST_ASSERT_EQUAL_INT (QLINK_EHEARTBEAT, event.value);

    //  Silence counts from the last pong, which came at most one interval
    //  before the cut: dead after 3 x 100 ms of silence, never later.
    TEST_ASSERT_TRUE_MESSAGE (elapsed <= 300 + 80, "declared dead too late");
    TEST_ASSERT_TRUE_MESSAGE (elapsed >= 200 - 20, "declared dead too early");

    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://deadline", false));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_silent_peer_is_declared_dead);
    RUN_TEST (test_degraded_connection_recovers);
    RUN_TEST (test_heartbeats_disabled);
    RUN_TEST (test_dead_within_missed_intervals);
    return UNITY_END ();
}
