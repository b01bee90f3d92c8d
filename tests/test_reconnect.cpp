/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

void setUp ()
{
}

void tearDown ()
{
}

void test_reconnect_after_partition ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    set_fast_timers (server);
    set_fast_timers (client);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_RECONNECT_MAX_ATTEMPTS, 0));

    qlink::subscription_id_t sub;
    TEST_ASSERT_SUCCESS_ERRNO (client.subscribe ("ticks", &sub));
    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://heal", &client_side,
                  &server_side);

    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://heal", true));

    qlink::event_t event;
    expect_event (client, QLINK_EVENT_DISCONNECTED, &event);
    TEST_ASSERT_EQUAL_UINT64 (client_side, event.connection);
    TEST_ASSERT_EQUAL_INT (QLINK_EHEARTBEAT, event.value);
    expect_event (client, QLINK_EVENT_RECONNECTING, &event);
    TEST_ASSERT_EQUAL_UINT64 (client_side, event.connection);
    TEST_ASSERT_TRUE (event.value >= 1);

    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://heal", false));

    //  Same connection id on the initiating side.
    expect_event (client, QLINK_EVENT_CONNECTED, &event);
    TEST_ASSERT_EQUAL_UINT64 (client_side, event.connection);

    qlink::connection_id_t renewed;
    TEST_ASSERT_SUCCESS_ERRNO (server.accept (&renewed, EVENT_TIMEOUT));
    TEST_ASSERT_TRUE (renewed != server_side);

    //  Subscriptions are replayed on the new session.
    msleep (SETTLE_TIME);
    TEST_ASSERT_EQUAL_INT (1, server.publish ("ticks", "again", 5));
    TEST_ASSERT_EQUAL_STRING ("again", recv_message (client).c_str ());

    TEST_ASSERT_SUCCESS_ERRNO (client.send (client_side, "ping", 4));
    TEST_ASSERT_EQUAL_STRING ("ping", recv_message (server).c_str ());
}

void test_unreachable_after_max_attempts ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    set_fast_timers (server);
    set_fast_timers (client);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_RECONNECT_MAX_ATTEMPTS, 3));

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://gone-for-good", &client_side,
                  &server_side);
    TEST_ASSERT_SUCCESS_ERRNO (
      context.partition ("inproc://gone-for-good", true));

    qlink::event_t event;
    expect_event (client, QLINK_EVENT_UNREACHABLE, &event);
    TEST_ASSERT_EQUAL_UINT64 (client_side, event.connection);

    int state;
    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN, client.state (client_side, &state));
    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN, client.send (client_side, "x", 1));

    TEST_ASSERT_SUCCESS_ERRNO (
      context.partition ("inproc://gone-for-good", false));
}

void test_reconnect_attempts_are_reported ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    set_fast_timers (server);
    set_fast_timers (client);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_RECONNECT_MAX_ATTEMPTS, 4));

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://attempts", &client_side,
                  &server_side);
    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://attempts", true));

    qlink::event_t event;
    for (int attempt = 1; attempt <= 4; attempt++) {
        expect_event (client, QLINK_EVENT_RECONNECTING, &event);
        TEST_ASSERT_EQUAL_INT (attempt, event.value);
    }
    expect_event (client, QLINK_EVENT_UNREACHABLE);

    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://attempts", false));
}

void test_reconnect_to_restarted_server ()
{
    qlink::context_t context;
    qlink::client_t client (context);
    set_fast_timers (client);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_RECONNECT_MAX_ATTEMPTS, 0));

    qlink::connection_id_t client_side;
    {
        qlink::server_t server (context);
        qlink::connection_id_t server_side;
        connect_pair (server, client, "inproc://restart", &client_side,
                      &server_side);
        TEST_ASSERT_SUCCESS_ERRNO (server.close ());
    }

    qlink::event_t event;
    expect_event (client, QLINK_EVENT_DISCONNECTED, &event);
    TEST_ASSERT_EQUAL_UINT64 (client_side, event.connection);
    expect_event (client, QLINK_EVENT_RECONNECTING);

    qlink::server_t server (context);
    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("inproc://restart"));
    qlink::connection_id_t server_side;
    TEST_ASSERT_SUCCESS_ERRNO (server.accept (&server_side, EVENT_TIMEOUT));

    expect_event (client, QLINK_EVENT_CONNECTED, &event);
    TEST_ASSERT_EQUAL_UINT64 (client_side, event.connection);

    TEST_ASSERT_SUCCESS_ERRNO (server.send (server_side, "back", 4));
    TEST_ASSERT_EQUAL_STRING ("back", recv_message (client).c_str ());
}

void test_closed_during_reconnect ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    set_fast_timers (server);
    set_fast_timers (client);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_RECONNECT_MAX_ATTEMPTS, 0));

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://abandon", &client_side,
                  &server_side);
    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://abandon", true));
    expect_event (client, QLINK_EVENT_RECONNECTING);

    TEST_ASSERT_SUCCESS_ERRNO (client.close (client_side));
    TEST_ASSERT_SUCCESS_ERRNO (context.partition ("inproc://abandon", false));
    TEST_ASSERT_EQUAL_INT (
      0, count_events (client, QLINK_EVENT_CONNECTED, SETTLE_TIME));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_reconnect_after_partition);
    RUN_TEST (test_unreachable_after_max_attempts);
    RUN_TEST (test_reconnect_attempts_are_reported);
    RUN_TEST (test_reconnect_to_restarted_server);
    RUN_TEST (test_closed_during_reconnect);
    return UNITY_END ();
}
