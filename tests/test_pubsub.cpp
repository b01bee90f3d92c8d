/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

void setUp ()
{
}

void tearDown ()
{
}

static int publish (qlink::peer_t &peer_,
                    const std::string &topic_,
                    const std::string &data_)
{
    return peer_.publish (topic_, data_.data (), data_.size ());
}

void test_publish_by_topic ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t ticks (context);
    qlink::client_t trades (context);
    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("inproc://topics"));

    qlink::subscription_id_t sub;
    TEST_ASSERT_SUCCESS_ERRNO (ticks.subscribe ("ticks", &sub));
    TEST_ASSERT_SUCCESS_ERRNO (trades.subscribe ("trades", &sub));

    qlink::connection_id_t id;
    TEST_ASSERT_SUCCESS_ERRNO (ticks.connect ("inproc://topics", &id));
    TEST_ASSERT_SUCCESS_ERRNO (trades.connect ("inproc://topics", &id));
    msleep (SETTLE_TIME);

    TEST_ASSERT_EQUAL_INT (1, publish (server, "ticks", "EURUSD 1.0841"));
    TEST_ASSERT_EQUAL_INT (1, publish (server, "trades", "EURUSD 1M"));
    TEST_ASSERT_EQUAL_INT (0, publish (server, "quotes", "none"));

    qlink::event_t event;
    TEST_ASSERT_EQUAL_STRING ("EURUSD 1.0841",
                              recv_message (ticks, &event).c_str ());
    TEST_ASSERT_EQUAL_INT (QLINK_MSG_PUBLISH, event.message_type);
    TEST_ASSERT_EQUAL_STRING ("ticks", event.topic.c_str ());

    TEST_ASSERT_EQUAL_STRING ("EURUSD 1M",
                              recv_message (trades, &event).c_str ());
    TEST_ASSERT_EQUAL_STRING ("trades", event.topic.c_str ());

    TEST_ASSERT_EQUAL_INT (
      0, count_events (ticks, QLINK_EVENT_MESSAGE_RECEIVED, SETTLE_TIME));
}

void test_subscription_before_and_after_connect ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://late-sub", &client_side,
                  &server_side);

    qlink::subscription_id_t sub;
    TEST_ASSERT_SUCCESS_ERRNO (client.subscribe ("news", &sub));
    //  Subscribing twice still means one delivery per publish.
    TEST_ASSERT_SUCCESS_ERRNO (client.subscribe ("news", &sub));
    msleep (SETTLE_TIME);

    TEST_ASSERT_EQUAL_INT (1, publish (server, "news", "N1"));
    TEST_ASSERT_EQUAL_STRING ("N1", recv_message (client).c_str ());
    TEST_ASSERT_EQUAL_INT (
      0, count_events (client, QLINK_EVENT_MESSAGE_RECEIVED, SETTLE_TIME));
}

static bool large_trades (const std::string &, const std::string &data_)
{
    return data_.size () > 3;
}

void test_subscriber_filter ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);

    qlink::subscription_id_t sub;
    TEST_ASSERT_SUCCESS_ERRNO (client.subscribe ("trades", &sub, large_trades));

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://filter", &client_side,
                  &server_side);
    msleep (SETTLE_TIME);

    TEST_ASSERT_EQUAL_INT (1, publish (server, "trades", "1"));
    TEST_ASSERT_EQUAL_INT (1, publish (server, "trades", "1000000"));
    TEST_ASSERT_EQUAL_STRING ("1000000", recv_message (client).c_str ());
}

void test_publisher_routed_subscription ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://routed", &client_side,
                  &server_side);

    qlink::subscription_id_t sub;
    TEST_ASSERT_SUCCESS_ERRNO (
      server.subscribe_connection (server_side, "alerts", &sub, large_trades));

    TEST_ASSERT_EQUAL_INT (0, publish (server, "alerts", "low"));
    TEST_ASSERT_EQUAL_INT (1, publish (server, "alerts", "critical"));

    qlink::event_t event;
    TEST_ASSERT_EQUAL_STRING ("critical",
                              recv_message (client, &event).c_str ());
    TEST_ASSERT_EQUAL_STRING ("alerts", event.topic.c_str ());

    TEST_ASSERT_SUCCESS_ERRNO (server.unsubscribe (sub));
    TEST_ASSERT_EQUAL_INT (0, publish (server, "alerts", "critical"));

    TEST_ASSERT_FAILURE_ERRNO (
      ENOTCONN, server.subscribe_connection (12345, "alerts", &sub));
}

void test_unsubscribe ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);

    qlink::subscription_id_t sub;
    TEST_ASSERT_SUCCESS_ERRNO (client.subscribe ("ticks", &sub));
    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://unsub", &client_side,
                  &server_side);
    msleep (SETTLE_TIME);
    TEST_ASSERT_EQUAL_INT (1, publish (server, "ticks", "T"));
    TEST_ASSERT_EQUAL_STRING ("T", recv_message (client).c_str ());

    TEST_ASSERT_SUCCESS_ERRNO (client.unsubscribe (sub));
    msleep (SETTLE_TIME);
    TEST_ASSERT_EQUAL_INT (0, publish (server, "ticks", "T"));

    TEST_ASSERT_FAILURE_ERRNO (ENOENT, client.unsubscribe (sub));
}

void test_closed_subscriber_is_dropped ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);

    qlink::subscription_id_t sub;
    TEST_ASSERT_SUCCESS_ERRNO (client.subscribe ("ticks", &sub));
    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://dropped", &client_side,
                  &server_side);
    msleep (SETTLE_TIME);
    TEST_ASSERT_EQUAL_INT (1, publish (server, "ticks", "T"));

    TEST_ASSERT_SUCCESS_ERRNO (client.close (client_side));
    expect_event (server, QLINK_EVENT_DISCONNECTED);
    TEST_ASSERT_EQUAL_INT (0, publish (server, "ticks", "T"));
}

void test_publish_arguments ()
{
    qlink::context_t context;
    qlink::server_t server (context);

    const std::string long_topic (0x10000, 't');
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, publish (server, long_topic, "x"));

    uint64_t op = 0;
    TEST_ASSERT_EQUAL_INT (0, server.publish ("idle", "x", 1, &op));
    TEST_ASSERT_TRUE (op != 0);
    TEST_ASSERT_FAILURE_ERRNO (ENOENT, server.cancel (op));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_publish_by_topic);
    RUN_TEST (test_subscription_before_and_after_connect);
    RUN_TEST (test_subscriber_filter);
    RUN_TEST (test_publisher_routed_subscription);
    RUN_TEST (test_unsubscribe);
    RUN_TEST (test_closed_subscriber_is_dropped);
    RUN_TEST (test_publish_arguments);
    return UNITY_END ();
}
