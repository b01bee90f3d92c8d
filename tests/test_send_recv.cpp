/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include <atomic>
#include <set>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

void test_connect_send_both_ways ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    TEST_ASSERT_SUCCESS_ERRNO (server.set (QLINK_IDENTITY, "srv"));
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_IDENTITY, "cli"));

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://send-both", &client_side,
                  &server_side);

    qlink::event_t event;
    expect_event (client, QLINK_EVENT_CONNECTED, &event);
    TEST_ASSERT_EQUAL_UINT64 (client_side, event.connection);
    TEST_ASSERT_EQUAL_STRING ("srv", event.identity.c_str ());
    TEST_ASSERT_EQUAL_INT (1, event.value);

    expect_event (server, QLINK_EVENT_CONNECTED, &event);
    TEST_ASSERT_EQUAL_UINT64 (server_side, event.connection);
    TEST_ASSERT_EQUAL_STRING ("cli", event.identity.c_str ());
    TEST_ASSERT_EQUAL_INT (0, event.value);

    TEST_ASSERT_SUCCESS_ERRNO (client.send (client_side, "HELLO", 5));
    TEST_ASSERT_EQUAL_STRING ("HELLO", recv_message (server, &event).c_str ());
    TEST_ASSERT_EQUAL_UINT64 (server_side, event.connection);
    TEST_ASSERT_EQUAL_INT (QLINK_MSG_DATA, event.message_type);

    TEST_ASSERT_SUCCESS_ERRNO (server.send (server_side, "WORLD", 5));
    TEST_ASSERT_EQUAL_STRING ("WORLD", recv_message (client).c_str ());

    int state = -1;
    TEST_ASSERT_SUCCESS_ERRNO (client.state (client_side, &state));
    TEST_ASSERT_EQUAL_INT (QLINK_STATE_LIVE, state);
}

void test_empty_message ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://empty", &client_side,
                  &server_side);

    TEST_ASSERT_SUCCESS_ERRNO (client.send (client_side, NULL, 0));
    TEST_ASSERT_EQUAL_UINT (0, recv_message (server).size ());
}

void test_large_message_is_chunked ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_MAX_CHUNK_SIZE, 64));
    TEST_ASSERT_SUCCESS_ERRNO (server.set (QLINK_MAX_CHUNK_SIZE, 64));

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://large", &client_side,
                  &server_side);

    std::string payload (100000, 0);
    for (size_t i = 0; i < payload.size (); i++)
        payload[i] = static_cast<char> (i * 31 + 7);

    TEST_ASSERT_SUCCESS_ERRNO (
      client.send (client_side, payload.data (), payload.size ()));
    const std::string received = recv_message (server);
    TEST_ASSERT_EQUAL_UINT (payload.size (), received.size ());
    TEST_ASSERT_TRUE (received == payload);
}

struct completions_t
{
    completions_t () : ok (0), failed (0) {}

    void done (int error_)
    {
        if (error_ == 0)
            ok++;
        else
            failed++;
    }

    int total () const { return ok + failed; }

    std::atomic<int> ok;
    std::atomic<int> failed;
};

void test_sends_beyond_stream_limit_queue ()
{
    const int count = 50;

    //  Outlives the client, whose callbacks use it.
    completions_t completions;
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_MAX_STREAMS, 2));
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_MAX_CHUNK_SIZE, 16));

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://stream-limit", &client_side,
                  &server_side);

    std::set<std::string> expected;
    for (int i = 0; i < count; i++) {
        char body[64];
        snprintf (body, sizeof body, "message number %d with some padding", i);
        expected.insert (body);
        uint64_t op;
        TEST_ASSERT_SUCCESS_ERRNO (client.send_async (
          client_side, body, strlen (body), &op,
          [&completions] (int error_) { completions.done (error_); }));
    }

    std::set<std::string> received;
    for (int i = 0; i < count; i++)
        received.insert (recv_message (server));
    TEST_ASSERT_TRUE (received == expected);

    for (int i = 0; i < 50 && completions.total () < count; i++)
        msleep (20);
    TEST_ASSERT_EQUAL_INT (count, completions.ok.load ());
    TEST_ASSERT_EQUAL_INT (0, completions.failed.load ());
}

void test_open_stream_limit ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_MAX_STREAMS, 2));

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://open-stream", &client_side,
                  &server_side);

    //  The control stream is already open and does not count.
    qlink::stream_id_t first, second, third;
    TEST_ASSERT_SUCCESS_ERRNO (client.open_stream (client_side, &first));
    TEST_ASSERT_SUCCESS_ERRNO (client.open_stream (client_side, &second));
    TEST_ASSERT_TRUE (first != second);
    TEST_ASSERT_EQUAL_UINT32 (1, first % 2);
    TEST_ASSERT_EQUAL_UINT32 (1, second % 2);
    TEST_ASSERT_FAILURE_ERRNO (QLINK_ESTREAMLIMIT,
                               client.open_stream (client_side, &third));
    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN,
                               client.open_stream (client_side + 100, &third));

    //  Sends run on the streams opened above.
    TEST_ASSERT_SUCCESS_ERRNO (client.send (client_side, "one", 3));
    TEST_ASSERT_SUCCESS_ERRNO (client.send (client_side, "two", 3));
    std::set<std::string> received;
    received.insert (recv_message (server));
    received.insert (recv_message (server));
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (received.count ("one")));
    TEST_ASSERT_EQUAL_INT (1, static_cast<int> (received.count ("two")));
    TEST_ASSERT_FAILURE_ERRNO (QLINK_ESTREAMLIMIT,
                               client.open_stream (client_side, &third));
}

void test_send_all ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t first (context);
    qlink::client_t second (context);
    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("inproc://send-all"));

    qlink::connection_id_t id;
    TEST_ASSERT_SUCCESS_ERRNO (first.connect ("inproc://send-all", &id));
    TEST_ASSERT_SUCCESS_ERRNO (second.connect ("inproc://send-all", &id));
    TEST_ASSERT_SUCCESS_ERRNO (server.accept (&id, EVENT_TIMEOUT));
    TEST_ASSERT_SUCCESS_ERRNO (server.accept (&id, EVENT_TIMEOUT));

    TEST_ASSERT_EQUAL_INT (2, server.send_all ("ALL", 3));
    TEST_ASSERT_EQUAL_STRING ("ALL", recv_message (first).c_str ());
    TEST_ASSERT_EQUAL_STRING ("ALL", recv_message (second).c_str ());
}

void test_close_connection ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    set_fast_timers (client);

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://close-one", &client_side,
                  &server_side);

    TEST_ASSERT_SUCCESS_ERRNO (client.close (client_side));

    qlink::event_t event;
    expect_event (client, QLINK_EVENT_DISCONNECTED, &event);
    TEST_ASSERT_EQUAL_INT (0, event.value);
    expect_event (server, QLINK_EVENT_DISCONNECTED, &event);
    TEST_ASSERT_EQUAL_UINT64 (server_side, event.connection);
    TEST_ASSERT_TRUE (event.value != 0);

    //  An explicitly closed connection is never reconnected.
    TEST_ASSERT_EQUAL_INT (0, count_events (client, QLINK_EVENT_RECONNECTING,
                                            SETTLE_TIME));

    int state;
    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN, client.state (client_side, &state));
    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN, client.send (client_side, "x", 1));
    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN, client.close (client_side));
}

void test_accept_times_out ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("inproc://lonely"));

    qlink::connection_id_t id;
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN, server.accept (&id, 50));

    qlink::event_t event;
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN, server.recv_event (&event, 0));
}

void test_events_mask ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    TEST_ASSERT_SUCCESS_ERRNO (
      server.set (QLINK_EVENTS, QLINK_EVENT_MESSAGE_RECEIVED));

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://mask", &client_side,
                  &server_side);
    TEST_ASSERT_SUCCESS_ERRNO (client.send (client_side, "A", 1));

    qlink::event_t event;
    TEST_ASSERT_SUCCESS_ERRNO (server.recv_event (&event, EVENT_TIMEOUT));
    TEST_ASSERT_EQUAL_INT (QLINK_EVENT_MESSAGE_RECEIVED, event.event);
    TEST_ASSERT_EQUAL_STRING ("A", event.data.c_str ());
}

void test_operations_after_close ()
{
    qlink::context_t context;
    qlink::client_t client (context);
    TEST_ASSERT_SUCCESS_ERRNO (client.close ());
    TEST_ASSERT_SUCCESS_ERRNO (client.close ());

    qlink::connection_id_t id;
    TEST_ASSERT_FAILURE_ERRNO (QLINK_ETERM,
                               client.connect ("inproc://gone", &id));
    TEST_ASSERT_FAILURE_ERRNO (QLINK_ETERM, client.send (1, "x", 1));
    TEST_ASSERT_FAILURE_ERRNO (QLINK_ETERM, client.set (QLINK_MAX_STREAMS, 4));

    qlink::event_t event;
    TEST_ASSERT_FAILURE_ERRNO (QLINK_ETERM, client.recv_event (&event, 10));
}

void test_invalid_endpoints ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);

    TEST_ASSERT_FAILURE_ERRNO (EINVAL, server.bind ("bogus"));
    TEST_ASSERT_FAILURE_ERRNO (EPROTONOSUPPORT, server.bind ("udp://x:1"));
    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("inproc://taken"));
    TEST_ASSERT_FAILURE_ERRNO (EADDRINUSE, server.bind ("inproc://taken"));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, context.partition ("tcp://a:1", true));

    qlink::connection_id_t id;
    TEST_ASSERT_FAILURE_ERRNO (QLINK_ECONNECTION,
                               client.connect ("inproc://nobody", &id));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_connect_send_both_ways);
    RUN_TEST (test_empty_message);
    RUN_TEST (test_large_message_is_chunked);
    RUN_TEST (test_sends_beyond_stream_limit_queue);
    RUN_TEST (test_open_stream_limit);
    RUN_TEST (test_send_all);
    RUN_TEST (test_close_connection);
    RUN_TEST (test_accept_times_out);
    RUN_TEST (test_events_mask);
    RUN_TEST (test_operations_after_close);
    RUN_TEST (test_invalid_endpoints);
    return UNITY_END ();
}
