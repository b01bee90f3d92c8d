/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

void setUp ()
{
}

void tearDown ()
{
}

static void put_u32 (unsigned char *buffer_, uint32_t value_)
{
    buffer_[0] = static_cast<unsigned char> (value_ >> 24);
    buffer_[1] = static_cast<unsigned char> (value_ >> 16);
    buffer_[2] = static_cast<unsigned char> (value_ >> 8);
    buffer_[3] = static_cast<unsigned char> (value_);
}

void test_tcp_send_recv ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("tcp://127.0.0.1:0"));

    const std::string endpoint = server.last_endpoint ();
    TEST_ASSERT_EQUAL_INT (0, endpoint.compare (0, 16, "tcp://127.0.0.1:"));
    TEST_ASSERT_TRUE (endpoint != "tcp://127.0.0.1:0");

    qlink::connection_id_t client_side, server_side;
    TEST_ASSERT_SUCCESS_ERRNO (client.connect (endpoint, &client_side));
    TEST_ASSERT_SUCCESS_ERRNO (server.accept (&server_side, EVENT_TIMEOUT));

    qlink::event_t event;
    expect_event (client, QLINK_EVENT_CONNECTED, &event);
    TEST_ASSERT_EQUAL_STRING (endpoint.c_str (), event.address.c_str ());

    TEST_ASSERT_SUCCESS_ERRNO (client.send (client_side, "HELLOWORLD", 10));
    TEST_ASSERT_EQUAL_STRING ("HELLOWORLD", recv_message (server).c_str ());

    std::string large (300000, 0);
    for (size_t i = 0; i < large.size (); i++)
        large[i] = static_cast<char> (i % 251);
    TEST_ASSERT_SUCCESS_ERRNO (
      server.send (server_side, large.data (), large.size ()));
    TEST_ASSERT_TRUE (recv_message (client) == large);
}

void test_tcp_many_streams_interleave ()
{
    const int count = 100;

    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_MAX_CHUNK_SIZE, 32));
    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("tcp://127.0.0.1:0"));

    qlink::connection_id_t client_side, server_side;
    TEST_ASSERT_SUCCESS_ERRNO (
      client.connect (server.last_endpoint (), &client_side));
    TEST_ASSERT_SUCCESS_ERRNO (server.accept (&server_side, EVENT_TIMEOUT));

    for (int i = 0; i < count; i++) {
        const std::string body = std::string (100 + i, 'a' + i % 26);
        uint64_t op;
        TEST_ASSERT_SUCCESS_ERRNO (
          client.send_async (client_side, body.data (), body.size (), &op));
    }

    int total = 0;
    for (int i = 0; i < count; i++) {
        const std::string body = recv_message (server);
        TEST_ASSERT_TRUE (body.size () >= 100);
        TEST_ASSERT_EQUAL_STRING (
          std::string (body.size (), body[0]).c_str (), body.c_str ());
        total += static_cast<int> (body.size ()) - 100;
    }
    TEST_ASSERT_EQUAL_INT (count * (count - 1) / 2, total);
}

void test_tcp_pubsub ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("tcp://127.0.0.1:0"));

    qlink::subscription_id_t sub;
    TEST_ASSERT_SUCCESS_ERRNO (client.subscribe ("ticks", &sub));
    qlink::connection_id_t client_side;
    TEST_ASSERT_SUCCESS_ERRNO (
      client.connect (server.last_endpoint (), &client_side));
    msleep (SETTLE_TIME);

    TEST_ASSERT_EQUAL_INT (1, server.publish ("ticks", "1.0841", 6));
    qlink::event_t event;
    TEST_ASSERT_EQUAL_STRING ("1.0841", recv_message (client, &event).c_str ());
    TEST_ASSERT_EQUAL_STRING ("ticks", event.topic.c_str ());
}

void test_tcp_connect_refused ()
{
    qlink::context_t context;
    std::string endpoint;
    {
        qlink::server_t server (context);
        TEST_ASSERT_SUCCESS_ERRNO (server.bind ("tcp://127.0.0.1:0"));
        endpoint = server.last_endpoint ();
    }

    qlink::client_t client (context);
    qlink::connection_id_t id;
    TEST_ASSERT_FAILURE_ERRNO (QLINK_ECONNECTION, client.connect (endpoint, &id));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, client.connect ("tcp://nohost", &id));
}

void test_tcp_malformed_chunk ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("tcp://127.0.0.1:0"));
    const int fd = connect_raw (server.last_endpoint ());

    //  One data frame on stream 1 holding a chunk that claims index 0 of
    //  a zero chunk message.
    unsigned char frame[9 + 28];
    memset (frame, 0, sizeof frame);
    put_u32 (frame, 1);
    frame[4] = 0;
    put_u32 (frame + 5, 28);
    for (int i = 0; i < 16; i++)
        frame[9 + i] = static_cast<unsigned char> (i + 1);
    put_u32 (frame + 9 + 16, 0);
    put_u32 (frame + 9 + 20, 0);
    put_u32 (frame + 9 + 24, 0);
    TEST_ASSERT_EQUAL_INT (static_cast<int> (sizeof frame),
                           send (fd, frame, sizeof frame, 0));

    qlink::event_t event;
    expect_event (server, QLINK_EVENT_MALFORMED_CHUNK, &event);
    TEST_ASSERT_EQUAL_INT (1, event.value);

    close (fd);
}

void test_tcp_handshake_timeout ()
{
    qlink::context_t context;
    qlink::server_t server (context);
    TEST_ASSERT_SUCCESS_ERRNO (server.set (QLINK_HANDSHAKE_IVL, 200));
    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("tcp://127.0.0.1:0"));

    //  Never says hello.
    const int fd = connect_raw (server.last_endpoint ());
    qlink::connection_id_t id;
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN, server.accept (&id, SETTLE_TIME));
    TEST_ASSERT_TRUE (wait_for_eof (fd));
    close (fd);

    qlink::event_t event;
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN, server.recv_event (&event, 0));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_tcp_send_recv);
    RUN_TEST (test_tcp_many_streams_interleave);
    RUN_TEST (test_tcp_pubsub);
    RUN_TEST (test_tcp_connect_refused);
    RUN_TEST (test_tcp_malformed_chunk);
    RUN_TEST (test_tcp_handshake_timeout);
    return UNITY_END ();
}
