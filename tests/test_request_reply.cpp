/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include <atomic>

void setUp ()
{
}

void tearDown ()
{
}

//  Answers requests from the server's I/O thread. Requests whose body is
//  "mute" stay unanswered and "hangup" closes the connection.
struct echo_handler_t : public qlink::i_event_handler
{
    echo_handler_t () : server (NULL), requests (0) {}

    void on_event (const qlink::event_t &event_)
    {
        if (event_.event != QLINK_EVENT_MESSAGE_RECEIVED
            || event_.message_type != QLINK_MSG_REQUEST)
            return;
        requests++;
        if (event_.data == "mute")
            return;
        if (event_.data == "hangup") {
            TEST_ASSERT_SUCCESS_ERRNO (server->close (event_.connection));
            return;
        }
        const std::string answer = "re: " + event_.data;
        TEST_ASSERT_SUCCESS_ERRNO (server->reply (event_.connection,
                                                  event_.correlation_id,
                                                  answer.data (),
                                                  answer.size ()));
    }

    qlink::server_t *server;
    std::atomic<int> requests;
};

void test_request_gets_reply ()
{
    echo_handler_t handler;
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    handler.server = &server;
    server.on_event (&handler);

    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("inproc://echo"));
    qlink::connection_id_t id;
    TEST_ASSERT_SUCCESS_ERRNO (client.connect ("inproc://echo", &id));

    std::string reply;
    TEST_ASSERT_SUCCESS_ERRNO (
      client.request (id, "quote", 5, &reply, EVENT_TIMEOUT));
    TEST_ASSERT_EQUAL_STRING ("re: quote", reply.c_str ());

    TEST_ASSERT_SUCCESS_ERRNO (
      client.request (id, "second", 6, &reply, EVENT_TIMEOUT));
    TEST_ASSERT_EQUAL_STRING ("re: second", reply.c_str ());
    TEST_ASSERT_EQUAL_INT (2, handler.requests.load ());

    server.on_event (NULL);
}

void test_request_times_out ()
{
    echo_handler_t handler;
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    handler.server = &server;
    server.on_event (&handler);

    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("inproc://mute"));
    qlink::connection_id_t id;
    TEST_ASSERT_SUCCESS_ERRNO (client.connect ("inproc://mute", &id));

    std::string reply;
    TEST_ASSERT_FAILURE_ERRNO (ETIMEDOUT,
                               client.request (id, "mute", 4, &reply, 100));

    //  The default comes from QLINK_REQUEST_TIMEOUT.
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_REQUEST_TIMEOUT, 100));
    TEST_ASSERT_FAILURE_ERRNO (ETIMEDOUT,
                               client.request (id, "mute", 4, &reply));

    //  Requests after a timeout are unaffected.
    TEST_ASSERT_SUCCESS_ERRNO (
      client.request (id, "after", 5, &reply, EVENT_TIMEOUT));
    TEST_ASSERT_EQUAL_STRING ("re: after", reply.c_str ());

    server.on_event (NULL);
}

void test_request_fails_with_connection ()
{
    echo_handler_t handler;
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    handler.server = &server;
    server.on_event (&handler);

    TEST_ASSERT_SUCCESS_ERRNO (server.bind ("inproc://hangup"));
    qlink::connection_id_t id;
    TEST_ASSERT_SUCCESS_ERRNO (client.connect ("inproc://hangup", &id));

    std::string reply;
    TEST_ASSERT_FAILURE_ERRNO (
      ECONNRESET, client.request (id, "hangup", 6, &reply, EVENT_TIMEOUT));

    server.on_event (NULL);
}

void test_request_to_unknown_connection ()
{
    qlink::context_t context;
    qlink::client_t client (context);

    std::string reply;
    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN,
                               client.request (42, "x", 1, &reply, 100));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_request_gets_reply);
    RUN_TEST (test_request_times_out);
    RUN_TEST (test_request_fails_with_connection);
    RUN_TEST (test_request_to_unknown_connection);
    return UNITY_END ();
}
