/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include <atomic>

void setUp ()
{
}

void tearDown ()
{
}

//  On the first message, starts two sends over a single stream and
//  cancels both before either can finish.
struct cancelling_handler_t : public qlink::i_event_handler
{
    cancelling_handler_t () :
        client (NULL),
        triggered (false),
        first_error (-1),
        second_error (-1),
        cancel_rc (-1),
        recancel_errno (0)
    {
    }

    void on_event (const qlink::event_t &event_)
    {
        if (event_.event != QLINK_EVENT_MESSAGE_RECEIVED || triggered)
            return;
        triggered = true;

        const std::string big (4096, 'b');
        uint64_t first, second;
        TEST_ASSERT_SUCCESS_ERRNO (client->send_async (
          event_.connection, big.data (), big.size (), &first,
          [this] (int error_) { first_error = error_; }));
        TEST_ASSERT_SUCCESS_ERRNO (client->send_async (
          event_.connection, big.data (), big.size (), &second,
          [this] (int error_) { second_error = error_; }));

        //  Queued behind the first.
        int rc = client->cancel (second);
        //  Active, chunks still in flight.
        if (rc == 0)
            rc = client->cancel (first);
        cancel_rc = rc;

        if (client->cancel (first) != 0)
            recancel_errno = errno;
    }

    qlink::client_t *client;
    bool triggered;
    std::atomic<int> first_error;
    std::atomic<int> second_error;
    std::atomic<int> cancel_rc;
    std::atomic<int> recancel_errno;
};

void test_cancel_inside_handler ()
{
    cancelling_handler_t handler;
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_MAX_STREAMS, 1));
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_MAX_CHUNK_SIZE, 64));
    handler.client = &client;

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://cancel", &client_side,
                  &server_side);
    client.on_event (&handler);

    TEST_ASSERT_SUCCESS_ERRNO (server.send (server_side, "go", 2));
    for (int i = 0; i < 250 && handler.first_error == -1; i++)
        msleep (20);
    for (int i = 0; i < 250 && handler.second_error == -1; i++)
        msleep (20);

    TEST_ASSERT_EQUAL_INT (0, handler.cancel_rc.load ());
    TEST_ASSERT_EQUAL_INT (QLINK_ECANCELED, handler.first_error.load ());
    TEST_ASSERT_EQUAL_INT (QLINK_ECANCELED, handler.second_error.load ());
    TEST_ASSERT_EQUAL_INT (ENOENT, handler.recancel_errno.load ());

    client.on_event (NULL);

    //  The connection keeps working with a fresh stream.
    TEST_ASSERT_SUCCESS_ERRNO (client.send (client_side, "after", 5));
    while (recv_message (server) != "after") {
    }
}

void test_cancel_from_application_thread ()
{
    const int count = 20;

    std::atomic<int> completed (0);
    std::atomic<int> cancelled (0);
    qlink::context_t context;
    qlink::server_t server (context);
    qlink::client_t client (context);
    TEST_ASSERT_SUCCESS_ERRNO (client.set (QLINK_MAX_STREAMS, 1));

    qlink::connection_id_t client_side, server_side;
    connect_pair (server, client, "inproc://cancel-app", &client_side,
                  &server_side);

    const std::string body (8192, 'x');
    uint64_t ops[count];
    for (int i = 0; i < count; i++)
        TEST_ASSERT_SUCCESS_ERRNO (client.send_async (
          client_side, body.data (), body.size (), &ops[i],
          [&completed, &cancelled] (int error_) {
              if (error_ == QLINK_ECANCELED)
                  cancelled++;
              completed++;
          }));

    //  Each cancel either stops the send or finds it already done.
    int stopped = 0;
    for (int i = count - 1; i >= 0; i--) {
        if (client.cancel (ops[i]) == 0)
            stopped++;
        else
            TEST_ASSERT_EQUAL_INT (ENOENT, errno);
    }

    for (int i = 0; i < 250 && completed < count; i++)
        msleep (20);
    TEST_ASSERT_EQUAL_INT (count, completed.load ());
    TEST_ASSERT_EQUAL_INT (stopped, cancelled.load ());

    TEST_ASSERT_FAILURE_ERRNO (ENOENT, client.cancel (987654321));
    TEST_ASSERT_SUCCESS_ERRNO (client.close ());
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_cancel_inside_handler);
    RUN_TEST (test_cancel_from_application_thread);
    return UNITY_END ();
}
