/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_HPP_INCLUDED__
#define __TESTUTIL_HPP_INCLUDED__

#include "qlink.hpp"

#include <unity.h>

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

#include <string>

//  Time a test waits for asynchronous activity to settle.
#define SETTLE_TIME 300

//  Bounds every wait so a broken test fails instead of hanging.
#define EVENT_TIMEOUT 5000

//  Asserts that expr returns a non-negative value, reporting errno
//  otherwise.
#define TEST_ASSERT_SUCCESS_ERRNO(expr)                                        \
    test_assert_success_errno_helper ((expr), #expr, __LINE__)

//  Asserts that expr fails with -1 and errno error.
#define TEST_ASSERT_FAILURE_ERRNO(error, expr)                                 \
    {                                                                          \
        const int rc_ = (expr);                                                \
        const int errno_ = errno;                                              \
        TEST_ASSERT_EQUAL_INT_MESSAGE (-1, rc_, #expr);                        \
        TEST_ASSERT_EQUAL_INT_MESSAGE (error, errno_, qlink_strerror (errno_)); \
    }

inline int
test_assert_success_errno_helper (int rc_, const char *msg_, int line_)
{
    if (rc_ < 0) {
        char buffer[512];
        buffer[sizeof (buffer) - 1] = 0;
        snprintf (buffer, sizeof (buffer) - 1, "%s failed, errno = %i (%s)",
                  msg_, errno, qlink_strerror (errno));
        UNITY_TEST_FAIL (line_, buffer);
    }
    return rc_;
}

inline void setup_test_environment (int timeout_seconds_ = 60)
{
    signal (SIGPIPE, SIG_IGN);
    //  Kill a hung test.
    alarm (timeout_seconds_);
}

inline void msleep (int milliseconds_)
{
    struct timespec ts;
    ts.tv_sec = milliseconds_ / 1000;
    ts.tv_nsec = (milliseconds_ % 1000) * 1000000L;
    nanosleep (&ts, NULL);
}

//  Monotonic milliseconds, for timing assertions.
inline int64_t now_ms ()
{
    struct timespec ts;
    clock_gettime (CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t> (ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

//  Short timers so liveness tests finish quickly.
inline void set_fast_timers (qlink::peer_t &peer_)
{
    TEST_ASSERT_SUCCESS_ERRNO (peer_.set (QLINK_HEARTBEAT_IVL, 50));
    TEST_ASSERT_SUCCESS_ERRNO (peer_.set (QLINK_HEARTBEAT_TIMEOUT, 50));
    TEST_ASSERT_SUCCESS_ERRNO (peer_.set (QLINK_HEARTBEAT_MISSED, 3));
    TEST_ASSERT_SUCCESS_ERRNO (peer_.set (QLINK_RECONNECT_IVL, 20));
    TEST_ASSERT_SUCCESS_ERRNO (peer_.set (QLINK_RECONNECT_IVL_MAX, 100));
    TEST_ASSERT_SUCCESS_ERRNO (peer_.set (QLINK_HANDSHAKE_IVL, 1000));
}

//  Reads events until one of type event_ arrives, discarding others.
//  Returns 0 and fills out_ if given, -1 on timeout.
inline int wait_event (qlink::peer_t &peer_,
                       int event_,
                       qlink::event_t *out_ = NULL,
                       int timeout_ = EVENT_TIMEOUT)
{
    const time_t started = time (NULL);
    while (true) {
        qlink::event_t event;
        if (peer_.recv_event (&event, timeout_) != 0)
            return -1;
        if (event.event == event_) {
            if (out_)
                *out_ = event;
            return 0;
        }
        if (time (NULL) - started > timeout_ / 1000 + 1)
            return -1;
    }
}

inline void expect_event (qlink::peer_t &peer_,
                          int event_,
                          qlink::event_t *out_ = NULL)
{
    TEST_ASSERT_EQUAL_INT_MESSAGE (0, wait_event (peer_, event_, out_),
                                   "expected event did not arrive");
}

//  Counts events of type event_ arriving within duration_ ms.
inline int count_events (qlink::peer_t &peer_, int event_, int duration_)
{
    int count = 0;
    const time_t deadline = time (NULL) + (duration_ + 999) / 1000;
    while (time (NULL) <= deadline) {
        qlink::event_t event;
        if (peer_.recv_event (&event, 100) != 0)
            continue;
        if (event.event == event_)
            count++;
    }
    return count;
}

//  Reads the next message event with a body, skipping lifecycle events.
inline std::string recv_message (qlink::peer_t &peer_,
                                 qlink::event_t *out_ = NULL)
{
    qlink::event_t event;
    expect_event (peer_, QLINK_EVENT_MESSAGE_RECEIVED, &event);
    if (out_)
        *out_ = event;
    return event.data;
}

//  Binds a server on a fresh inproc name and connects a client to it.
//  Both ends are past the handshake on return.
inline void connect_pair (qlink::server_t &server_,
                          qlink::client_t &client_,
                          const char *endpoint_,
                          qlink::connection_id_t *client_side_,
                          qlink::connection_id_t *server_side_)
{
    TEST_ASSERT_SUCCESS_ERRNO (server_.bind (endpoint_));
    TEST_ASSERT_SUCCESS_ERRNO (client_.connect (endpoint_, client_side_));
    TEST_ASSERT_SUCCESS_ERRNO (server_.accept (server_side_, EVENT_TIMEOUT));
}

//  Plain socket connected to a "tcp://127.0.0.1:port" endpoint.
inline int connect_raw (const std::string &endpoint_)
{
    const std::string::size_type colon = endpoint_.rfind (':');
    TEST_ASSERT_TRUE (colon != std::string::npos);
    const int port = atoi (endpoint_.c_str () + colon + 1);

    const int fd = socket (AF_INET, SOCK_STREAM, 0);
    TEST_ASSERT_TRUE (fd >= 0);

    struct timeval tv;
    tv.tv_sec = EVENT_TIMEOUT / 1000;
    tv.tv_usec = 0;
    TEST_ASSERT_SUCCESS_ERRNO (
      setsockopt (fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof tv));

    struct sockaddr_in addr;
    memset (&addr, 0, sizeof addr);
    addr.sin_family = AF_INET;
    addr.sin_port = htons (static_cast<uint16_t> (port));
    addr.sin_addr.s_addr = htonl (INADDR_LOOPBACK);
    TEST_ASSERT_SUCCESS_ERRNO (
      connect (fd, reinterpret_cast<struct sockaddr *> (&addr), sizeof addr));
    return fd;
}

//  Reads until the peer closes. Returns false on timeout.
inline bool wait_for_eof (int fd_)
{
    char buffer[256];
    while (true) {
        const ssize_t n = recv (fd_, buffer, sizeof buffer, 0);
        if (n == 0)
            return true;
        if (n < 0)
            return errno == ECONNRESET;
    }
}

#endif
