/* SPDX-License-Identifier: MPL-2.0 */

#include "core/options.hpp"
#include "qlink.h"

#include <unity.h>
#include <errno.h>
#include <stdint.h>
#include <string.h>

#include <string>

void setUp ()
{
}

void tearDown ()
{
}

static int set_int (qlink::options_t &options_, int option_, int value_)
{
    return options_.setopt (option_, &value_, sizeof value_);
}

static int get_int (const qlink::options_t &options_, int option_)
{
    int value = -12345;
    size_t size = sizeof value;
    TEST_ASSERT_EQUAL_INT (0, options_.getopt (option_, &value, &size));
    return value;
}

void test_defaults ()
{
    const qlink::options_t options;
    TEST_ASSERT_EQUAL_INT (16384, get_int (options, QLINK_MAX_CHUNK_SIZE));
    TEST_ASSERT_EQUAL_INT (16, get_int (options, QLINK_MAX_STREAMS));
    TEST_ASSERT_EQUAL_INT (3, get_int (options, QLINK_HEARTBEAT_MISSED));
    TEST_ASSERT_EQUAL_INT (QLINK_BACKPRESSURE_DROP_OLDEST,
                           get_int (options, QLINK_BACKPRESSURE));
    TEST_ASSERT_EQUAL_INT (QLINK_EVENT_ALL, get_int (options, QLINK_EVENTS));
    TEST_ASSERT_EQUAL_INT (0, get_int (options, QLINK_RECONNECT_MAX_DURATION));
}

void test_heartbeat_timeout_falls_back_to_interval ()
{
    qlink::options_t options;
    TEST_ASSERT_EQUAL_INT (0, set_int (options, QLINK_HEARTBEAT_IVL, 250));
    TEST_ASSERT_EQUAL_INT (250, options.effective_heartbeat_timeout ());

    TEST_ASSERT_EQUAL_INT (0, set_int (options, QLINK_HEARTBEAT_TIMEOUT, 80));
    TEST_ASSERT_EQUAL_INT (80, options.effective_heartbeat_timeout ());

    TEST_ASSERT_EQUAL_INT (0, set_int (options, QLINK_HEARTBEAT_TIMEOUT, -1));
    TEST_ASSERT_EQUAL_INT (250, options.effective_heartbeat_timeout ());
}

void test_out_of_range_values_are_rejected ()
{
    qlink::options_t options;
    TEST_ASSERT_EQUAL_INT (-1, set_int (options, QLINK_MAX_CHUNK_SIZE, 0));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    TEST_ASSERT_EQUAL_INT (-1, set_int (options, QLINK_MAX_STREAMS, -3));
    TEST_ASSERT_EQUAL_INT (-1, set_int (options, QLINK_HEARTBEAT_MISSED, 0));
    TEST_ASSERT_EQUAL_INT (-1, set_int (options, QLINK_HEARTBEAT_TIMEOUT, -2));
    TEST_ASSERT_EQUAL_INT (-1, set_int (options, QLINK_BACKPRESSURE, 7));
    TEST_ASSERT_EQUAL_INT (-1,
                           set_int (options, QLINK_HEARTBEAT_DATA_LIVENESS, 2));
    TEST_ASSERT_EQUAL_INT (-1, set_int (options, 9999, 1));

    //  Rejected values leave the option untouched.
    TEST_ASSERT_EQUAL_INT (16384, get_int (options, QLINK_MAX_CHUNK_SIZE));
}

void test_wrong_value_size_is_rejected ()
{
    qlink::options_t options;
    const int64_t wide = 5;
    TEST_ASSERT_EQUAL_INT (
      -1, options.setopt (QLINK_MAX_STREAMS, &wide, sizeof wide));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    int value;
    size_t size = 2;
    TEST_ASSERT_EQUAL_INT (-1,
                           options.getopt (QLINK_MAX_STREAMS, &value, &size));
}

void test_identity_round_trip ()
{
    qlink::options_t options;
    TEST_ASSERT_EQUAL_INT (0, options.setopt (QLINK_IDENTITY, "feed-a", 6));

    char buffer[32];
    size_t size = sizeof buffer;
    TEST_ASSERT_EQUAL_INT (0, options.getopt (QLINK_IDENTITY, buffer, &size));
    TEST_ASSERT_EQUAL_UINT (6, size);
    TEST_ASSERT_EQUAL_MEMORY ("feed-a", buffer, 6);

    //  Buffer too small.
    size = 3;
    TEST_ASSERT_EQUAL_INT (-1, options.getopt (QLINK_IDENTITY, buffer, &size));

    char huge[300];
    memset (huge, 'x', sizeof huge);
    TEST_ASSERT_EQUAL_INT (
      -1, options.setopt (QLINK_IDENTITY, huge, sizeof huge));
}

void test_tls_strings ()
{
    qlink::options_t options;
    TEST_ASSERT_TRUE (options.tls_ca.empty ());

    const std::string path ("/etc/qlink/ca.pem");
    TEST_ASSERT_EQUAL_INT (
      0, options.setopt (QLINK_TLS_CA, path.data (), path.size ()));
    TEST_ASSERT_EQUAL_STRING (path.c_str (), options.tls_ca.c_str ());

    //  Unlike the identity, certificates have no length cap.
    const std::string pem (8192, 'p');
    TEST_ASSERT_EQUAL_INT (
      0, options.setopt (QLINK_TLS_CERT, pem.data (), pem.size ()));
    TEST_ASSERT_EQUAL_UINT (pem.size (), options.tls_cert.size ());

    TEST_ASSERT_EQUAL_INT (0, options.setopt (QLINK_TLS_CA, NULL, 0));
    TEST_ASSERT_TRUE (options.tls_ca.empty ());
    TEST_ASSERT_EQUAL_INT (-1, options.setopt (QLINK_TLS_KEY, NULL, 4));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
}

void test_boolean_option ()
{
    qlink::options_t options;
    TEST_ASSERT_EQUAL_INT (
      0, set_int (options, QLINK_HEARTBEAT_DATA_LIVENESS, 1));
    TEST_ASSERT_TRUE (options.heartbeat_data_liveness);
    TEST_ASSERT_EQUAL_INT (1,
                           get_int (options, QLINK_HEARTBEAT_DATA_LIVENESS));
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_defaults);
    RUN_TEST (test_heartbeat_timeout_falls_back_to_interval);
    RUN_TEST (test_out_of_range_values_are_rejected);
    RUN_TEST (test_wrong_value_size_is_rejected);
    RUN_TEST (test_identity_round_trip);
    RUN_TEST (test_tls_strings);
    RUN_TEST (test_boolean_option);
    return UNITY_END ();
}
