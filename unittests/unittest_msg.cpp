/* SPDX-License-Identifier: MPL-2.0 */

#include "core/msg.hpp"
#include "utils/wire.hpp"
#include "qlink.h"

#include <unity.h>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

void test_header_layout ()
{
    const qlink::msg_t msg (QLINK_MSG_PUBLISH, 0x0102030405060708ULL, "ticks",
                            "px=1", 4, 0x10);
    std::vector<unsigned char> out;
    msg.encode (&out);

    TEST_ASSERT_EQUAL_UINT (qlink::msg_header_size + 5 + 4, out.size ());
    TEST_ASSERT_EQUAL_UINT (msg.encoded_size (), out.size ());
    TEST_ASSERT_EQUAL_HEX8 (qlink::msg_version, out[0]);
    TEST_ASSERT_EQUAL_HEX8 (QLINK_MSG_PUBLISH, out[1]);
    TEST_ASSERT_EQUAL_HEX8 (0x10, out[2]);
    TEST_ASSERT_EQUAL_HEX8 (0, out[3]);
    TEST_ASSERT_EQUAL_HEX8 (0x01, out[4]);
    TEST_ASSERT_EQUAL_HEX8 (0x08, out[11]);
    TEST_ASSERT_EQUAL_UINT16 (5, qlink::get_uint16 (&out[12]));
    TEST_ASSERT_EQUAL_UINT32 (4, qlink::get_uint32 (&out[14]));
    TEST_ASSERT_EQUAL_MEMORY ("ticks", &out[18], 5);
    TEST_ASSERT_EQUAL_MEMORY ("px=1", &out[23], 4);
}

void test_decode_restores_fields ()
{
    const qlink::msg_t msg (QLINK_MSG_REQUEST, 77, "", "ping", 4);
    std::vector<unsigned char> out;
    msg.encode (&out);

    qlink::msg_t decoded;
    TEST_ASSERT_EQUAL_INT (
      0, qlink::msg_t::decode (&out[0], out.size (), &decoded));
    TEST_ASSERT_EQUAL_INT (QLINK_MSG_REQUEST, decoded.type ());
    TEST_ASSERT_EQUAL_UINT64 (77, decoded.correlation_id ());
    TEST_ASSERT_TRUE (decoded.topic ().empty ());
    TEST_ASSERT_EQUAL_STRING ("ping", decoded.body ().c_str ());
}

void test_decode_rejects_bad_input ()
{
    const qlink::msg_t msg (QLINK_MSG_DATA, 0, "t", "abc", 3);
    std::vector<unsigned char> out;
    msg.encode (&out);
    qlink::msg_t decoded;

    TEST_ASSERT_EQUAL_INT (
      -1, qlink::msg_t::decode (&out[0], qlink::msg_header_size - 1, &decoded));
    TEST_ASSERT_EQUAL_INT (EPROTO, errno);

    TEST_ASSERT_EQUAL_INT (
      -1, qlink::msg_t::decode (&out[0], out.size () - 1, &decoded));
    TEST_ASSERT_EQUAL_INT (EPROTO, errno);

    std::vector<unsigned char> bad_version = out;
    bad_version[0] = 9;
    TEST_ASSERT_EQUAL_INT (-1, qlink::msg_t::decode (&bad_version[0],
                                                     bad_version.size (),
                                                     &decoded));

    std::vector<unsigned char> bad_type = out;
    bad_type[1] = 0;
    TEST_ASSERT_EQUAL_INT (
      -1, qlink::msg_t::decode (&bad_type[0], bad_type.size (), &decoded));
    bad_type[1] = QLINK_MSG_REPLY + 1;
    TEST_ASSERT_EQUAL_INT (
      -1, qlink::msg_t::decode (&bad_type[0], bad_type.size (), &decoded));
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_header_layout);
    RUN_TEST (test_decode_restores_fields);
    RUN_TEST (test_decode_rejects_bad_input);
    return UNITY_END ();
}
