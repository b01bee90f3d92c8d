/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/chunk_codec.hpp"
#include "protocol/stream_reassembler.hpp"
#include "qlink.h"

#include <unity.h>
#include <string.h>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static std::vector<qlink::chunk_t>
split (const char *data_, size_t max_chunk_size_, unsigned char fill_)
{
    qlink::message_id_t id;
    memset (id.data, fill_, qlink::message_id_size);
    std::vector<qlink::chunk_t> chunks;
    const int rc = qlink::encode_message (data_, strlen (data_),
                                          max_chunk_size_, id, &chunks);
    TEST_ASSERT_EQUAL_INT (0, rc);
    return chunks;
}

static std::vector<unsigned char>
to_wire (const std::vector<qlink::chunk_t> &chunks_)
{
    std::vector<unsigned char> wire;
    for (size_t i = 0; i < chunks_.size (); i++)
        qlink::encode_chunk (chunks_[i], &wire);
    return wire;
}

void test_push_reassembles_in_order ()
{
    const std::vector<qlink::chunk_t> chunks = split ("HELLOWORLD", 4, 1);
    qlink::stream_reassembler_t reassembler (4);

    TEST_ASSERT_EQUAL_INT (0, reassembler.push (chunks[0]));
    TEST_ASSERT_EQUAL_INT (qlink::stream_reassembler_t::accumulating,
                           reassembler.state ());
    TEST_ASSERT_EQUAL_INT (0, reassembler.push (chunks[1]));
    TEST_ASSERT_EQUAL_INT (1, reassembler.push (chunks[2]));
    TEST_ASSERT_EQUAL_INT (qlink::stream_reassembler_t::complete,
                           reassembler.state ());

    qlink::message_id_t id;
    std::string payload;
    TEST_ASSERT_EQUAL_INT (0, reassembler.take (&id, &payload));
    TEST_ASSERT_EQUAL_STRING ("HELLOWORLD", payload.c_str ());
    TEST_ASSERT_TRUE (id == chunks[0].id);
    TEST_ASSERT_EQUAL_INT (qlink::stream_reassembler_t::idle,
                           reassembler.state ());
}

void test_single_chunk_completes_immediately ()
{
    const std::vector<qlink::chunk_t> chunks = split ("tick", 16, 2);
    qlink::stream_reassembler_t reassembler (16);
    TEST_ASSERT_EQUAL_INT (1, reassembler.push (chunks[0]));
}

void test_interleaved_messages_are_an_error ()
{
    const std::vector<qlink::chunk_t> first = split ("AAAABBBB", 4, 1);
    const std::vector<qlink::chunk_t> second = split ("CCCCDDDD", 4, 2);
    qlink::stream_reassembler_t reassembler (4);

    TEST_ASSERT_EQUAL_INT (0, reassembler.push (first[0]));
    TEST_ASSERT_EQUAL_INT (-1, reassembler.push (second[0]));
    TEST_ASSERT_EQUAL_INT (QLINK_EMALFORMED, errno);
    TEST_ASSERT_EQUAL_INT (qlink::stream_reassembler_t::error,
                           reassembler.state ());

    //  Partial data is never handed out.
    qlink::message_id_t id;
    std::string payload;
    TEST_ASSERT_EQUAL_INT (-1, reassembler.take (&id, &payload));
    TEST_ASSERT_EQUAL_INT (EAGAIN, errno);
}

void test_out_of_order_chunk_is_an_error ()
{
    const std::vector<qlink::chunk_t> chunks = split ("HELLOWORLD", 4, 1);
    qlink::stream_reassembler_t reassembler (4);
    TEST_ASSERT_EQUAL_INT (0, reassembler.push (chunks[0]));
    TEST_ASSERT_EQUAL_INT (-1, reassembler.push (chunks[2]));
    TEST_ASSERT_EQUAL_INT (QLINK_EMALFORMED, errno);
}

void test_first_chunk_must_start_the_message ()
{
    const std::vector<qlink::chunk_t> chunks = split ("HELLOWORLD", 4, 1);
    qlink::stream_reassembler_t reassembler (4);
    TEST_ASSERT_EQUAL_INT (-1, reassembler.push (chunks[1]));
    TEST_ASSERT_EQUAL_INT (QLINK_EMALFORMED, errno);
}

void test_changed_total_is_an_error ()
{
    std::vector<qlink::chunk_t> chunks = split ("HELLOWORLD", 4, 1);
    chunks[1].total = 4;
    qlink::stream_reassembler_t reassembler (4);
    TEST_ASSERT_EQUAL_INT (0, reassembler.push (chunks[0]));
    TEST_ASSERT_EQUAL_INT (-1, reassembler.push (chunks[1]));
}

void test_push_while_complete_is_an_error ()
{
    const std::vector<qlink::chunk_t> a = split ("one", 16, 1);
    const std::vector<qlink::chunk_t> b = split ("two", 16, 2);
    qlink::stream_reassembler_t reassembler (16);
    TEST_ASSERT_EQUAL_INT (1, reassembler.push (a[0]));
    TEST_ASSERT_EQUAL_INT (-1, reassembler.push (b[0]));
    TEST_ASSERT_EQUAL_INT (QLINK_EMALFORMED, errno);
}

void test_reset_recovers_from_error ()
{
    const std::vector<qlink::chunk_t> chunks = split ("HELLOWORLD", 4, 1);
    qlink::stream_reassembler_t reassembler (4);
    TEST_ASSERT_EQUAL_INT (-1, reassembler.push (chunks[1]));
    reassembler.reset ();
    TEST_ASSERT_EQUAL_INT (qlink::stream_reassembler_t::idle,
                           reassembler.state ());
    TEST_ASSERT_EQUAL_INT (0, reassembler.push (chunks[0]));
}

void test_decode_byte_at_a_time ()
{
    const std::vector<unsigned char> wire =
      to_wire (split ("HELLOWORLD", 4, 5));
    qlink::stream_reassembler_t reassembler (4);

    int rc = 0;
    for (size_t i = 0; i < wire.size (); i++) {
        size_t processed = 0;
        rc = reassembler.decode (&wire[i], 1, &processed);
        TEST_ASSERT_EQUAL_UINT (1, processed);
        if (i + 1 < wire.size ())
            TEST_ASSERT_EQUAL_INT (0, rc);
    }
    TEST_ASSERT_EQUAL_INT (1, rc);

    qlink::message_id_t id;
    std::string payload;
    TEST_ASSERT_EQUAL_INT (0, reassembler.take (&id, &payload));
    TEST_ASSERT_EQUAL_STRING ("HELLOWORLD", payload.c_str ());
}

void test_decode_stops_after_each_message ()
{
    std::vector<unsigned char> wire = to_wire (split ("first", 3, 1));
    const std::vector<unsigned char> second = to_wire (split ("second", 3, 2));
    wire.insert (wire.end (), second.begin (), second.end ());

    qlink::stream_reassembler_t reassembler (3);
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (1,
                           reassembler.decode (&wire[0], wire.size (), &processed));
    TEST_ASSERT_EQUAL_UINT (wire.size () - second.size (), processed);

    qlink::message_id_t id;
    std::string payload;
    TEST_ASSERT_EQUAL_INT (0, reassembler.take (&id, &payload));
    TEST_ASSERT_EQUAL_STRING ("first", payload.c_str ());

    size_t rest = 0;
    TEST_ASSERT_EQUAL_INT (1, reassembler.decode (&wire[processed],
                                                  wire.size () - processed,
                                                  &rest));
    TEST_ASSERT_EQUAL_UINT (second.size (), rest);
    TEST_ASSERT_EQUAL_INT (0, reassembler.take (&id, &payload));
    TEST_ASSERT_EQUAL_STRING ("second", payload.c_str ());
}

void test_decode_rejects_oversized_chunk ()
{
    const std::vector<unsigned char> wire = to_wire (split ("HELLOWORLD", 8, 1));
    qlink::stream_reassembler_t reassembler (4);
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (-1,
                           reassembler.decode (&wire[0], wire.size (), &processed));
    TEST_ASSERT_EQUAL_INT (QLINK_EMALFORMED, errno);
}

void test_decode_rejects_interleaved_bytes ()
{
    const std::vector<qlink::chunk_t> a = split ("AAAABBBB", 4, 1);
    const std::vector<qlink::chunk_t> b = split ("CCCCDDDD", 4, 2);
    std::vector<qlink::chunk_t> mixed;
    mixed.push_back (a[0]);
    mixed.push_back (b[0]);
    const std::vector<unsigned char> wire = to_wire (mixed);

    qlink::stream_reassembler_t reassembler (4);
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (-1,
                           reassembler.decode (&wire[0], wire.size (), &processed));
    TEST_ASSERT_EQUAL_INT (qlink::stream_reassembler_t::error,
                           reassembler.state ());
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_push_reassembles_in_order);
    RUN_TEST (test_single_chunk_completes_immediately);
    RUN_TEST (test_interleaved_messages_are_an_error);
    RUN_TEST (test_out_of_order_chunk_is_an_error);
    RUN_TEST (test_first_chunk_must_start_the_message);
    RUN_TEST (test_changed_total_is_an_error);
    RUN_TEST (test_push_while_complete_is_an_error);
    RUN_TEST (test_reset_recovers_from_error);
    RUN_TEST (test_decode_byte_at_a_time);
    RUN_TEST (test_decode_stops_after_each_message);
    RUN_TEST (test_decode_rejects_oversized_chunk);
    RUN_TEST (test_decode_rejects_interleaved_bytes);
    return UNITY_END ();
}
