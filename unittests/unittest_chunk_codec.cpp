/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/chunk.hpp"
#include "protocol/chunk_codec.hpp"
#include "protocol/heartbeat.hpp"
#include "protocol/stream_reassembler.hpp"
#include "utils/wire.hpp"
#include "qlink.h"

#include <unity.h>
#include <algorithm>
#include <string.h>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static qlink::message_id_t make_id (unsigned char fill_)
{
    qlink::message_id_t id;
    memset (id.data, fill_, qlink::message_id_size);
    return id;
}

void test_split_into_bounded_chunks ()
{
    const qlink::message_id_t id = make_id (0x42);
    std::vector<qlink::chunk_t> chunks;
    TEST_ASSERT_EQUAL_INT (
      0, qlink::encode_message ("HELLOWORLD", 10, 4, id, &chunks));

    TEST_ASSERT_EQUAL_UINT (3, chunks.size ());
    const char *expected[] = {"HELL", "OWOR", "LD"};
    for (size_t i = 0; i < chunks.size (); i++) {
        TEST_ASSERT_TRUE (chunks[i].id == id);
        TEST_ASSERT_EQUAL_UINT32 (i, chunks[i].sequence);
        TEST_ASSERT_EQUAL_UINT32 (3, chunks[i].total);
        TEST_ASSERT_EQUAL_STRING (expected[i], chunks[i].payload.c_str ());
    }
}

void test_exact_multiple_has_no_trailing_chunk ()
{
    std::vector<qlink::chunk_t> chunks;
    TEST_ASSERT_EQUAL_INT (
      0, qlink::encode_message ("ABCDEFGH", 8, 4, make_id (1), &chunks));
    TEST_ASSERT_EQUAL_UINT (2, chunks.size ());
    TEST_ASSERT_EQUAL_STRING ("EFGH", chunks[1].payload.c_str ());
}

void test_empty_message_is_one_chunk ()
{
    std::vector<qlink::chunk_t> chunks;
    TEST_ASSERT_EQUAL_INT (
      0, qlink::encode_message (NULL, 0, 16, make_id (7), &chunks));
    TEST_ASSERT_EQUAL_UINT (1, chunks.size ());
    TEST_ASSERT_EQUAL_UINT32 (0, chunks[0].sequence);
    TEST_ASSERT_EQUAL_UINT32 (1, chunks[0].total);
    TEST_ASSERT_TRUE (chunks[0].payload.empty ());
}

void test_zero_chunk_size_is_rejected ()
{
    std::vector<qlink::chunk_t> chunks;
    TEST_ASSERT_EQUAL_INT (
      -1, qlink::encode_message ("abc", 3, 0, make_id (1), &chunks));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
}

void test_wire_layout_is_big_endian ()
{
    qlink::chunk_t chunk;
    chunk.id = make_id (0xAB);
    chunk.sequence = 2;
    chunk.total = 5;
    chunk.payload = "xyz";

    std::vector<unsigned char> wire;
    qlink::encode_chunk (chunk, &wire);

    TEST_ASSERT_EQUAL_UINT (qlink::chunk_header_size + 3, wire.size ());
    for (size_t i = 0; i < qlink::message_id_size; i++)
        TEST_ASSERT_EQUAL_HEX8 (0xAB, wire[i]);
    const unsigned char counters[] = {0, 0, 0, 2, 0, 0, 0, 5, 0, 0, 0, 3};
    TEST_ASSERT_EQUAL_UINT8_ARRAY (counters, &wire[16], sizeof counters);
    TEST_ASSERT_EQUAL_MEMORY ("xyz", &wire[28], 3);
}

void test_encode_chunk_appends ()
{
    std::vector<qlink::chunk_t> chunks;
    TEST_ASSERT_EQUAL_INT (
      0, qlink::encode_message ("abcdef", 6, 3, make_id (9), &chunks));

    std::vector<unsigned char> wire;
    qlink::encode_chunk (chunks[0], &wire);
    qlink::encode_chunk (chunks[1], &wire);
    TEST_ASSERT_EQUAL_UINT (2 * (qlink::chunk_header_size + 3), wire.size ());

    qlink::chunk_t second;
    TEST_ASSERT_EQUAL_INT (
      0, qlink::decode_chunk (&wire[qlink::chunk_header_size + 3],
                              qlink::chunk_header_size + 3, &second));
    TEST_ASSERT_EQUAL_UINT32 (1, second.sequence);
    TEST_ASSERT_EQUAL_STRING ("def", second.payload.c_str ());
}

void test_decode_rejects_short_header ()
{
    const unsigned char buf[10] = {0};
    qlink::chunk_t chunk;
    TEST_ASSERT_EQUAL_INT (-1, qlink::decode_chunk (buf, sizeof buf, &chunk));
    TEST_ASSERT_EQUAL_INT (QLINK_EMALFORMED, errno);
}

void test_decode_rejects_length_mismatch ()
{
    qlink::chunk_t chunk;
    chunk.id = make_id (1);
    chunk.sequence = 0;
    chunk.total = 1;
    chunk.payload = "abcd";
    std::vector<unsigned char> wire;
    qlink::encode_chunk (chunk, &wire);

    qlink::chunk_t decoded;
    //  Declared four payload bytes, only three present.
    TEST_ASSERT_EQUAL_INT (
      -1, qlink::decode_chunk (&wire[0], wire.size () - 1, &decoded));
    TEST_ASSERT_EQUAL_INT (QLINK_EMALFORMED, errno);

    //  Trailing garbage.
    wire.push_back (0);
    TEST_ASSERT_EQUAL_INT (
      -1, qlink::decode_chunk (&wire[0], wire.size (), &decoded));
    TEST_ASSERT_EQUAL_INT (QLINK_EMALFORMED, errno);
}

void test_decode_rejects_sequence_beyond_total ()
{
    qlink::chunk_t chunk;
    chunk.id = make_id (1);
    chunk.sequence = 3;
    chunk.total = 3;
    std::vector<unsigned char> wire;
    qlink::encode_chunk (chunk, &wire);

    qlink::chunk_t decoded;
    TEST_ASSERT_EQUAL_INT (
      -1, qlink::decode_chunk (&wire[0], wire.size (), &decoded));
    TEST_ASSERT_EQUAL_INT (QLINK_EMALFORMED, errno);
}

void test_decode_all_joins_ordered_chunks ()
{
    std::vector<qlink::chunk_t> chunks;
    TEST_ASSERT_EQUAL_INT (
      0, qlink::encode_message ("HELLOWORLD", 10, 4, make_id (3), &chunks));
    std::string payload;
    TEST_ASSERT_EQUAL_INT (0, qlink::decode_all (chunks, &payload));
    TEST_ASSERT_EQUAL_STRING ("HELLOWORLD", payload.c_str ());
}

void test_decode_all_rejects_broken_sequences ()
{
    std::vector<qlink::chunk_t> chunks;
    TEST_ASSERT_EQUAL_INT (
      0, qlink::encode_message ("HELLOWORLD", 10, 4, make_id (3), &chunks));
    std::string payload;

    std::vector<qlink::chunk_t> missing (chunks.begin (), chunks.end () - 1);
    TEST_ASSERT_EQUAL_INT (-1, qlink::decode_all (missing, &payload));
    TEST_ASSERT_EQUAL_INT (QLINK_EMALFORMED, errno);

    std::vector<qlink::chunk_t> swapped = chunks;
    std::swap (swapped[0], swapped[1]);
    TEST_ASSERT_EQUAL_INT (-1, qlink::decode_all (swapped, &payload));
    TEST_ASSERT_EQUAL_INT (QLINK_EMALFORMED, errno);

    std::vector<qlink::chunk_t> mixed = chunks;
    mixed[2].id = make_id (4);
    TEST_ASSERT_EQUAL_INT (-1, qlink::decode_all (mixed, &payload));
    TEST_ASSERT_EQUAL_INT (QLINK_EMALFORMED, errno);

    TEST_ASSERT_EQUAL_INT (
      -1, qlink::decode_all (std::vector<qlink::chunk_t> (), &payload));
}

//  Feeds wire_ to reassembler_ in pieces of step_ bytes and collects the
//  messages it completes.
static std::vector<std::string>
feed_in_pieces (qlink::stream_reassembler_t *reassembler_,
                const std::vector<unsigned char> &wire_,
                size_t step_)
{
    std::vector<std::string> messages;
    size_t offset = 0;
    while (offset < wire_.size ()) {
        const size_t piece = std::min (step_, wire_.size () - offset);
        size_t used = 0;
        while (used < piece) {
            size_t processed = 0;
            const int rc = reassembler_->decode (&wire_[offset + used],
                                                 piece - used, &processed);
            TEST_ASSERT_TRUE (rc >= 0);
            used += processed;
            if (rc == 0) {
                TEST_ASSERT_EQUAL_UINT (piece, used);
                break;
            }
            qlink::message_id_t id;
            std::string payload;
            TEST_ASSERT_EQUAL_INT (0, reassembler_->take (&id, &payload));
            messages.push_back (payload);
        }
        offset += piece;
    }
    return messages;
}

void test_every_length_and_chunk_size_survives_the_wire ()
{
    const size_t max_length = 48;
    for (size_t length = 0; length <= max_length; length++) {
        std::string message (length, 0);
        for (size_t i = 0; i < length; i++)
            message[i] = static_cast<char> ((i * 7 + length) % 256);

        for (size_t chunk_size = 1; chunk_size <= length + 1; chunk_size++) {
            const qlink::message_id_t id = qlink::message_id_t::generate ();
            std::vector<qlink::chunk_t> chunks;
            TEST_ASSERT_EQUAL_INT (
              0, qlink::encode_message (message.data (), length, chunk_size,
                                        id, &chunks));
            const size_t expected_chunks =
              length == 0 ? 1 : (length + chunk_size - 1) / chunk_size;
            TEST_ASSERT_EQUAL_UINT (expected_chunks, chunks.size ());

            std::vector<unsigned char> wire;
            std::vector<qlink::chunk_t> decoded;
            for (size_t i = 0; i < chunks.size (); i++) {
                TEST_ASSERT_TRUE (chunks[i].payload.size () <= chunk_size);
                std::vector<unsigned char> one;
                qlink::encode_chunk (chunks[i], &one);
                qlink::chunk_t back;
                TEST_ASSERT_EQUAL_INT (
                  0, qlink::decode_chunk (&one[0], one.size (), &back));
                TEST_ASSERT_TRUE (back.id == id);
                TEST_ASSERT_EQUAL_UINT32 (i, back.sequence);
                TEST_ASSERT_EQUAL_UINT32 (expected_chunks, back.total);
                decoded.push_back (back);
                wire.insert (wire.end (), one.begin (), one.end ());
            }

            std::string joined;
            TEST_ASSERT_EQUAL_INT (0, qlink::decode_all (decoded, &joined));
            TEST_ASSERT_TRUE (joined == message);

            //  The same bytes arriving in arbitrary slices.
            qlink::stream_reassembler_t reassembler (chunk_size);
            const size_t step = 1 + (length * 3 + chunk_size) % 37;
            const std::vector<std::string> messages =
              feed_in_pieces (&reassembler, wire, step);
            TEST_ASSERT_EQUAL_UINT (1, messages.size ());
            TEST_ASSERT_TRUE (messages[0] == message);
            TEST_ASSERT_EQUAL_INT (qlink::stream_reassembler_t::idle,
                                   reassembler.state ());
        }
    }
}

void test_back_to_back_messages_split_at_every_offset ()
{
    std::vector<unsigned char> wire;
    const char *bodies[] = {"first message", "", "third"};
    for (size_t i = 0; i < 3; i++) {
        std::vector<qlink::chunk_t> chunks;
        TEST_ASSERT_EQUAL_INT (
          0, qlink::encode_message (bodies[i], strlen (bodies[i]), 4,
                                    qlink::message_id_t::generate (), &chunks));
        for (size_t j = 0; j < chunks.size (); j++)
            qlink::encode_chunk (chunks[j], &wire);
    }

    for (size_t split = 1; split < wire.size (); split++) {
        qlink::stream_reassembler_t reassembler (4);
        std::vector<unsigned char> head (wire.begin (), wire.begin () + split);
        std::vector<unsigned char> tail (wire.begin () + split, wire.end ());
        std::vector<std::string> messages =
          feed_in_pieces (&reassembler, head, head.size ());
        const std::vector<std::string> rest =
          feed_in_pieces (&reassembler, tail, tail.size ());
        messages.insert (messages.end (), rest.begin (), rest.end ());

        TEST_ASSERT_EQUAL_UINT (3, messages.size ());
        for (size_t i = 0; i < 3; i++)
            TEST_ASSERT_EQUAL_STRING (bodies[i], messages[i].c_str ());
    }
}

void test_generated_ids_are_distinct_and_nonzero ()
{
    const qlink::message_id_t a = qlink::message_id_t::generate ();
    const qlink::message_id_t b = qlink::message_id_t::generate ();
    TEST_ASSERT_FALSE (a.is_zero ());
    TEST_ASSERT_FALSE (b.is_zero ());
    TEST_ASSERT_TRUE (a != b);
    TEST_ASSERT_TRUE (qlink::message_id_t::zero ().is_zero ());
}

void test_heartbeat_frames ()
{
    std::vector<unsigned char> ping;
    qlink::encode_chunk (qlink::make_heartbeat_ping (), &ping);
    TEST_ASSERT_EQUAL_UINT (qlink::chunk_header_size, ping.size ());
    for (size_t i = 0; i < qlink::message_id_size; i++)
        TEST_ASSERT_EQUAL_HEX8 (0, ping[i]);
    TEST_ASSERT_EQUAL_UINT32 (0, qlink::get_uint32 (&ping[16]));
    TEST_ASSERT_EQUAL_UINT32 (1, qlink::get_uint32 (&ping[20]));
    TEST_ASSERT_EQUAL_UINT32 (0, qlink::get_uint32 (&ping[24]));

    std::vector<unsigned char> pong;
    qlink::encode_chunk (qlink::make_heartbeat_pong (), &pong);
    TEST_ASSERT_EQUAL_UINT (qlink::chunk_header_size + 1, pong.size ());
    TEST_ASSERT_EQUAL_HEX8 (qlink::heartbeat_ack, pong[28]);

    qlink::chunk_t decoded;
    TEST_ASSERT_EQUAL_INT (
      0, qlink::decode_chunk (&pong[0], pong.size (), &decoded));
    TEST_ASSERT_TRUE (qlink::is_heartbeat_pong (decoded.id, decoded.payload));
    TEST_ASSERT_FALSE (qlink::is_heartbeat_ping (decoded.id, decoded.payload));
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_split_into_bounded_chunks);
    RUN_TEST (test_exact_multiple_has_no_trailing_chunk);
    RUN_TEST (test_empty_message_is_one_chunk);
    RUN_TEST (test_zero_chunk_size_is_rejected);
    RUN_TEST (test_wire_layout_is_big_endian);
    RUN_TEST (test_encode_chunk_appends);
    RUN_TEST (test_decode_rejects_short_header);
    RUN_TEST (test_decode_rejects_length_mismatch);
    RUN_TEST (test_decode_rejects_sequence_beyond_total);
    RUN_TEST (test_decode_all_joins_ordered_chunks);
    RUN_TEST (test_decode_all_rejects_broken_sequences);
    RUN_TEST (test_every_length_and_chunk_size_survives_the_wire);
    RUN_TEST (test_back_to_back_messages_split_at_every_offset);
    RUN_TEST (test_generated_ids_are_distinct_and_nonzero);
    RUN_TEST (test_heartbeat_frames);
    return UNITY_END ();
}
