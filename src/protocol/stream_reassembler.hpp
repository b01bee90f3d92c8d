/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_STREAM_REASSEMBLER_HPP_INCLUDED__
#define __QLINK_STREAM_REASSEMBLER_HPP_INCLUDED__

#include "protocol/chunk.hpp"
#include "utils/macros.hpp"

#include <string>

namespace qlink
{
//  Per-stream state machine turning chunk bytes back into messages. A
//  stream carries one message at a time; its chunks arrive in order.
//
//    idle --first chunk--> accumulating --last chunk--> complete
//    complete --take--> idle
//    any violation --> error (partial data discarded)

class stream_reassembler_t
{
  public:
    enum state_t
    {
        idle,
        accumulating,
        complete,
        error
    };

    explicit stream_reassembler_t (size_t max_chunk_size_);

    //  Feeds one decoded chunk. Returns 1 when the message is complete,
    //  0 when more chunks are expected and -1 with errno QLINK_EMALFORMED
    //  when the chunk breaks ordering or message boundaries.
    int push (const chunk_t &chunk_);

    //  Feeds raw stream bytes, which may split chunks anywhere. Consumes
    //  input up to the end of a completed message and stores the number of
    //  bytes used in processed_; the caller takes the message and feeds
    //  the remainder. Same return values as push.
    int decode (const unsigned char *data_, size_t size_, size_t *processed_);

    //  Hands out the completed message and returns to idle. Returns -1
    //  with errno EAGAIN when no message is complete.
    int take (message_id_t *id_, std::string *payload_);

    //  Drops any partial state and returns to idle.
    void reset ();

    state_t state () const { return _state; }

  private:
    void header_ready ();
    int fail ();

    const size_t _max_chunk_size;
    state_t _state;

    //  Message being accumulated.
    message_id_t _id;
    uint32_t _next_sequence;
    uint32_t _total;
    std::string _payload;

    //  Chunk being parsed from bytes.
    unsigned char _header[chunk_header_size];
    size_t _header_bytes;
    bool _in_payload;
    size_t _payload_size;
    chunk_t _chunk;

    QLINK_NON_COPYABLE_NOR_MOVABLE (stream_reassembler_t)
};
}

#endif
