/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_CHUNK_HPP_INCLUDED__
#define __QLINK_CHUNK_HPP_INCLUDED__

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <string>

namespace qlink
{
const size_t message_id_size = 16;

//  [message_id:16][sequence_index:4][total_count:4][payload_length:4]
const size_t chunk_header_size = 28;

struct message_id_t
{
    unsigned char data[message_id_size];

    //  All-zero id, reserved for heartbeat frames.
    static message_id_t zero ();

    //  Fresh random id for an outbound message. Never zero.
    static message_id_t generate ();

    bool is_zero () const;

    bool operator== (const message_id_t &other_) const
    {
        return memcmp (data, other_.data, message_id_size) == 0;
    }
    bool operator!= (const message_id_t &other_) const
    {
        return !(*this == other_);
    }
};

//  One bounded slice of a message as it travels on a stream.
struct chunk_t
{
    message_id_t id;
    uint32_t sequence;
    uint32_t total;
    std::string payload;
};
}

#endif
