/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_HEARTBEAT_HPP_INCLUDED__
#define __QLINK_HEARTBEAT_HPP_INCLUDED__

#include "protocol/chunk.hpp"

namespace qlink
{
//  Heartbeat frames reuse the chunk layout with the reserved all-zero id
//  and total 1. A ping has no payload; a pong carries one ack byte.
const unsigned char heartbeat_ack = 0x01;

inline chunk_t make_heartbeat_ping ()
{
    chunk_t chunk;
    chunk.id = message_id_t::zero ();
    chunk.sequence = 0;
    chunk.total = 1;
    return chunk;
}

inline chunk_t make_heartbeat_pong ()
{
    chunk_t chunk = make_heartbeat_ping ();
    chunk.payload.assign (1, static_cast<char> (heartbeat_ack));
    return chunk;
}

inline bool is_heartbeat_ping (const message_id_t &id_,
                               const std::string &payload_)
{
    return id_.is_zero () && payload_.empty ();
}

inline bool is_heartbeat_pong (const message_id_t &id_,
                               const std::string &payload_)
{
    return id_.is_zero () && payload_.size () == 1
           && static_cast<unsigned char> (payload_[0]) == heartbeat_ack;
}
}

#endif
