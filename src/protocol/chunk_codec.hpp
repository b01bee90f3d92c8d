/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_CHUNK_CODEC_HPP_INCLUDED__
#define __QLINK_CHUNK_CODEC_HPP_INCLUDED__

#include "protocol/chunk.hpp"

#include <vector>

namespace qlink
{
//  Splits size_ bytes into ceil(size_ / max_chunk_size_) chunks carrying
//  id_. An empty message still yields one chunk with total 1. Returns -1
//  with errno EINVAL when max_chunk_size_ is 0.
int encode_message (const void *data_,
                    size_t size_,
                    size_t max_chunk_size_,
                    const message_id_t &id_,
                    std::vector<chunk_t> *chunks_);

//  Appends the wire form of chunk_ to out_.
void encode_chunk (const chunk_t &chunk_, std::vector<unsigned char> *out_);

//  Parses exactly one wire chunk. Returns -1 with errno QLINK_EMALFORMED if
//  the buffer is shorter than a header, the declared payload length does
//  not match the bytes present, or sequence >= total.
int decode_chunk (const unsigned char *data_, size_t size_, chunk_t *chunk_);

//  Joins a complete, ordered chunk sequence back into the message payload.
//  Returns -1 with errno QLINK_EMALFORMED if ids differ, indices are not
//  0..n-1 or the counts disagree.
int decode_all (const std::vector<chunk_t> &chunks_, std::string *payload_);
}

#endif
