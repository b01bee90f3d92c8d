/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/chunk_codec.hpp"
#include "utils/err.hpp"
#include "utils/random.hpp"
#include "utils/wire.hpp"
#include "qlink.h"

#include <algorithm>

qlink::message_id_t qlink::message_id_t::zero ()
{
    message_id_t id;
    memset (id.data, 0, message_id_size);
    return id;
}

qlink::message_id_t qlink::message_id_t::generate ()
{
    message_id_t id;
    do {
        generate_random_bytes (id.data, message_id_size);
    } while (id.is_zero ());
    return id;
}

bool qlink::message_id_t::is_zero () const
{
    for (size_t i = 0; i < message_id_size; i++)
        if (data[i] != 0)
            return false;
    return true;
}

int qlink::encode_message (const void *data_,
                           size_t size_,
                           size_t max_chunk_size_,
                           const message_id_t &id_,
                           std::vector<chunk_t> *chunks_)
{
    if (max_chunk_size_ == 0) {
        errno = EINVAL;
        return -1;
    }

    const size_t count =
      size_ == 0 ? 1 : (size_ + max_chunk_size_ - 1) / max_chunk_size_;
    const char *ptr = static_cast<const char *> (data_);

    chunks_->clear ();
    chunks_->reserve (count);
    for (size_t i = 0; i < count; i++) {
        chunk_t chunk;
        chunk.id = id_;
        chunk.sequence = static_cast<uint32_t> (i);
        chunk.total = static_cast<uint32_t> (count);
        const size_t offset = i * max_chunk_size_;
        const size_t len = std::min (max_chunk_size_, size_ - offset);
        if (len > 0)
            chunk.payload.assign (ptr + offset, len);
        chunks_->push_back (chunk);
    }
    return 0;
}

void qlink::encode_chunk (const chunk_t &chunk_,
                          std::vector<unsigned char> *out_)
{
    const size_t offset = out_->size ();
    out_->resize (offset + chunk_header_size + chunk_.payload.size ());
    unsigned char *ptr = &(*out_)[offset];

    memcpy (ptr, chunk_.id.data, message_id_size);
    put_uint32 (ptr + 16, chunk_.sequence);
    put_uint32 (ptr + 20, chunk_.total);
    put_uint32 (ptr + 24, static_cast<uint32_t> (chunk_.payload.size ()));
    if (!chunk_.payload.empty ())
        memcpy (ptr + chunk_header_size, chunk_.payload.data (),
                chunk_.payload.size ());
}

int qlink::decode_chunk (const unsigned char *data_,
                         size_t size_,
                         chunk_t *chunk_)
{
    if (size_ < chunk_header_size) {
        errno = QLINK_EMALFORMED;
        return -1;
    }

    const uint32_t sequence = get_uint32 (data_ + 16);
    const uint32_t total = get_uint32 (data_ + 20);
    const size_t payload_len = get_uint32 (data_ + 24);
    if (payload_len != size_ - chunk_header_size || sequence >= total) {
        errno = QLINK_EMALFORMED;
        return -1;
    }

    memcpy (chunk_->id.data, data_, message_id_size);
    chunk_->sequence = sequence;
    chunk_->total = total;
    chunk_->payload.assign (
      reinterpret_cast<const char *> (data_ + chunk_header_size), payload_len);
    return 0;
}

int qlink::decode_all (const std::vector<chunk_t> &chunks_,
                       std::string *payload_)
{
    if (chunks_.empty () || chunks_.front ().total != chunks_.size ()) {
        errno = QLINK_EMALFORMED;
        return -1;
    }

    std::string payload;
    for (size_t i = 0; i < chunks_.size (); i++) {
        const chunk_t &chunk = chunks_[i];
        if (chunk.id != chunks_.front ().id || chunk.sequence != i
            || chunk.total != chunks_.size ()) {
            errno = QLINK_EMALFORMED;
            return -1;
        }
        payload.append (chunk.payload);
    }
    payload_->swap (payload);
    return 0;
}
