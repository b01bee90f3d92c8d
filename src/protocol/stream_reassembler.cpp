/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/stream_reassembler.hpp"
#include "utils/err.hpp"
#include "utils/wire.hpp"
#include "qlink.h"

#include <algorithm>

qlink::stream_reassembler_t::stream_reassembler_t (size_t max_chunk_size_) :
    _max_chunk_size (max_chunk_size_),
    _state (idle),
    _next_sequence (0),
    _total (0),
    _header_bytes (0),
    _in_payload (false),
    _payload_size (0)
{
}

int qlink::stream_reassembler_t::push (const chunk_t &chunk_)
{
    switch (_state) {
        case idle:
            if (chunk_.sequence != 0 || chunk_.total == 0)
                return fail ();
            _id = chunk_.id;
            _total = chunk_.total;
            _payload = chunk_.payload;
            _next_sequence = 1;
            break;

        case accumulating:
            if (chunk_.id != _id || chunk_.sequence != _next_sequence
                || chunk_.total != _total)
                return fail ();
            _payload.append (chunk_.payload);
            _next_sequence++;
            break;

        case complete:
        case error:
            return fail ();
    }

    if (_next_sequence == _total) {
        _state = complete;
        return 1;
    }
    _state = accumulating;
    return 0;
}

int qlink::stream_reassembler_t::decode (const unsigned char *data_,
                                         size_t size_,
                                         size_t *processed_)
{
    *processed_ = 0;
    if (_state == error || _state == complete)
        return fail ();

    while (*processed_ < size_) {
        const unsigned char *ptr = data_ + *processed_;
        const size_t available = size_ - *processed_;

        if (!_in_payload) {
            const size_t n =
              std::min (available, chunk_header_size - _header_bytes);
            memcpy (_header + _header_bytes, ptr, n);
            _header_bytes += n;
            *processed_ += n;
            if (_header_bytes < chunk_header_size)
                return 0;

            header_ready ();
            if (_chunk.sequence >= _chunk.total
                || _payload_size > _max_chunk_size)
                return fail ();
            _in_payload = true;
        } else {
            const size_t n =
              std::min (available, _payload_size - _chunk.payload.size ());
            _chunk.payload.append (reinterpret_cast<const char *> (ptr), n);
            *processed_ += n;
        }

        if (_chunk.payload.size () == _payload_size) {
            _in_payload = false;
            _header_bytes = 0;
            const int rc = push (_chunk);
            _chunk.payload.clear ();
            if (rc != 0)
                return rc;
        }
    }
    return 0;
}

void qlink::stream_reassembler_t::header_ready ()
{
    memcpy (_chunk.id.data, _header, message_id_size);
    _chunk.sequence = get_uint32 (_header + 16);
    _chunk.total = get_uint32 (_header + 20);
    _payload_size = get_uint32 (_header + 24);
    _chunk.payload.clear ();
    _chunk.payload.reserve (std::min (_payload_size, _max_chunk_size));
}

int qlink::stream_reassembler_t::take (message_id_t *id_,
                                       std::string *payload_)
{
    if (_state != complete) {
        errno = EAGAIN;
        return -1;
    }
    *id_ = _id;
    payload_->swap (_payload);
    _payload.clear ();
    _state = idle;
    _next_sequence = 0;
    _total = 0;
    return 0;
}

void qlink::stream_reassembler_t::reset ()
{
    _state = idle;
    _next_sequence = 0;
    _total = 0;
    _payload.clear ();
    _header_bytes = 0;
    _in_payload = false;
    _payload_size = 0;
    _chunk.payload.clear ();
}

int qlink::stream_reassembler_t::fail ()
{
    _state = error;
    _payload.clear ();
    _chunk.payload.clear ();
    errno = QLINK_EMALFORMED;
    return -1;
}
