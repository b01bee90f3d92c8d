/* SPDX-License-Identifier: MPL-2.0 */

#include "core/msg.hpp"
#include "utils/err.hpp"
#include "utils/wire.hpp"
#include "qlink.h"

qlink::msg_t::msg_t () : _type (QLINK_MSG_DATA), _flags (0), _correlation_id (0)
{
}

qlink::msg_t::msg_t (int type_,
                     uint64_t correlation_id_,
                     const std::string &topic_,
                     const void *body_,
                     size_t body_size_,
                     unsigned char flags_) :
    _type (type_),
    _flags (flags_),
    _correlation_id (correlation_id_),
    _topic (topic_)
{
    qlink_assert (valid_type (type_));
    qlink_assert (topic_.size () <= msg_max_topic_size);
    if (body_size_ > 0)
        _body.assign (static_cast<const char *> (body_), body_size_);
}

bool qlink::msg_t::valid_type (int type_)
{
    return type_ >= QLINK_MSG_HELLO && type_ <= QLINK_MSG_REPLY;
}

size_t qlink::msg_t::encoded_size () const
{
    return msg_header_size + _topic.size () + _body.size ();
}

void qlink::msg_t::encode (std::vector<unsigned char> *out_) const
{
    const size_t offset = out_->size ();
    out_->resize (offset + encoded_size ());
    unsigned char *ptr = &(*out_)[offset];

    put_uint8 (ptr, msg_version);
    put_uint8 (ptr + 1, static_cast<uint8_t> (_type));
    put_uint8 (ptr + 2, _flags);
    put_uint8 (ptr + 3, 0);
    put_uint64 (ptr + 4, _correlation_id);
    put_uint16 (ptr + 12, static_cast<uint16_t> (_topic.size ()));
    put_uint32 (ptr + 14, static_cast<uint32_t> (_body.size ()));
    ptr += msg_header_size;

    if (!_topic.empty ()) {
        memcpy (ptr, _topic.data (), _topic.size ());
        ptr += _topic.size ();
    }
    if (!_body.empty ())
        memcpy (ptr, _body.data (), _body.size ());
}

int qlink::msg_t::decode (const unsigned char *data_,
                          size_t size_,
                          msg_t *msg_)
{
    if (size_ < msg_header_size || get_uint8 (data_) != msg_version) {
        errno = EPROTO;
        return -1;
    }

    const int type = get_uint8 (data_ + 1);
    const size_t topic_len = get_uint16 (data_ + 12);
    const size_t body_len = get_uint32 (data_ + 14);
    if (!valid_type (type) || size_ != msg_header_size + topic_len + body_len) {
        errno = EPROTO;
        return -1;
    }

    const char *ptr = reinterpret_cast<const char *> (data_ + msg_header_size);
    msg_->_type = type;
    msg_->_flags = get_uint8 (data_ + 2);
    msg_->_correlation_id = get_uint64 (data_ + 4);
    msg_->_topic.assign (ptr, topic_len);
    msg_->_body.assign (ptr + topic_len, body_len);
    return 0;
}
