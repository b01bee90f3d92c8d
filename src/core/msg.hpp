/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_MSG_HPP_INCLUDED__
#define __QLINK_MSG_HPP_INCLUDED__

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace qlink
{
//  Version of the message header layout.
const unsigned char msg_version = 1;

//  [version:1][type:1][flags:1][reserved:1][correlation_id:8]
//  [topic_len:2][body_len:4][topic][body]
const size_t msg_header_size = 18;

const size_t msg_max_topic_size = 0xffff;

//  Application message. Immutable once constructed; the encoded form is
//  what gets chunked onto a stream.
class msg_t
{
  public:
    msg_t ();
    msg_t (int type_,
           uint64_t correlation_id_,
           const std::string &topic_,
           const void *body_,
           size_t body_size_,
           unsigned char flags_ = 0);

    int type () const { return _type; }
    unsigned char flags () const { return _flags; }
    uint64_t correlation_id () const { return _correlation_id; }
    const std::string &topic () const { return _topic; }
    const std::string &body () const { return _body; }

    size_t encoded_size () const;

    //  Appends the encoded message to out_.
    void encode (std::vector<unsigned char> *out_) const;

    //  Parses an encoded message. Returns -1 with errno set to EPROTO if
    //  the header is unknown or lengths disagree with the bytes present.
    static int decode (const unsigned char *data_, size_t size_, msg_t *msg_);

    static bool valid_type (int type_);

  private:
    int _type;
    unsigned char _flags;
    uint64_t _correlation_id;
    std::string _topic;
    std::string _body;
};
}

#endif
