/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_ADDRESS_HPP_INCLUDED__
#define __QLINK_ADDRESS_HPP_INCLUDED__

#include <string>

namespace qlink
{
namespace protocol_name
{
static const char inproc[] = "inproc";
static const char tcp[] = "tcp";
static const char tls[] = "tls";
}

//  Endpoint of the form "protocol://address".
struct address_t
{
    address_t () {}

    //  Splits an endpoint string. Returns -1 with errno EINVAL if the
    //  string is malformed and EPROTONOSUPPORT if the protocol is unknown.
    int parse (const std::string &endpoint_);

    //  For tcp and tls, splits address into host and port. Returns -1 with
    //  errno EINVAL if either part is missing.
    int host_port (std::string *host_, std::string *port_) const;

    //  True for the protocols carried over a TCP socket.
    bool is_stream () const
    {
        return protocol == protocol_name::tcp
               || protocol == protocol_name::tls;
    }

    std::string to_string () const { return protocol + "://" + address; }

    std::string protocol;
    std::string address;
};
}

#endif
