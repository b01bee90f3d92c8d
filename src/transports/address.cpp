/* SPDX-License-Identifier: MPL-2.0 */

#include "transports/address.hpp"
#include "utils/err.hpp"

int qlink::address_t::parse (const std::string &endpoint_)
{
    const std::string::size_type pos = endpoint_.find ("://");
    if (pos == std::string::npos) {
        errno = EINVAL;
        return -1;
    }
    const std::string proto = endpoint_.substr (0, pos);
    const std::string addr = endpoint_.substr (pos + 3);
    if (proto.empty () || addr.empty ()) {
        errno = EINVAL;
        return -1;
    }
    if (proto != protocol_name::inproc && proto != protocol_name::tcp
        && proto != protocol_name::tls) {
        errno = EPROTONOSUPPORT;
        return -1;
    }
    protocol = proto;
    address = addr;
    return 0;
}

int qlink::address_t::host_port (std::string *host_, std::string *port_) const
{
    const std::string::size_type pos = address.rfind (':');
    if (pos == std::string::npos || pos == 0 || pos + 1 == address.size ()) {
        errno = EINVAL;
        return -1;
    }
    std::string host = address.substr (0, pos);

    //  Bracketed IPv6 literal.
    if (host.size () > 2 && host[0] == '[' && host[host.size () - 1] == ']')
        host = host.substr (1, host.size () - 2);

    *host_ = host;
    *port_ = address.substr (pos + 1);
    return 0;
}
