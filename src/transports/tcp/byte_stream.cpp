/* SPDX-License-Identifier: MPL-2.0 */

#include "transports/tcp/byte_stream.hpp"
#include "utils/debug.hpp"

#include <boost/asio/write.hpp>

#include <stdio.h>

qlink::tcp_stream_t::tcp_stream_t (boost::asio::ip::tcp::socket socket_) :
    _socket (std::move (socket_))
{
}

qlink::tcp_stream_t::~tcp_stream_t ()
{
    close ();
}

void qlink::tcp_stream_t::async_read_some (unsigned char *buffer_,
                                           std::size_t size_,
                                           const completion_handler_t &handler_)
{
    _socket.async_read_some (boost::asio::buffer (buffer_, size_), handler_);
}

void qlink::tcp_stream_t::async_write (
  const std::vector<boost::asio::const_buffer> &buffers_,
  const completion_handler_t &handler_)
{
    boost::asio::async_write (_socket, buffers_, handler_);
}

void qlink::tcp_stream_t::close ()
{
    boost::system::error_code ec;
    _socket.close (ec);
}

std::string
qlink::format_endpoint (const char *scheme_,
                        const boost::asio::ip::tcp::endpoint &endpoint_)
{
    const boost::asio::ip::address address = endpoint_.address ();
    char port[16];
    snprintf (port, sizeof port, "%u",
              static_cast<unsigned int> (endpoint_.port ()));
    if (address.is_v6 ())
        return std::string (scheme_) + "://[" + address.to_string () + "]:"
               + port;
    return std::string (scheme_) + "://" + address.to_string () + ":" + port;
}

void qlink::set_no_delay (boost::asio::ip::tcp::socket &socket_)
{
    boost::system::error_code ec;
    socket_.set_option (boost::asio::ip::tcp::no_delay (true), ec);
    if (ec)
        QLINK_GLOBAL_WARN ("TCP_NODELAY failed: %s", ec.message ().c_str ());
}
