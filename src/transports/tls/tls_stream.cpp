/* SPDX-License-Identifier: MPL-2.0 */

#include "transports/tls/tls_stream.hpp"
#include "utils/debug.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/write.hpp>

#include <openssl/ssl.h>

qlink::tls_stream_t::tls_stream_t (boost::asio::ip::tcp::socket socket_,
                                   const tls_context_ptr_t &context_) :
    _context (context_),
    _stream (std::move (socket_), *context_)
{
}

qlink::tls_stream_t::~tls_stream_t ()
{
    close ();
}

void qlink::tls_stream_t::async_handshake (bool client_,
                                           const std::string &hostname_,
                                           const handshake_handler_t &handler_)
{
    if (client_ && !hostname_.empty ()) {
        if (!SSL_set_tlsext_host_name (_stream.native_handle (),
                                       hostname_.c_str ())) {
            QLINK_GLOBAL_WARN ("SNI rejected for '%s'", hostname_.c_str ());
            boost::asio::post (lowest_layer ().get_executor (), [handler_] () {
                handler_ (boost::asio::error::invalid_argument);
            });
            return;
        }
        boost::system::error_code ec;
        _stream.set_verify_callback (
          boost::asio::ssl::host_name_verification (hostname_), ec);
        if (ec) {
            QLINK_GLOBAL_WARN ("host name check not installed: %s",
                               ec.message ().c_str ());
            boost::asio::post (lowest_layer ().get_executor (),
                               [handler_, ec] () { handler_ (ec); });
            return;
        }
    }

    _stream.async_handshake (client_ ? boost::asio::ssl::stream_base::client
                                     : boost::asio::ssl::stream_base::server,
                             handler_);
}

void qlink::tls_stream_t::async_read_some (unsigned char *buffer_,
                                           std::size_t size_,
                                           const completion_handler_t &handler_)
{
    _stream.async_read_some (boost::asio::buffer (buffer_, size_), handler_);
}

void qlink::tls_stream_t::async_write (
  const std::vector<boost::asio::const_buffer> &buffers_,
  const completion_handler_t &handler_)
{
    boost::asio::async_write (_stream, buffers_, handler_);
}

void qlink::tls_stream_t::close ()
{
    //  No close_notify exchange, the socket just goes away.
    boost::system::error_code ec;
    lowest_layer ().shutdown (boost::asio::ip::tcp::socket::shutdown_both, ec);
    lowest_layer ().close (ec);
}
