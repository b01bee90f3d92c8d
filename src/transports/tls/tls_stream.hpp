/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_TLS_STREAM_HPP_INCLUDED__
#define __QLINK_TLS_STREAM_HPP_INCLUDED__

#include "transports/tcp/byte_stream.hpp"
#include "transports/tls/tls_context.hpp"

#include <boost/asio/ssl/stream.hpp>

#include <functional>
#include <string>

namespace qlink
{
//  TLS session over a connected TCP socket. Reads and writes are valid
//  once async_handshake completed without error.
class tls_stream_t QLINK_FINAL : public i_byte_stream
{
  public:
    typedef std::function<void (const boost::system::error_code &)>
      handshake_handler_t;

    tls_stream_t (boost::asio::ip::tcp::socket socket_,
                  const tls_context_ptr_t &context_);
    ~tls_stream_t () QLINK_OVERRIDE;

    //  Runs the handshake in the client or server role. On a client a
    //  non-empty hostname_ is sent as SNI and must match the server's
    //  certificate.
    void async_handshake (bool client_,
                          const std::string &hostname_,
                          const handshake_handler_t &handler_);

    void async_read_some (unsigned char *buffer_,
                          std::size_t size_,
                          const completion_handler_t &handler_) QLINK_OVERRIDE;
    void async_write (const std::vector<boost::asio::const_buffer> &buffers_,
                      const completion_handler_t &handler_) QLINK_OVERRIDE;
    void close () QLINK_OVERRIDE;
    boost::asio::ip::tcp::socket &lowest_layer () QLINK_OVERRIDE
    {
        return _stream.next_layer ();
    }
    const char *name () const QLINK_OVERRIDE { return "tls"; }

  private:
    typedef boost::asio::ssl::stream<boost::asio::ip::tcp::socket> stream_t;

    //  Declared first, the stream refers to it.
    const tls_context_ptr_t _context;
    stream_t _stream;

    QLINK_NON_COPYABLE_NOR_MOVABLE (tls_stream_t)
};
}

#endif
