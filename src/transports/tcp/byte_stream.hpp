/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_BYTE_STREAM_HPP_INCLUDED__
#define __QLINK_BYTE_STREAM_HPP_INCLUDED__

#include "transports/i_mux_transport.hpp"
#include "utils/macros.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <vector>

namespace qlink
{
//  Connected, ordered byte stream the frame multiplexer runs on.
class i_byte_stream
{
  public:
    typedef i_mux_connection::completion_handler_t completion_handler_t;

    virtual ~i_byte_stream () {}

    virtual void async_read_some (unsigned char *buffer_,
                                  std::size_t size_,
                                  const completion_handler_t &handler_) = 0;

    //  Writes all of buffers_ before the handler runs.
    virtual void
    async_write (const std::vector<boost::asio::const_buffer> &buffers_,
                 const completion_handler_t &handler_) = 0;

    virtual void close () = 0;

    //  The TCP socket at the bottom of the stream.
    virtual boost::asio::ip::tcp::socket &lowest_layer () = 0;

    //  Endpoint scheme, "tcp" or "tls".
    virtual const char *name () const = 0;
};

class tcp_stream_t QLINK_FINAL : public i_byte_stream
{
  public:
    explicit tcp_stream_t (boost::asio::ip::tcp::socket socket_);
    ~tcp_stream_t () QLINK_OVERRIDE;

    void async_read_some (unsigned char *buffer_,
                          std::size_t size_,
                          const completion_handler_t &handler_) QLINK_OVERRIDE;
    void async_write (const std::vector<boost::asio::const_buffer> &buffers_,
                      const completion_handler_t &handler_) QLINK_OVERRIDE;
    void close () QLINK_OVERRIDE;
    boost::asio::ip::tcp::socket &lowest_layer () QLINK_OVERRIDE
    {
        return _socket;
    }
    const char *name () const QLINK_OVERRIDE { return "tcp"; }

  private:
    boost::asio::ip::tcp::socket _socket;

    QLINK_NON_COPYABLE_NOR_MOVABLE (tcp_stream_t)
};

//  Formats endpoint_ as "scheme_://address:port".
std::string format_endpoint (const char *scheme_,
                             const boost::asio::ip::tcp::endpoint &endpoint_);

//  Disables Nagle on a connected socket.
void set_no_delay (boost::asio::ip::tcp::socket &socket_);
}

#endif
