/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_TCP_MUX_HPP_INCLUDED__
#define __QLINK_TCP_MUX_HPP_INCLUDED__

#include "transports/i_mux_transport.hpp"
#include "transports/tcp/byte_stream.hpp"
#include "transports/tls/tls_context.hpp"
#include "utils/macros.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <deque>
#include <memory>
#include <set>
#include <string>

namespace qlink
{
//  [stream_id:4][flags:1][length:4]
const size_t tcp_frame_header_size = 9;

const unsigned char tcp_frame_data = 0;
const unsigned char tcp_frame_reset = 1;

//  Streams multiplexed over one TCP or TLS connection. Frames of
//  different streams interleave on the socket; frames of one stream stay
//  in order.
class tcp_mux_t QLINK_FINAL : public i_mux_connection,
                              public std::enable_shared_from_this<tcp_mux_t>
{
  public:
    tcp_mux_t (const std::shared_ptr<i_byte_stream> &stream_,
               bool initiator_);
    ~tcp_mux_t () QLINK_OVERRIDE;

    //  Resolves host_ and port_ and connects, then runs the TLS handshake
    //  when tls_ is set. The handler runs on io_context_ with the
    //  connected mux or the error.
    static void connect (boost::asio::io_context &io_context_,
                         const std::string &host_,
                         const std::string &port_,
                         const tls_context_ptr_t &tls_,
                         const std::string &tls_hostname_,
                         const connect_handler_t &handler_);

    //  i_mux_connection implementation
    void start (i_mux_events *events_) QLINK_OVERRIDE;
    stream_id_t open_stream () QLINK_OVERRIDE;
    void async_write (stream_id_t stream_,
                      const buffer_ptr_t &buffer_,
                      const completion_handler_t &handler_) QLINK_OVERRIDE;
    void reset_stream (stream_id_t stream_) QLINK_OVERRIDE;
    void close () QLINK_OVERRIDE;
    bool is_open () const QLINK_OVERRIDE { return !_closed; }
    std::string remote_address () const QLINK_OVERRIDE;

    //  Resets of ours the peer has not answered yet.
    size_t pending_resets () const { return _reset.size (); }

  private:
    struct frame_t
    {
        unsigned char header[tcp_frame_header_size];
        stream_id_t stream;
        buffer_ptr_t payload;
        completion_handler_t handler;
    };

    void enqueue (stream_id_t stream_,
                  unsigned char flags_,
                  const buffer_ptr_t &payload_,
                  const completion_handler_t &handler_);
    //  Drops queued frames of stream_ and queues a reset frame.
    void abort_stream (stream_id_t stream_);
    void start_write ();
    void write_done (const boost::system::error_code &ec_, std::size_t size_);

    void start_read ();
    void read_done (const boost::system::error_code &ec_, std::size_t size_);

    //  Parses received bytes into frames. Returns false once the
    //  connection is closed or broken.
    bool process_input (const unsigned char *data_, size_t size_);

    void fail (const boost::system::error_code &ec_);

    const std::shared_ptr<i_byte_stream> _stream;
    std::string _remote;

    i_mux_events *_events;
    bool _closed;
    stream_id_t _next_stream;

    std::deque<std::shared_ptr<frame_t> > _queue;
    bool _writing;

    //  Streams reset locally whose reset the peer has not answered yet.
    //  Late frames for them are discarded.
    std::set<stream_id_t> _reset;

    unsigned char _read_buf[8192];
    unsigned char _header[tcp_frame_header_size];
    size_t _header_bytes;
    stream_id_t _frame_stream;
    size_t _frame_remaining;

    QLINK_NON_COPYABLE_NOR_MOVABLE (tcp_mux_t)
};

class tcp_listener_t QLINK_FINAL
    : public i_mux_listener,
      public std::enable_shared_from_this<tcp_listener_t>
{
  public:
    tcp_listener_t (boost::asio::io_context &io_context_,
                    const tls_context_ptr_t &tls_,
                    int handshake_ivl_,
                    const accept_handler_t &handler_);
    ~tcp_listener_t () QLINK_OVERRIDE;

    //  Binds host_:port_ and starts accepting. "*" binds all interfaces,
    //  port 0 picks an ephemeral port. With tls_ set, accepted sockets
    //  are handed over once their TLS handshake succeeds; a socket whose
    //  handshake takes longer than handshake_ivl_ ms is closed. Returns -1
    //  with errno set on failure.
    static int listen (boost::asio::io_context &io_context_,
                       const std::string &host_,
                       const std::string &port_,
                       const tls_context_ptr_t &tls_,
                       int handshake_ivl_,
                       const accept_handler_t &handler_,
                       mux_listener_ptr_t *listener_);

    //  i_mux_listener implementation
    void close () QLINK_OVERRIDE;
    std::string local_address () const QLINK_OVERRIDE;

  private:
    int bind (const std::string &host_, const std::string &port_);
    void start_accept ();
    void accepted (boost::asio::ip::tcp::socket socket_);

    boost::asio::io_context &_io_context;
    const tls_context_ptr_t _tls;
    const int _handshake_ivl;
    boost::asio::ip::tcp::acceptor _acceptor;
    const accept_handler_t _handler;
    std::string _endpoint;
    bool _closed;

    QLINK_NON_COPYABLE_NOR_MOVABLE (tcp_listener_t)
};
}

#endif
