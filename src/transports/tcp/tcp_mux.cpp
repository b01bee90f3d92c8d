/* SPDX-License-Identifier: MPL-2.0 */

#include "transports/tcp/tcp_mux.hpp"
#include "transports/tls/tls_stream.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"
#include "utils/wire.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <algorithm>
#include <vector>

namespace
{
typedef boost::asio::ip::tcp tcp;

int error_to_errno (const boost::system::error_code &ec_)
{
    if (ec_.category () == boost::system::system_category ())
        return ec_.value ();
    return EINVAL;
}
}

qlink::tcp_mux_t::tcp_mux_t (const std::shared_ptr<i_byte_stream> &stream_,
                             bool initiator_) :
    _stream (stream_),
    _events (NULL),
    _closed (false),
    _next_stream (initiator_ ? 1 : 2),
    _writing (false),
    _header_bytes (0),
    _frame_stream (0),
    _frame_remaining (0)
{
    boost::system::error_code ec;
    const tcp::endpoint remote = _stream->lowest_layer ().remote_endpoint (ec);
    if (!ec)
        _remote = format_endpoint (_stream->name (), remote);
}

qlink::tcp_mux_t::~tcp_mux_t ()
{
    _stream->close ();
}

void qlink::tcp_mux_t::connect (boost::asio::io_context &io_context_,
                                const std::string &host_,
                                const std::string &port_,
                                const tls_context_ptr_t &tls_,
                                const std::string &tls_hostname_,
                                const connect_handler_t &handler_)
{
    const std::shared_ptr<tcp::resolver> resolver =
      std::make_shared<tcp::resolver> (io_context_);
    const std::shared_ptr<tcp::socket> socket =
      std::make_shared<tcp::socket> (io_context_);

    resolver->async_resolve (
      host_, port_,
      [resolver, socket, tls_, tls_hostname_,
       handler_] (const boost::system::error_code &ec_,
                  tcp::resolver::results_type results_) {
          if (ec_) {
              QLINK_GLOBAL_WARN ("resolve failed: %s", ec_.message ().c_str ());
              handler_ (ec_, mux_connection_ptr_t ());
              return;
          }
          boost::asio::async_connect (
            *socket, results_,
            [socket, tls_, tls_hostname_,
             handler_] (const boost::system::error_code &ec_,
                        const tcp::endpoint &) {
                if (ec_) {
                    handler_ (ec_, mux_connection_ptr_t ());
                    return;
                }
                set_no_delay (*socket);
                if (!tls_) {
                    const std::shared_ptr<i_byte_stream> stream =
                      std::make_shared<tcp_stream_t> (std::move (*socket));
                    handler_ (ec_, std::make_shared<tcp_mux_t> (stream, true));
                    return;
                }

                const std::shared_ptr<tls_stream_t> stream =
                  std::make_shared<tls_stream_t> (std::move (*socket), tls_);
                stream->async_handshake (
                  true, tls_hostname_,
                  [stream, handler_] (const boost::system::error_code &ec_) {
                      if (ec_) {
                          QLINK_GLOBAL_WARN ("TLS handshake failed: %s",
                                             ec_.message ().c_str ());
                          stream->close ();
                          handler_ (ec_, mux_connection_ptr_t ());
                          return;
                      }
                      handler_ (ec_,
                                std::make_shared<tcp_mux_t> (stream, true));
                  });
            });
      });
}

void qlink::tcp_mux_t::start (i_mux_events *events_)
{
    _events = events_;
    start_read ();
}

qlink::stream_id_t qlink::tcp_mux_t::open_stream ()
{
    const stream_id_t stream = _next_stream;
    _next_stream += 2;
    return stream;
}

void qlink::tcp_mux_t::async_write (stream_id_t stream_,
                                    const buffer_ptr_t &buffer_,
                                    const completion_handler_t &handler_)
{
    if (_closed || _reset.count (stream_)) {
        boost::asio::post (_stream->lowest_layer ().get_executor (),
                           [handler_] () {
                               handler_ (boost::asio::error::operation_aborted,
                                         0);
                           });
        return;
    }
    enqueue (stream_, tcp_frame_data, buffer_, handler_);
}

void qlink::tcp_mux_t::reset_stream (stream_id_t stream_)
{
    if (_closed || !_reset.insert (stream_).second)
        return;
    QLINK_DBG_TRANSPORT ("reset stream %u", stream_);
    abort_stream (stream_);
}

void qlink::tcp_mux_t::abort_stream (stream_id_t stream_)
{
    //  The frame at the front may already be on the socket.
    std::vector<completion_handler_t> aborted;
    std::deque<std::shared_ptr<frame_t> >::iterator it = _queue.begin ();
    if (_writing && it != _queue.end ())
        ++it;
    while (it != _queue.end ()) {
        if ((*it)->stream == stream_) {
            if ((*it)->handler)
                aborted.push_back ((*it)->handler);
            it = _queue.erase (it);
        } else
            ++it;
    }
    for (size_t i = 0; i < aborted.size (); i++) {
        const completion_handler_t handler = aborted[i];
        boost::asio::post (_stream->lowest_layer ().get_executor (),
                           [handler] () {
                               handler (boost::asio::error::operation_aborted,
                                        0);
                           });
    }

    enqueue (stream_, tcp_frame_reset, buffer_ptr_t (),
             completion_handler_t ());
}

void qlink::tcp_mux_t::close ()
{
    if (_closed)
        return;
    _closed = true;
    _events = NULL;

    _stream->close ();

    //  An in-flight frame completes through write_done.
    std::deque<std::shared_ptr<frame_t> >::iterator it = _queue.begin ();
    if (_writing && it != _queue.end ())
        ++it;
    for (; it != _queue.end (); ++it) {
        const completion_handler_t handler = (*it)->handler;
        if (handler)
            boost::asio::post (
              _stream->lowest_layer ().get_executor (), [handler] () {
                  handler (boost::asio::error::operation_aborted, 0);
              });
    }
    _queue.erase (_writing && !_queue.empty () ? _queue.begin () + 1
                                               : _queue.begin (),
                  _queue.end ());
}

std::string qlink::tcp_mux_t::remote_address () const
{
    return _remote;
}

void qlink::tcp_mux_t::enqueue (stream_id_t stream_,
                                unsigned char flags_,
                                const buffer_ptr_t &payload_,
                                const completion_handler_t &handler_)
{
    const std::shared_ptr<frame_t> frame = std::make_shared<frame_t> ();
    frame->stream = stream_;
    frame->payload = payload_;
    frame->handler = handler_;
    put_uint32 (frame->header, stream_);
    put_uint8 (frame->header + 4, flags_);
    put_uint32 (frame->header + 5,
                payload_ ? static_cast<uint32_t> (payload_->size ()) : 0);
    _queue.push_back (frame);

    if (!_writing)
        start_write ();
}

void qlink::tcp_mux_t::start_write ()
{
    if (_closed || _writing || _queue.empty ())
        return;
    _writing = true;

    const std::shared_ptr<frame_t> frame = _queue.front ();
    std::vector<boost::asio::const_buffer> buffers;
    buffers.push_back (
      boost::asio::buffer (frame->header, tcp_frame_header_size));
    if (frame->payload && !frame->payload->empty ())
        buffers.push_back (boost::asio::buffer (*frame->payload));

    const std::shared_ptr<tcp_mux_t> self = shared_from_this ();
    _stream->async_write (
      buffers,
      [self, frame] (const boost::system::error_code &ec_, std::size_t size_) {
          self->write_done (ec_, size_);
      });
}

void qlink::tcp_mux_t::write_done (const boost::system::error_code &ec_,
                                   std::size_t size_)
{
    _writing = false;
    qlink_assert (!_queue.empty ());
    const std::shared_ptr<frame_t> frame = _queue.front ();
    _queue.pop_front ();

    if (frame->handler) {
        const std::size_t payload_size =
          size_ >= tcp_frame_header_size ? size_ - tcp_frame_header_size : 0;
        frame->handler (ec_, payload_size);
    }

    if (ec_) {
        fail (ec_);
        return;
    }
    start_write ();
}

void qlink::tcp_mux_t::start_read ()
{
    if (_closed)
        return;
    const std::shared_ptr<tcp_mux_t> self = shared_from_this ();
    _stream->async_read_some (
      _read_buf, sizeof _read_buf,
      [self] (const boost::system::error_code &ec_, std::size_t size_) {
          self->read_done (ec_, size_);
      });
}

void qlink::tcp_mux_t::read_done (const boost::system::error_code &ec_,
                                  std::size_t size_)
{
    if (_closed)
        return;
    if (ec_) {
        fail (ec_);
        return;
    }
    if (process_input (_read_buf, size_))
        start_read ();
}

bool qlink::tcp_mux_t::process_input (const unsigned char *data_,
                                      size_t size_)
{
    size_t pos = 0;
    while (pos < size_) {
        if (_header_bytes < tcp_frame_header_size) {
            const size_t n =
              std::min (size_ - pos, tcp_frame_header_size - _header_bytes);
            memcpy (_header + _header_bytes, data_ + pos, n);
            _header_bytes += n;
            pos += n;
            if (_header_bytes < tcp_frame_header_size)
                break;

            _frame_stream = get_uint32 (_header);
            const unsigned char flags = get_uint8 (_header + 4);
            _frame_remaining = get_uint32 (_header + 5);

            if (flags == tcp_frame_reset) {
                _header_bytes = 0;
                if (_frame_remaining != 0) {
                    fail (boost::asio::error::invalid_argument);
                    return false;
                }
                //  The answer to our own reset closes the stream for good.
                if (_reset.erase (_frame_stream))
                    continue;
                _events->stream_reset (_frame_stream);
                if (_closed)
                    return false;
                _reset.erase (_frame_stream);
                abort_stream (_frame_stream);
                continue;
            }
            if (flags != tcp_frame_data) {
                fail (boost::asio::error::invalid_argument);
                return false;
            }
        }

        const size_t n = std::min (size_ - pos, _frame_remaining);
        if (n > 0 && !_reset.count (_frame_stream)) {
            _events->stream_data (_frame_stream, data_ + pos, n);
            if (_closed)
                return false;
        }
        pos += n;
        _frame_remaining -= n;
        if (_frame_remaining == 0)
            _header_bytes = 0;
    }
    return !_closed;
}

void qlink::tcp_mux_t::fail (const boost::system::error_code &ec_)
{
    if (_closed)
        return;
    QLINK_DBG_TRANSPORT ("connection lost: %s", ec_.message ().c_str ());
    i_mux_events *events = _events;
    close ();
    if (events)
        events->connection_lost (ec_);
}

qlink::tcp_listener_t::tcp_listener_t (boost::asio::io_context &io_context_,
                                       const tls_context_ptr_t &tls_,
                                       int handshake_ivl_,
                                       const accept_handler_t &handler_) :
    _io_context (io_context_),
    _tls (tls_),
    _handshake_ivl (handshake_ivl_),
    _acceptor (io_context_),
    _handler (handler_),
    _closed (false)
{
}

qlink::tcp_listener_t::~tcp_listener_t ()
{
    boost::system::error_code ec;
    _acceptor.close (ec);
}

int qlink::tcp_listener_t::listen (boost::asio::io_context &io_context_,
                                   const std::string &host_,
                                   const std::string &port_,
                                   const tls_context_ptr_t &tls_,
                                   int handshake_ivl_,
                                   const accept_handler_t &handler_,
                                   mux_listener_ptr_t *listener_)
{
    const std::shared_ptr<tcp_listener_t> listener =
      std::make_shared<tcp_listener_t> (io_context_, tls_, handshake_ivl_,
                                        handler_);
    if (listener->bind (host_, port_) != 0)
        return -1;
    listener->start_accept ();
    *listener_ = listener;
    return 0;
}

int qlink::tcp_listener_t::bind (const std::string &host_,
                                 const std::string &port_)
{
    boost::system::error_code ec;
    tcp::resolver resolver (_io_context);
    const tcp::resolver::results_type results = resolver.resolve (
      host_ == "*" ? std::string ("0.0.0.0") : host_, port_,
      tcp::resolver::passive, ec);
    if (ec || results.empty ()) {
        errno = EINVAL;
        return -1;
    }
    const tcp::endpoint endpoint = results.begin ()->endpoint ();

    _acceptor.open (endpoint.protocol (), ec);
    if (!ec)
        _acceptor.set_option (tcp::acceptor::reuse_address (true), ec);
    if (!ec)
        _acceptor.bind (endpoint, ec);
    if (!ec)
        _acceptor.listen (boost::asio::socket_base::max_listen_connections,
                          ec);
    if (ec) {
        QLINK_GLOBAL_WARN ("listen failed: %s", ec.message ().c_str ());
        boost::system::error_code ignored;
        _acceptor.close (ignored);
        errno = error_to_errno (ec);
        return -1;
    }

    //  Resolves a wildcard port.
    const tcp::endpoint local = _acceptor.local_endpoint (ec);
    _endpoint =
      ec ? std::string () : format_endpoint (_tls ? "tls" : "tcp", local);
    return 0;
}

void qlink::tcp_listener_t::start_accept ()
{
    const std::shared_ptr<tcp_listener_t> self = shared_from_this ();
    _acceptor.async_accept (
      [self] (const boost::system::error_code &ec_, tcp::socket socket_) {
          if (self->_closed || ec_ == boost::asio::error::operation_aborted)
              return;
          if (ec_)
              QLINK_GLOBAL_WARN ("accept failed: %s", ec_.message ().c_str ());
          else
              self->accepted (std::move (socket_));
          if (!self->_closed)
              self->start_accept ();
      });
}

void qlink::tcp_listener_t::accepted (tcp::socket socket_)
{
    set_no_delay (socket_);
    if (!_tls) {
        const std::shared_ptr<i_byte_stream> stream =
          std::make_shared<tcp_stream_t> (std::move (socket_));
        _handler (std::make_shared<tcp_mux_t> (stream, false));
        return;
    }

    const std::shared_ptr<tls_stream_t> stream =
      std::make_shared<tls_stream_t> (std::move (socket_), _tls);
    const std::shared_ptr<tcp_listener_t> self = shared_from_this ();

    //  Closing the socket aborts a handshake that is still running.
    const std::shared_ptr<boost::asio::steady_timer> timer =
      std::make_shared<boost::asio::steady_timer> (_io_context);
    const std::shared_ptr<bool> finished = std::make_shared<bool> (false);
    timer->expires_after (std::chrono::milliseconds (_handshake_ivl));
    timer->async_wait (
      [stream, finished] (const boost::system::error_code &ec_) {
          if (ec_ == boost::asio::error::operation_aborted || *finished)
              return;
          QLINK_GLOBAL_WARN ("TLS handshake timed out");
          stream->close ();
      });

    stream->async_handshake (
      false, std::string (),
      [self, stream, timer, finished] (const boost::system::error_code &ec_) {
          *finished = true;
          timer->cancel ();
          if (ec_ || self->_closed) {
              if (ec_)
                  QLINK_GLOBAL_WARN ("TLS handshake failed: %s",
                                     ec_.message ().c_str ());
              stream->close ();
              return;
          }
          self->_handler (std::make_shared<tcp_mux_t> (stream, false));
      });
}

void qlink::tcp_listener_t::close ()
{
    if (_closed)
        return;
    _closed = true;
    boost::system::error_code ec;
    _acceptor.close (ec);
}

std::string qlink::tcp_listener_t::local_address () const
{
    return _endpoint;
}
