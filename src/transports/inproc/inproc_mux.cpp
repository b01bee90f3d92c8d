/* SPDX-License-Identifier: MPL-2.0 */

#include "transports/inproc/inproc_mux.hpp"
#include "core/ctx.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

namespace
{
enum held_kind_t
{
    held_data,
    held_reset,
    held_closed
};
}

qlink::inproc_mux_t::inproc_mux_t (ctx_t *ctx_,
                                   boost::asio::io_context &io_context_,
                                   const std::string &name_,
                                   const std::shared_ptr<inproc_link_t> &link_,
                                   int side_) :
    _ctx (ctx_),
    _io_context (io_context_),
    _name (name_),
    _link (link_),
    _side (side_),
    _events (NULL),
    _closed (false),
    _next_stream (side_ == 0 ? 1 : 2)
{
}

qlink::inproc_mux_t::~inproc_mux_t ()
{
    close ();
}

void qlink::inproc_mux_t::connect (ctx_t *ctx_,
                                   boost::asio::io_context &io_context_,
                                   const std::string &name_,
                                   const connect_handler_t &handler_)
{
    const std::shared_ptr<inproc_listener_t> listener =
      ctx_->find_endpoint (name_);
    if (!listener || ctx_->is_partitioned (name_)) {
        boost::asio::post (io_context_, [handler_] () {
            handler_ (boost::asio::error::connection_refused,
                      mux_connection_ptr_t ());
        });
        return;
    }

    const std::shared_ptr<inproc_link_t> link =
      std::make_shared<inproc_link_t> ();
    const std::shared_ptr<inproc_mux_t> client = std::make_shared<inproc_mux_t> (
      ctx_, io_context_, name_, link, 0);
    const std::shared_ptr<inproc_mux_t> server = std::make_shared<inproc_mux_t> (
      ctx_, *listener->io_context (), name_, link, 1);
    client->attach ();
    server->attach ();

    if (!listener->deliver (server)) {
        server->close ();
        client->close ();
        boost::asio::post (io_context_, [handler_] () {
            handler_ (boost::asio::error::connection_refused,
                      mux_connection_ptr_t ());
        });
        return;
    }

    const mux_connection_ptr_t connection = client;
    boost::asio::post (io_context_, [handler_, connection] () {
        handler_ (boost::system::error_code (), connection);
    });
}

void qlink::inproc_mux_t::attach ()
{
    scoped_lock_t lock (_link->sync);
    _link->sides[_side].io_context = &_io_context;
    _link->sides[_side].mux = shared_from_this ();
}

void qlink::inproc_mux_t::start (i_mux_events *events_)
{
    _events = events_;

    std::vector<held_t> held;
    held.swap (_held);
    for (std::vector<held_t>::iterator it = held.begin (); it != held.end ();
         ++it) {
        if (_closed || _events != events_)
            break;
        switch (it->kind) {
            case held_data:
                peer_data (it->stream, it->buffer);
                break;
            case held_reset:
                peer_reset (it->stream);
                break;
            default:
                peer_closed ();
                break;
        }
    }
}

qlink::stream_id_t qlink::inproc_mux_t::open_stream ()
{
    const stream_id_t stream = _next_stream;
    _next_stream += 2;
    return stream;
}

void qlink::inproc_mux_t::async_write (stream_id_t stream_,
                                       const buffer_ptr_t &buffer_,
                                       const completion_handler_t &handler_)
{
    if (_closed) {
        boost::asio::post (_io_context, [handler_] () {
            handler_ (boost::asio::error::operation_aborted, 0);
        });
        return;
    }

    //  A partitioned link accepts writes and loses them on the way.
    if (!_ctx->is_partitioned (_name)) {
        const buffer_ptr_t buffer = buffer_;
        post_to_peer ([stream_, buffer] (inproc_mux_t *peer_) {
            peer_->peer_data (stream_, buffer);
        });
    }

    const std::size_t size = buffer_->size ();
    boost::asio::post (_io_context, [handler_, size] () {
        handler_ (boost::system::error_code (), size);
    });
}

void qlink::inproc_mux_t::reset_stream (stream_id_t stream_)
{
    if (_closed || _ctx->is_partitioned (_name)
        || !_reset.insert (stream_).second)
        return;
    post_to_peer (
      [stream_] (inproc_mux_t *peer_) { peer_->peer_reset (stream_); });
}

void qlink::inproc_mux_t::close ()
{
    if (_closed)
        return;
    _closed = true;
    _events = NULL;
    _held.clear ();

    if (!_ctx->is_partitioned (_name))
        post_to_peer ([] (inproc_mux_t *peer_) { peer_->peer_closed (); });

    scoped_lock_t lock (_link->sync);
    _link->sides[_side].io_context = NULL;
}

std::string qlink::inproc_mux_t::remote_address () const
{
    return std::string ("inproc://") + _name;
}

void qlink::inproc_mux_t::post_to_peer (
  const std::function<void (inproc_mux_t *)> &fn_)
{
    scoped_lock_t lock (_link->sync);
    inproc_link_t::side_t &peer = _link->sides[1 - _side];
    if (!peer.io_context)
        return;

    const std::weak_ptr<inproc_mux_t> target = peer.mux;
    boost::asio::post (*peer.io_context, [target, fn_] () {
        const std::shared_ptr<inproc_mux_t> mux = target.lock ();
        if (mux)
            fn_ (mux.get ());
    });
}

void qlink::inproc_mux_t::peer_data (stream_id_t stream_,
                                     const buffer_ptr_t &buffer_)
{
    if (_closed)
        return;
    if (!_events) {
        held_t held = {held_data, stream_, buffer_};
        _held.push_back (held);
        return;
    }
    if (_reset.count (stream_))
        return;
    _events->stream_data (stream_, buffer_->empty () ? NULL : &(*buffer_)[0],
                          buffer_->size ());
}

void qlink::inproc_mux_t::peer_reset (stream_id_t stream_)
{
    if (_closed)
        return;
    if (!_events) {
        held_t held = {held_reset, stream_, buffer_ptr_t ()};
        _held.push_back (held);
        return;
    }

    //  The answer to our own reset closes the stream for good.
    if (_reset.erase (stream_))
        return;
    _events->stream_reset (stream_);
    if (_closed || _ctx->is_partitioned (_name))
        return;
    _reset.erase (stream_);
    post_to_peer (
      [stream_] (inproc_mux_t *peer_) { peer_->peer_reset (stream_); });
}

void qlink::inproc_mux_t::peer_closed ()
{
    if (_closed)
        return;
    if (!_events) {
        held_t held = {held_closed, 0, buffer_ptr_t ()};
        _held.push_back (held);
        return;
    }

    QLINK_DBG_TRANSPORT ("inproc peer closed: %s", _name.c_str ());
    i_mux_events *events = _events;
    close ();
    events->connection_lost (boost::asio::error::connection_reset);
}

qlink::inproc_listener_t::inproc_listener_t (
  ctx_t *ctx_,
  boost::asio::io_context &io_context_,
  const std::string &name_,
  const accept_handler_t &handler_) :
    _ctx (ctx_),
    _io_context (io_context_),
    _name (name_),
    _handler (handler_),
    _closed (false)
{
}

qlink::inproc_listener_t::~inproc_listener_t ()
{
}

int qlink::inproc_listener_t::listen (ctx_t *ctx_,
                                      boost::asio::io_context &io_context_,
                                      const std::string &name_,
                                      const accept_handler_t &handler_,
                                      mux_listener_ptr_t *listener_)
{
    const std::shared_ptr<inproc_listener_t> listener =
      std::make_shared<inproc_listener_t> (ctx_, io_context_, name_, handler_);
    if (ctx_->register_endpoint (name_, listener) != 0)
        return -1;
    *listener_ = listener;
    return 0;
}

bool qlink::inproc_listener_t::deliver (
  const std::shared_ptr<inproc_mux_t> &mux_)
{
    scoped_lock_t lock (_sync);
    if (_closed)
        return false;

    _pending.push_back (mux_);
    const std::weak_ptr<inproc_listener_t> self = shared_from_this ();
    const std::shared_ptr<inproc_mux_t> mux = mux_;
    boost::asio::post (_io_context, [self, mux] () {
        const std::shared_ptr<inproc_listener_t> listener = self.lock ();
        if (listener)
            listener->accept_ready (mux);
        else
            mux->close ();
    });
    return true;
}

void qlink::inproc_listener_t::accept_ready (
  const std::shared_ptr<inproc_mux_t> &mux_)
{
    bool closed;
    {
        scoped_lock_t lock (_sync);
        closed = _closed;
        for (std::vector<std::weak_ptr<inproc_mux_t> >::iterator it =
               _pending.begin ();
             it != _pending.end (); ++it) {
            if (it->lock () == mux_) {
                _pending.erase (it);
                break;
            }
        }
    }

    if (closed)
        mux_->close ();
    else
        _handler (mux_);
}

void qlink::inproc_listener_t::close ()
{
    std::vector<std::weak_ptr<inproc_mux_t> > pending;
    {
        scoped_lock_t lock (_sync);
        if (_closed)
            return;
        _closed = true;
        pending.swap (_pending);
    }
    _ctx->unregister_endpoint (_name, this);

    for (std::vector<std::weak_ptr<inproc_mux_t> >::iterator it =
           pending.begin ();
         it != pending.end (); ++it) {
        const std::shared_ptr<inproc_mux_t> mux = it->lock ();
        if (mux)
            mux->close ();
    }
}

std::string qlink::inproc_listener_t::local_address () const
{
    return std::string ("inproc://") + _name;
}
