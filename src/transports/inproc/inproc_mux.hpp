/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_INPROC_MUX_HPP_INCLUDED__
#define __QLINK_INPROC_MUX_HPP_INCLUDED__

#include "transports/i_mux_transport.hpp"
#include "utils/macros.hpp"
#include "utils/mutex.hpp"

#include <boost/asio/io_context.hpp>

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace qlink
{
class ctx_t;
class inproc_mux_t;

//  State shared by the two ends of an in-process connection. Each end
//  posts to the other's io_context under the lock; an end that closes
//  clears its io_context so nothing is posted to a loop about to go away.
struct inproc_link_t
{
    struct side_t
    {
        side_t () : io_context (NULL) {}

        boost::asio::io_context *io_context;
        std::weak_ptr<inproc_mux_t> mux;
    };

    mutex_t sync;
    side_t sides[2];
};

//  One end of an in-process multiplexed connection.
class inproc_mux_t QLINK_FINAL
    : public i_mux_connection,
      public std::enable_shared_from_this<inproc_mux_t>
{
  public:
    inproc_mux_t (ctx_t *ctx_,
                  boost::asio::io_context &io_context_,
                  const std::string &name_,
                  const std::shared_ptr<inproc_link_t> &link_,
                  int side_);
    ~inproc_mux_t () QLINK_OVERRIDE;

    //  Creates a connected pair and hands the accepting end to the
    //  listener bound to name_. The handler runs on io_context_; it
    //  receives connection_refused if nobody listens on name_ or the
    //  endpoint is partitioned.
    static void connect (ctx_t *ctx_,
                         boost::asio::io_context &io_context_,
                         const std::string &name_,
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
    void attach ();
    void post_to_peer (const std::function<void (inproc_mux_t *)> &fn_);

    //  Handlers run on this end's loop for actions of the peer.
    void peer_data (stream_id_t stream_, const buffer_ptr_t &buffer_);
    void peer_reset (stream_id_t stream_);
    void peer_closed ();

    ctx_t *const _ctx;
    boost::asio::io_context &_io_context;
    const std::string _name;
    const std::shared_ptr<inproc_link_t> _link;
    const int _side;

    i_mux_events *_events;
    bool _closed;
    stream_id_t _next_stream;

    //  Streams reset locally whose reset the peer has not answered yet.
    std::set<stream_id_t> _reset;

    //  Peer activity that arrived before start.
    struct held_t
    {
        int kind;
        stream_id_t stream;
        buffer_ptr_t buffer;
    };
    std::vector<held_t> _held;

    QLINK_NON_COPYABLE_NOR_MOVABLE (inproc_mux_t)
};

//  Endpoint registered in the context under an inproc name.
class inproc_listener_t QLINK_FINAL
    : public i_mux_listener,
      public std::enable_shared_from_this<inproc_listener_t>
{
  public:
    inproc_listener_t (ctx_t *ctx_,
                       boost::asio::io_context &io_context_,
                       const std::string &name_,
                       const accept_handler_t &handler_);
    ~inproc_listener_t () QLINK_OVERRIDE;

    //  Returns -1 with errno EADDRINUSE if the name is taken.
    static int listen (ctx_t *ctx_,
                       boost::asio::io_context &io_context_,
                       const std::string &name_,
                       const accept_handler_t &handler_,
                       mux_listener_ptr_t *listener_);

    //  Called from the connecting thread. Returns false if the listener
    //  is already closed.
    bool deliver (const std::shared_ptr<inproc_mux_t> &mux_);

    boost::asio::io_context *io_context () { return &_io_context; }

    //  i_mux_listener implementation
    void close () QLINK_OVERRIDE;
    std::string local_address () const QLINK_OVERRIDE;

  private:
    void accept_ready (const std::shared_ptr<inproc_mux_t> &mux_);

    ctx_t *const _ctx;
    boost::asio::io_context &_io_context;
    const std::string _name;
    const accept_handler_t _handler;

    //  Guards _closed and _pending against connecting threads.
    mutex_t _sync;
    bool _closed;

    //  Delivered ends whose accept has not run yet.
    std::vector<std::weak_ptr<inproc_mux_t> > _pending;

    QLINK_NON_COPYABLE_NOR_MOVABLE (inproc_listener_t)
};
}

#endif
