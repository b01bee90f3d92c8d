/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_I_MUX_TRANSPORT_HPP_INCLUDED__
#define __QLINK_I_MUX_TRANSPORT_HPP_INCLUDED__

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <stdint.h>
#include <string>
#include <vector>

namespace qlink
{
typedef uint32_t stream_id_t;

//  Immutable bytes shared between the writer and the transport queue.
typedef std::shared_ptr<const std::vector<unsigned char> > buffer_ptr_t;

//  Receiver of transport events. Called on the owning I/O thread.
struct i_mux_events
{
    virtual ~i_mux_events () {}

    //  Bytes arrived on a stream. Within a stream, bytes arrive in the
    //  order they were written; chunk boundaries are not preserved.
    virtual void stream_data (stream_id_t stream_,
                              const unsigned char *data_,
                              size_t size_) = 0;

    //  The peer aborted a stream. Not raised for the peer's answer to a
    //  reset of our own.
    virtual void stream_reset (stream_id_t stream_) = 0;

    //  The underlying connection is gone.
    virtual void connection_lost (const boost::system::error_code &ec_) = 0;
};

//  Multiplexed connection primitive: independent ordered byte streams over
//  one connection. Encryption and congestion control belong to the
//  implementation and are not visible here.
//
//  Streams opened by the initiating side carry odd ids, streams opened by
//  the accepting side even ids.

class i_mux_connection
{
  public:
    //  Callback type for async write completion
    typedef std::function<void (const boost::system::error_code &, std::size_t)>
      completion_handler_t;

    virtual ~i_mux_connection () {}

    //  Starts delivering events. Data arriving before start is held.
    virtual void start (i_mux_events *events_) = 0;

    virtual stream_id_t open_stream () = 0;

    //  Queues buffer_ on stream_. Writes on one stream are transmitted in
    //  order. The handler runs once the bytes are handed to the network,
    //  or with operation_aborted if the stream is reset or the connection
    //  closed first.
    virtual void async_write (stream_id_t stream_,
                              const buffer_ptr_t &buffer_,
                              const completion_handler_t &handler_) = 0;

    //  Aborts stream_ in both directions. Queued writes are discarded and
    //  data the peer sent before seeing the reset is dropped. The peer
    //  answers with a reset of its own, which releases the stream.
    virtual void reset_stream (stream_id_t stream_) = 0;

    //  Closes the connection. No events are delivered afterwards.
    virtual void close () = 0;

    virtual bool is_open () const = 0;

    virtual std::string remote_address () const = 0;
};

typedef std::shared_ptr<i_mux_connection> mux_connection_ptr_t;

typedef std::function<void (const boost::system::error_code &,
                            const mux_connection_ptr_t &)>
  connect_handler_t;

typedef std::function<void (const mux_connection_ptr_t &)> accept_handler_t;

class i_mux_listener
{
  public:
    virtual ~i_mux_listener () {}

    //  Stops accepting. No handler runs afterwards.
    virtual void close () = 0;

    virtual std::string local_address () const = 0;
};

typedef std::shared_ptr<i_mux_listener> mux_listener_ptr_t;
}

#endif
