/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_HPP_INCLUDED__
#define __QLINK_HPP_INCLUDED__

#include "qlink.h"

#include <functional>
#include <stdint.h>
#include <string>

namespace qlink
{
class ctx_t;
class node_t;

typedef uint64_t connection_id_t;
typedef uint64_t subscription_id_t;
typedef uint32_t stream_id_t;

//  Lifecycle or data event. Which fields are set depends on event:
//
//    QLINK_EVENT_CONNECTED        address, identity, value = 1 if initiated
//    QLINK_EVENT_DISCONNECTED     value = reason errno, 0 for explicit close
//    QLINK_EVENT_RECONNECTING     value = attempt number
//    QLINK_EVENT_MESSAGE_RECEIVED message_type, topic, correlation_id, data
//    QLINK_EVENT_UNREACHABLE      none
//    QLINK_EVENT_DEGRADED         value = 1 on degradation, 0 on recovery
//    QLINK_EVENT_MALFORMED_CHUNK  value = stream id
//    QLINK_EVENT_MESSAGE_DROPPED  topic, value = subscription handle
struct event_t
{
    event_t () :
        event (0),
        connection (0),
        value (0),
        message_type (0),
        correlation_id (0)
    {
    }

    int event;
    connection_id_t connection;
    int64_t value;
    std::string address;
    std::string identity;
    int message_type;
    std::string topic;
    uint64_t correlation_id;
    std::string data;
};

//  Receives events on the node's I/O thread. Handlers must not block;
//  calls made from inside a handler complete asynchronously.
struct i_event_handler
{
    virtual ~i_event_handler () {}
    virtual void on_event (const event_t &event_) = 0;
};

//  Subscription filter, called with the topic and body of a publish.
typedef std::function<bool (const std::string &topic_,
                            const std::string &data_)>
  filter_t;

//  Outcome of an asynchronous send: 0 or an errno.
typedef std::function<void (int)> completion_t;

//  Holds the inproc endpoint table shared by the nodes of a process. Must
//  outlive every node created with it.
class QLINK_EXPORT context_t
{
  public:
    context_t ();
    ~context_t ();

    //  Silently drops all traffic on connections made to an inproc
    //  endpoint and refuses new ones, until called again with false.
    //  Returns -1 with errno EINVAL for other endpoints.
    int partition (const std::string &endpoint_, bool partitioned_);

    ctx_t *get () { return _ctx; }

  private:
    ctx_t *_ctx;

    context_t (const context_t &);
    const context_t &operator= (const context_t &);
};

//  Operations shared by clients and servers. Methods return 0 on success
//  and -1 with errno set otherwise, see qlink_errno.
class QLINK_EXPORT peer_t
{
  public:
    virtual ~peer_t ();

    int set (int option_, int value_);
    int set (int option_, const std::string &value_);
    int get (int option_, int *value_) const;
    int get (int option_, std::string *value_) const;

    //  Sends a data message and waits until it is handed to the transport.
    //  Inside an event handler the send is only started.
    int send (connection_id_t connection_, const void *data_, size_t size_);

    //  Starts a send and stores its operation id in op_.
    int send_async (connection_id_t connection_,
                    const void *data_,
                    size_t size_,
                    uint64_t *op_,
                    const completion_t &done_ = completion_t ());

    //  Cancels a pending send or publish.
    int cancel (uint64_t op_);

    //  Sends to every live connection. Returns their number.
    int send_all (const void *data_, size_t size_);

    //  Sends a request and waits for the reply. A negative timeout uses
    //  QLINK_REQUEST_TIMEOUT. Fails with ETIMEDOUT, ECONNRESET if the
    //  connection drops and QLINK_EUNREACHABLE once it is given up.
    int request (connection_id_t connection_,
                 const void *data_,
                 size_t size_,
                 std::string *reply_,
                 int timeout_ = -1);

    //  Answers a request received as a QLINK_MSG_REQUEST event.
    int reply (connection_id_t connection_,
               uint64_t correlation_id_,
               const void *data_,
               size_t size_);

    //  Publishes to every connection subscribed to topic_. Returns the
    //  number of connections it was queued for. op_ receives an id usable
    //  with cancel.
    int publish (const std::string &topic_,
                 const void *data_,
                 size_t size_,
                 uint64_t *op_ = NULL);

    //  Subscribes to topic_ on all current and future connections.
    int subscribe (const std::string &topic_,
                   subscription_id_t *id_,
                   const filter_t &filter_ = filter_t ());

    //  Routes publishes of topic_ to connection_ from this side, with the
    //  filter applied before sending.
    int subscribe_connection (connection_id_t connection_,
                              const std::string &topic_,
                              subscription_id_t *id_,
                              const filter_t &filter_ = filter_t ());

    int unsubscribe (subscription_id_t id_);

    //  Installs the event handler. Without one, events queue up for
    //  recv_event.
    void on_event (i_event_handler *handler_);

    //  Pops the next queued event. A negative timeout waits forever.
    //  Returns -1 with errno EAGAIN on timeout.
    int recv_event (event_t *event_, int timeout_);

    //  Closes one connection; it is never reconnected.
    int close (connection_id_t connection_);

    //  Stores the QLINK_STATE_* of connection_.
    int state (connection_id_t connection_, int *state_);

    //  Opens an idle stream on connection_ that later sends pick up. The
    //  control stream does not count against QLINK_MAX_STREAMS. Fails
    //  with QLINK_ESTREAMLIMIT once the cap is reached.
    int open_stream (connection_id_t connection_, stream_id_t *stream_);

    //  Shuts the peer down. Must not be called from an event handler.
    int close ();

  protected:
    peer_t (context_t &context_, const char *name_);

    node_t *_node;

  private:
    peer_t (const peer_t &);
    const peer_t &operator= (const peer_t &);
};

class QLINK_EXPORT client_t : public peer_t
{
  public:
    explicit client_t (context_t &context_);

    //  Connects and waits for the handshake. Fails with QLINK_ECONNECTION.
    //  A connection that was up once is reconnected automatically.
    int connect (const std::string &endpoint_, connection_id_t *connection_);
};

class QLINK_EXPORT server_t : public peer_t
{
  public:
    explicit server_t (context_t &context_);

    int bind (const std::string &endpoint_);

    //  The endpoint bound last, with the actual port for tcp port 0.
    std::string last_endpoint () const;

    //  Waits for the next connection to complete its handshake. A negative
    //  timeout waits forever. Returns -1 with errno EAGAIN on timeout.
    int accept (connection_id_t *connection_, int timeout_ = -1);
};
}

#endif
