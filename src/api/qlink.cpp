/* SPDX-License-Identifier: MPL-2.0 */

#include "qlink.hpp"
#include "api/node.hpp"
#include "core/ctx.hpp"
#include "transports/address.hpp"
#include "utils/err.hpp"

#include <new>
#include <vector>

namespace
{
const size_t max_string_option = 1024 * 1024;
}

void qlink_version (int *major_, int *minor_, int *patch_)
{
    *major_ = QLINK_VERSION_MAJOR;
    *minor_ = QLINK_VERSION_MINOR;
    *patch_ = QLINK_VERSION_PATCH;
}

const char *qlink_strerror (int errnum_)
{
    return qlink::errno_to_string (errnum_);
}

int qlink_errno (void)
{
    return errno;
}

//  Context

qlink::context_t::context_t () : _ctx (new (std::nothrow) ctx_t)
{
    alloc_assert (_ctx);
}

qlink::context_t::~context_t ()
{
    delete _ctx;
}

int qlink::context_t::partition (const std::string &endpoint_,
                                 bool partitioned_)
{
    address_t address;
    if (address.parse (endpoint_) != 0)
        return -1;
    if (address.protocol != protocol_name::inproc) {
        errno = EINVAL;
        return -1;
    }
    _ctx->set_partitioned (address.address, partitioned_);
    return 0;
}

//  Peer

qlink::peer_t::peer_t (context_t &context_, const char *name_) :
    _node (new (std::nothrow) node_t (context_.get (), name_))
{
    alloc_assert (_node);
}

qlink::peer_t::~peer_t ()
{
    delete _node;
}

int qlink::peer_t::set (int option_, int value_)
{
    return _node->setopt (option_, &value_, sizeof value_);
}

int qlink::peer_t::set (int option_, const std::string &value_)
{
    return _node->setopt (option_, value_.data (), value_.size ());
}

int qlink::peer_t::get (int option_, int *value_) const
{
    size_t size = sizeof (int);
    return _node->getopt (option_, value_, &size);
}

int qlink::peer_t::get (int option_, std::string *value_) const
{
    //  Certificate chains may be large; grow until the value fits.
    for (size_t capacity = 256; capacity <= max_string_option;
         capacity *= 4) {
        std::vector<char> buffer (capacity);
        size_t size = capacity;
        if (_node->getopt (option_, &buffer[0], &size) == 0) {
            value_->assign (&buffer[0], size);
            return 0;
        }
        if (errno != EINVAL)
            return -1;
    }
    return -1;
}

int qlink::peer_t::send (connection_id_t connection_,
                         const void *data_,
                         size_t size_)
{
    return _node->send (connection_, QLINK_MSG_DATA, 0, data_, size_);
}

int qlink::peer_t::send_async (connection_id_t connection_,
                               const void *data_,
                               size_t size_,
                               uint64_t *op_,
                               const completion_t &done_)
{
    return _node->send_async (connection_, data_, size_, op_, done_);
}

int qlink::peer_t::cancel (uint64_t op_)
{
    return _node->cancel (op_);
}

int qlink::peer_t::send_all (const void *data_, size_t size_)
{
    return _node->send_all (data_, size_);
}

int qlink::peer_t::request (connection_id_t connection_,
                            const void *data_,
                            size_t size_,
                            std::string *reply_,
                            int timeout_)
{
    return _node->request (connection_, data_, size_, reply_, timeout_);
}

int qlink::peer_t::reply (connection_id_t connection_,
                          uint64_t correlation_id_,
                          const void *data_,
                          size_t size_)
{
    return _node->send (connection_, QLINK_MSG_REPLY, correlation_id_, data_,
                        size_);
}

int qlink::peer_t::publish (const std::string &topic_,
                            const void *data_,
                            size_t size_,
                            uint64_t *op_)
{
    return _node->publish (topic_, data_, size_, op_);
}

int qlink::peer_t::subscribe (const std::string &topic_,
                              subscription_id_t *id_,
                              const filter_t &filter_)
{
    return _node->subscribe (topic_, filter_, id_);
}

int qlink::peer_t::subscribe_connection (connection_id_t connection_,
                                         const std::string &topic_,
                                         subscription_id_t *id_,
                                         const filter_t &filter_)
{
    return _node->subscribe_connection (connection_, topic_, filter_, id_);
}

int qlink::peer_t::unsubscribe (subscription_id_t id_)
{
    return _node->unsubscribe (id_);
}

void qlink::peer_t::on_event (i_event_handler *handler_)
{
    _node->set_handler (handler_);
}

int qlink::peer_t::recv_event (event_t *event_, int timeout_)
{
    return _node->recv_event (event_, timeout_);
}

int qlink::peer_t::close (connection_id_t connection_)
{
    return _node->close_connection (connection_);
}

int qlink::peer_t::state (connection_id_t connection_, int *state_)
{
    return _node->state (connection_, state_);
}

int qlink::peer_t::open_stream (connection_id_t connection_,
                               stream_id_t *stream_)
{
    return _node->open_stream (connection_, stream_);
}

int qlink::peer_t::close ()
{
    return _node->close ();
}

//  Client

qlink::client_t::client_t (context_t &context_) : peer_t (context_, "qlink/client")
{
}

int qlink::client_t::connect (const std::string &endpoint_,
                              connection_id_t *connection_)
{
    return _node->connect (endpoint_, connection_);
}

//  Server

qlink::server_t::server_t (context_t &context_) : peer_t (context_, "qlink/server")
{
}

int qlink::server_t::bind (const std::string &endpoint_)
{
    return _node->bind (endpoint_);
}

std::string qlink::server_t::last_endpoint () const
{
    return _node->last_endpoint ();
}

int qlink::server_t::accept (connection_id_t *connection_, int timeout_)
{
    return _node->accept (connection_, timeout_);
}
