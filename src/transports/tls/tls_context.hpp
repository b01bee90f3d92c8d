/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_TLS_CONTEXT_HPP_INCLUDED__
#define __QLINK_TLS_CONTEXT_HPP_INCLUDED__

#include <boost/asio/ssl/context.hpp>

#include <memory>
#include <string>

namespace qlink
{
struct options_t;

//  Shared by every stream created from it; outlives them.
typedef std::shared_ptr<boost::asio::ssl::context> tls_context_ptr_t;

//  Builds a TLS 1.2+ server context from the certificate chain and key in
//  options_. Returns -1 with errno EINVAL if either is missing or fails to
//  load.
int create_tls_server_context (const options_t &options_,
                               tls_context_ptr_t *context_);

//  Builds a client context that verifies peers against options_.tls_ca,
//  or the system store when unset. Returns -1 with errno EINVAL if the CA
//  fails to load.
int create_tls_client_context (const options_t &options_,
                               tls_context_ptr_t *context_);

//  Text of the most recent OpenSSL error, for diagnostics.
std::string tls_error_string ();
}

#endif
