/* SPDX-License-Identifier: MPL-2.0 */

#include "transports/tls/tls_context.hpp"
#include "core/options.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <openssl/err.h>

#include <boost/asio/buffer.hpp>

namespace
{
namespace ssl = boost::asio::ssl;

bool is_pem (const std::string &value_)
{
    return value_.compare (0, 11, "-----BEGIN ") == 0;
}

int make_context (ssl::context::method method_,
                  qlink::tls_context_ptr_t *context_)
{
    try {
        context_->reset (new ssl::context (method_));
    }
    catch (const boost::system::system_error &e) {
        QLINK_GLOBAL_ERROR ("TLS context creation failed: %s", e.what ());
        errno = ENOMEM;
        return -1;
    }

    boost::system::error_code ec;
    (*context_)->set_options (ssl::context::default_workarounds
                                | ssl::context::no_sslv2
                                | ssl::context::no_sslv3
                                | ssl::context::no_tlsv1
                                | ssl::context::no_tlsv1_1,
                              ec);
    if (ec) {
        QLINK_GLOBAL_ERROR ("TLS options rejected: %s",
                            ec.message ().c_str ());
        context_->reset ();
        errno = EINVAL;
        return -1;
    }
    return 0;
}

int load_failed (const char *what_,
                 const boost::system::error_code &ec_,
                 qlink::tls_context_ptr_t *context_)
{
    QLINK_GLOBAL_ERROR ("TLS %s failed to load: %s (%s)", what_,
                        ec_.message ().c_str (),
                        qlink::tls_error_string ().c_str ());
    context_->reset ();
    errno = EINVAL;
    return -1;
}
}

int qlink::create_tls_server_context (const options_t &options_,
                                      tls_context_ptr_t *context_)
{
    if (options_.tls_cert.empty () || options_.tls_key.empty ()) {
        errno = EINVAL;
        return -1;
    }
    if (make_context (ssl::context::tls_server, context_) != 0)
        return -1;
    ssl::context &context = **context_;

    boost::system::error_code ec;
    if (is_pem (options_.tls_cert))
        context.use_certificate_chain (
          boost::asio::buffer (options_.tls_cert.data (),
                               options_.tls_cert.size ()),
          ec);
    else
        context.use_certificate_chain_file (options_.tls_cert, ec);
    if (ec)
        return load_failed ("certificate", ec, context_);

    if (is_pem (options_.tls_key))
        context.use_private_key (boost::asio::buffer (options_.tls_key.data (),
                                                      options_.tls_key.size ()),
                                 ssl::context::pem, ec);
    else
        context.use_private_key_file (options_.tls_key, ssl::context::pem, ec);
    if (ec)
        return load_failed ("private key", ec, context_);

    context.set_verify_mode (ssl::verify_none, ec);
    qlink_assert (!ec);
    return 0;
}

int qlink::create_tls_client_context (const options_t &options_,
                                      tls_context_ptr_t *context_)
{
    if (make_context (ssl::context::tls_client, context_) != 0)
        return -1;
    ssl::context &context = **context_;

    boost::system::error_code ec;
    if (options_.tls_ca.empty ())
        context.set_default_verify_paths (ec);
    else if (is_pem (options_.tls_ca))
        context.add_certificate_authority (
          boost::asio::buffer (options_.tls_ca.data (), options_.tls_ca.size ()),
          ec);
    else
        context.load_verify_file (options_.tls_ca, ec);
    if (ec)
        return load_failed ("CA", ec, context_);

    context.set_verify_mode (ssl::verify_peer, ec);
    qlink_assert (!ec);
    return 0;
}

std::string qlink::tls_error_string ()
{
    const unsigned long code = ERR_get_error ();
    if (code == 0)
        return std::string ("no OpenSSL error");
    char buffer[256];
    ERR_error_string_n (code, buffer, sizeof buffer);
    return std::string (buffer);
}
