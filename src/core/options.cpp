/* SPDX-License-Identifier: MPL-2.0 */

#include "core/options.hpp"
#include "utils/err.hpp"
#include "qlink.h"

#include <string.h>
#include <limits.h>

namespace
{
//  Identities travel in the hello body and stay small.
const size_t max_identity_size = 255;

int option_invalid ()
{
    errno = EINVAL;
    return -1;
}

int do_setopt_string (const void *optval_,
                      size_t optvallen_,
                      std::string *out_)
{
    if (optval_ == NULL && optvallen_ == 0) {
        out_->clear ();
        return 0;
    }
    if (optval_ == NULL)
        return option_invalid ();
    out_->assign (static_cast<const char *> (optval_), optvallen_);
    return 0;
}

int do_getopt_string (void *optval_,
                      size_t *optvallen_,
                      const std::string &value_)
{
    if (*optvallen_ < value_.size ())
        return option_invalid ();
    memcpy (optval_, value_.data (), value_.size ());
    *optvallen_ = value_.size ();
    return 0;
}

int do_getopt_int (void *optval_, size_t *optvallen_, int value_)
{
    if (*optvallen_ != sizeof (int))
        return option_invalid ();
    memcpy (optval_, &value_, sizeof (int));
    return 0;
}
}

qlink::options_t::options_t () :
    max_chunk_size (16384),
    heartbeat_ivl (1000),
    heartbeat_timeout (-1),
    heartbeat_missed (3),
    heartbeat_data_liveness (false),
    max_streams (16),
    reconnect_ivl (100),
    reconnect_ivl_max (5000),
    reconnect_max_attempts (10),
    reconnect_max_duration (0),
    sub_queue_depth (1000),
    backpressure (QLINK_BACKPRESSURE_DROP_OLDEST),
    publish_timeout (1000),
    handshake_ivl (30000),
    request_timeout (5000),
    events (QLINK_EVENT_ALL)
{
}

int qlink::options_t::effective_heartbeat_timeout () const
{
    return heartbeat_timeout == -1 ? heartbeat_ivl : heartbeat_timeout;
}

int qlink::options_t::setopt (int option_,
                              const void *optval_,
                              size_t optvallen_)
{
    const bool is_int = (optvallen_ == sizeof (int));
    int value = 0;
    if (is_int)
        memcpy (&value, optval_, sizeof (int));

    switch (option_) {
        case QLINK_MAX_CHUNK_SIZE:
            if (is_int && value > 0) {
                max_chunk_size = value;
                return 0;
            }
            break;

        case QLINK_HEARTBEAT_IVL:
            if (is_int && value >= 0) {
                heartbeat_ivl = value;
                return 0;
            }
            break;

        case QLINK_HEARTBEAT_TIMEOUT:
            if (is_int && (value > 0 || value == -1)) {
                heartbeat_timeout = value;
                return 0;
            }
            break;

        case QLINK_HEARTBEAT_MISSED:
            if (is_int && value > 0) {
                heartbeat_missed = value;
                return 0;
            }
            break;

        case QLINK_HEARTBEAT_DATA_LIVENESS:
            if (is_int && (value == 0 || value == 1)) {
                heartbeat_data_liveness = (value != 0);
                return 0;
            }
            break;

        case QLINK_MAX_STREAMS:
            if (is_int && value > 0) {
                max_streams = value;
                return 0;
            }
            break;

        case QLINK_RECONNECT_IVL:
            if (is_int && value > 0) {
                reconnect_ivl = value;
                return 0;
            }
            break;

        case QLINK_RECONNECT_IVL_MAX:
            if (is_int && value >= 0) {
                reconnect_ivl_max = value;
                return 0;
            }
            break;

        case QLINK_RECONNECT_MAX_ATTEMPTS:
            if (is_int && value >= 0) {
                reconnect_max_attempts = value;
                return 0;
            }
            break;

        case QLINK_RECONNECT_MAX_DURATION:
            if (is_int && value >= 0) {
                reconnect_max_duration = value;
                return 0;
            }
            break;

        case QLINK_SUB_QUEUE_DEPTH:
            if (is_int && value > 0) {
                sub_queue_depth = value;
                return 0;
            }
            break;

        case QLINK_BACKPRESSURE:
            if (is_int
                && (value == QLINK_BACKPRESSURE_BLOCK
                    || value == QLINK_BACKPRESSURE_DROP_OLDEST)) {
                backpressure = value;
                return 0;
            }
            break;

        case QLINK_PUBLISH_TIMEOUT:
            if (is_int && value >= 0) {
                publish_timeout = value;
                return 0;
            }
            break;

        case QLINK_HANDSHAKE_IVL:
            if (is_int && value > 0) {
                handshake_ivl = value;
                return 0;
            }
            break;

        case QLINK_REQUEST_TIMEOUT:
            if (is_int && value > 0) {
                request_timeout = value;
                return 0;
            }
            break;

        case QLINK_IDENTITY:
            if (optval_ == NULL && optvallen_ == 0) {
                identity.clear ();
                return 0;
            }
            if (optval_ != NULL && optvallen_ <= max_identity_size) {
                identity.assign (static_cast<const char *> (optval_),
                                 optvallen_);
                return 0;
            }
            break;

        case QLINK_EVENTS:
            if (is_int && value >= 0) {
                events = value;
                return 0;
            }
            break;

        case QLINK_TLS_CERT:
            return do_setopt_string (optval_, optvallen_, &tls_cert);
        case QLINK_TLS_KEY:
            return do_setopt_string (optval_, optvallen_, &tls_key);
        case QLINK_TLS_CA:
            return do_setopt_string (optval_, optvallen_, &tls_ca);
        case QLINK_TLS_HOSTNAME:
            return do_setopt_string (optval_, optvallen_, &tls_hostname);

        default:
            break;
    }
    return option_invalid ();
}

int qlink::options_t::getopt (int option_,
                              void *optval_,
                              size_t *optvallen_) const
{
    switch (option_) {
        case QLINK_MAX_CHUNK_SIZE:
            return do_getopt_int (optval_, optvallen_, max_chunk_size);
        case QLINK_HEARTBEAT_IVL:
            return do_getopt_int (optval_, optvallen_, heartbeat_ivl);
        case QLINK_HEARTBEAT_TIMEOUT:
            return do_getopt_int (optval_, optvallen_, heartbeat_timeout);
        case QLINK_HEARTBEAT_MISSED:
            return do_getopt_int (optval_, optvallen_, heartbeat_missed);
        case QLINK_HEARTBEAT_DATA_LIVENESS:
            return do_getopt_int (optval_, optvallen_,
                                  heartbeat_data_liveness ? 1 : 0);
        case QLINK_MAX_STREAMS:
            return do_getopt_int (optval_, optvallen_, max_streams);
        case QLINK_RECONNECT_IVL:
            return do_getopt_int (optval_, optvallen_, reconnect_ivl);
        case QLINK_RECONNECT_IVL_MAX:
            return do_getopt_int (optval_, optvallen_, reconnect_ivl_max);
        case QLINK_RECONNECT_MAX_ATTEMPTS:
            return do_getopt_int (optval_, optvallen_,
                                  reconnect_max_attempts);
        case QLINK_RECONNECT_MAX_DURATION:
            return do_getopt_int (optval_, optvallen_,
                                  reconnect_max_duration);
        case QLINK_SUB_QUEUE_DEPTH:
            return do_getopt_int (optval_, optvallen_, sub_queue_depth);
        case QLINK_BACKPRESSURE:
            return do_getopt_int (optval_, optvallen_, backpressure);
        case QLINK_PUBLISH_TIMEOUT:
            return do_getopt_int (optval_, optvallen_, publish_timeout);
        case QLINK_HANDSHAKE_IVL:
            return do_getopt_int (optval_, optvallen_, handshake_ivl);
        case QLINK_REQUEST_TIMEOUT:
            return do_getopt_int (optval_, optvallen_, request_timeout);
        case QLINK_EVENTS:
            return do_getopt_int (optval_, optvallen_, events);

        case QLINK_IDENTITY:
            return do_getopt_string (optval_, optvallen_, identity);
        case QLINK_TLS_CERT:
            return do_getopt_string (optval_, optvallen_, tls_cert);
        case QLINK_TLS_KEY:
            return do_getopt_string (optval_, optvallen_, tls_key);
        case QLINK_TLS_CA:
            return do_getopt_string (optval_, optvallen_, tls_ca);
        case QLINK_TLS_HOSTNAME:
            return do_getopt_string (optval_, optvallen_, tls_hostname);

        default:
            break;
    }
    return option_invalid ();
}
