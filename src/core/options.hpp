/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_OPTIONS_HPP_INCLUDED__
#define __QLINK_OPTIONS_HPP_INCLUDED__

#include <string>
#include <stddef.h>

namespace qlink
{
struct options_t
{
    options_t ();

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    //  Heartbeat timeout with the interval fallback applied.
    int effective_heartbeat_timeout () const;

    //  Largest chunk payload the connection writes and accepts.
    int max_chunk_size;

    //  Heartbeat ping interval in milliseconds, 0 disables heartbeats.
    int heartbeat_ivl;

    //  Time to wait for a pong, -1 means heartbeat_ivl.
    int heartbeat_timeout;

    //  Consecutive missed pongs before the connection is dead.
    int heartbeat_missed;

    //  Count inbound data received after a ping as an acknowledgement.
    bool heartbeat_data_liveness;

    //  Outbound stream cap per connection, control stream excluded.
    int max_streams;

    //  Reconnect backoff base and cap in milliseconds.
    int reconnect_ivl;
    int reconnect_ivl_max;

    //  Reconnection gives up after this many attempts or this many
    //  milliseconds. 0 means unlimited.
    int reconnect_max_attempts;
    int reconnect_max_duration;

    //  Pub/sub queue depth per subscription and its overflow policy.
    int sub_queue_depth;
    int backpressure;

    //  Bounded wait of a blocking publish, in milliseconds.
    int publish_timeout;

    //  Maximum time from transport connect to peer hello.
    int handshake_ivl;

    //  Default timeout of request, in milliseconds.
    int request_timeout;

    //  Identity advertised to peers during handshake.
    std::string identity;

    //  Bitmask of QLINK_EVENT_* delivered to the application.
    int events;

    //  TLS material, each either PEM text or a file path. A server needs
    //  a certificate chain and key. A client verifies the server against
    //  tls_ca, or the system store when it is empty, and checks the
    //  certificate names tls_hostname when set.
    std::string tls_cert;
    std::string tls_key;
    std::string tls_ca;
    std::string tls_hostname;
};
}

#endif
