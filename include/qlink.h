/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_H_INCLUDED__
#define __QLINK_H_INCLUDED__

/*  Version macros for compile-time API version detection                     */
#define QLINK_VERSION_MAJOR 1
#define QLINK_VERSION_MINOR 0
#define QLINK_VERSION_PATCH 0

#define QLINK_MAKE_VERSION(major, minor, patch)                                \
    ((major) *10000 + (minor) *100 + (patch))
#define QLINK_VERSION                                                          \
    QLINK_MAKE_VERSION (QLINK_VERSION_MAJOR, QLINK_VERSION_MINOR,              \
                        QLINK_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#include <errno.h>
#include <stddef.h>

/*  Handle DSO symbol visibility                                             */
#if defined QLINK_NO_EXPORT
#define QLINK_EXPORT
#else
#if defined __GNUC__ && __GNUC__ >= 4
#define QLINK_EXPORT __attribute__ ((visibility ("default")))
#else
#define QLINK_EXPORT
#endif
#endif

/******************************************************************************/
/*  qlink errors.                                                             */
/******************************************************************************/

/*  A number random enough not to collide with different errno ranges on      */
/*  different OSes. The assumption is that error_t is at least 32-bit type.   */
#define QLINK_HAUSNUMERO 156485712

/*  Transport could not be established (refused, unresolvable, handshake     */
/*  timed out).                                                               */
#define QLINK_ECONNECTION (QLINK_HAUSNUMERO + 1)
/*  Per-connection stream cap reached.                                        */
#define QLINK_ESTREAMLIMIT (QLINK_HAUSNUMERO + 2)
/*  Chunk failed validation or arrived out of order.                          */
#define QLINK_EMALFORMED (QLINK_HAUSNUMERO + 3)
/*  Peer stopped acknowledging heartbeats.                                    */
#define QLINK_EHEARTBEAT (QLINK_HAUSNUMERO + 4)
/*  Message dropped by the drop_oldest backpressure policy.                   */
#define QLINK_EDROPPED (QLINK_HAUSNUMERO + 5)
/*  Reconnection abandoned.                                                   */
#define QLINK_EUNREACHABLE (QLINK_HAUSNUMERO + 6)
/*  Operation cancelled by the caller.                                        */
#define QLINK_ECANCELED (QLINK_HAUSNUMERO + 7)
/*  Node was terminated.                                                      */
#define QLINK_ETERM (QLINK_HAUSNUMERO + 8)

/*  This function retrieves the errno as it is known to qlink library. The    */
/*  goal of this function is to make the code 100% portable, including where  */
/*  qlink compiled with certain CRT library (on Windows) is linked to an      */
/*  application that uses different CRT library.                              */
QLINK_EXPORT int qlink_errno (void);

/*  Resolves system errors and qlink errors to human-readable string.         */
QLINK_EXPORT const char *qlink_strerror (int errnum_);

/*  Run-time API version detection                                           */
QLINK_EXPORT void qlink_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  Options.                                                                  */
/******************************************************************************/

#define QLINK_MAX_CHUNK_SIZE 1
#define QLINK_HEARTBEAT_IVL 2
#define QLINK_HEARTBEAT_TIMEOUT 3
#define QLINK_HEARTBEAT_MISSED 4
#define QLINK_HEARTBEAT_DATA_LIVENESS 5
#define QLINK_MAX_STREAMS 6
#define QLINK_RECONNECT_IVL 7
#define QLINK_RECONNECT_IVL_MAX 8
#define QLINK_RECONNECT_MAX_ATTEMPTS 9
#define QLINK_RECONNECT_MAX_DURATION 10
#define QLINK_SUB_QUEUE_DEPTH 11
#define QLINK_BACKPRESSURE 12
#define QLINK_PUBLISH_TIMEOUT 13
#define QLINK_HANDSHAKE_IVL 14
#define QLINK_REQUEST_TIMEOUT 15
#define QLINK_IDENTITY 16
#define QLINK_EVENTS 17
#define QLINK_TLS_CERT 18
#define QLINK_TLS_KEY 19
#define QLINK_TLS_CA 20
#define QLINK_TLS_HOSTNAME 21

/*  Backpressure policies                                                     */
#define QLINK_BACKPRESSURE_BLOCK 0
#define QLINK_BACKPRESSURE_DROP_OLDEST 1

/*  Connection health, as reported by the state query                        */
#define QLINK_STATE_CONNECTING 0
#define QLINK_STATE_LIVE 1
#define QLINK_STATE_DEGRADED 2
#define QLINK_STATE_DEAD 3

/*  Message types carried in the message header                              */
#define QLINK_MSG_HELLO 1
#define QLINK_MSG_DATA 2
#define QLINK_MSG_PUBLISH 3
#define QLINK_MSG_SUBSCRIBE 4
#define QLINK_MSG_UNSUBSCRIBE 5
#define QLINK_MSG_REQUEST 6
#define QLINK_MSG_REPLY 7

/******************************************************************************/
/*  Events.                                                                   */
/******************************************************************************/

#define QLINK_EVENT_CONNECTED 0x0001
#define QLINK_EVENT_DISCONNECTED 0x0002
#define QLINK_EVENT_RECONNECTING 0x0004
#define QLINK_EVENT_MESSAGE_RECEIVED 0x0008
#define QLINK_EVENT_UNREACHABLE 0x0010
#define QLINK_EVENT_DEGRADED 0x0020
#define QLINK_EVENT_MALFORMED_CHUNK 0x0040
#define QLINK_EVENT_MESSAGE_DROPPED 0x0080
#define QLINK_EVENT_ALL 0xFFFF

#ifdef __cplusplus
}
#endif

#endif
