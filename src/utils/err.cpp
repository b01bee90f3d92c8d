/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/err.hpp"
#include "utils/macros.hpp"
#include "qlink.h"

const char *qlink::errno_to_string (int errno_)
{
    switch (errno_) {
        case QLINK_ECONNECTION:
            return "Connection could not be established";
        case QLINK_ESTREAMLIMIT:
            return "Stream limit exceeded";
        case QLINK_EMALFORMED:
            return "Malformed chunk";
        case QLINK_EHEARTBEAT:
            return "Heartbeat timeout";
        case QLINK_EDROPPED:
            return "Message dropped";
        case QLINK_EUNREACHABLE:
            return "Peer unreachable";
        case QLINK_ECANCELED:
            return "Operation cancelled";
        case QLINK_ETERM:
            return "Node was terminated";
        default:
            return strerror (errno_);
    }
}

void qlink::qlink_abort (const char *errmsg_)
{
    LIBQLINK_UNUSED (errmsg_);
    abort ();
}
