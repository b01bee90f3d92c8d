/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_DEBUG_HPP_INCLUDED__
#define __QLINK_DEBUG_HPP_INCLUDED__

#include <cstdio>

//  Debug macros for qlink components
//  Enable with -DQLINK_DEBUG=1 during compilation
//
//  Usage:
//    QLINK_DBG_CONN ("heartbeat missed: %d", missed);
//    QLINK_DBG_STREAM ("stream %u reset", stream_id);
//    QLINK_GLOBAL_WARN ("unknown option %d", option);

#ifdef QLINK_DEBUG

#define QLINK_DBG(category, fmt, ...)                                          \
    do {                                                                       \
        fprintf (stderr, "[QLINK:" category "] " fmt "\n", ##__VA_ARGS__);     \
    } while (0)

#define QLINK_DBG_THIS(category, fmt, ...)                                     \
    do {                                                                       \
        fprintf (stderr, "[QLINK:" category ":%p] " fmt "\n",                  \
                 static_cast<const void *> (this), ##__VA_ARGS__);             \
    } while (0)

#else

#define QLINK_DBG(category, fmt, ...) ((void) 0)
#define QLINK_DBG_THIS(category, fmt, ...) ((void) 0)

#endif

//  Component-specific macros
#define QLINK_DBG_CONN(fmt, ...) QLINK_DBG_THIS ("CONN", fmt, ##__VA_ARGS__)
#define QLINK_DBG_STREAM(fmt, ...) QLINK_DBG_THIS ("STREAM", fmt, ##__VA_ARGS__)
#define QLINK_DBG_MANAGER(fmt, ...)                                            \
    QLINK_DBG_THIS ("MANAGER", fmt, ##__VA_ARGS__)
#define QLINK_DBG_ROUTER(fmt, ...) QLINK_DBG_THIS ("ROUTER", fmt, ##__VA_ARGS__)
#define QLINK_DBG_TRANSPORT(fmt, ...)                                          \
    QLINK_DBG_THIS ("TRANSPORT", fmt, ##__VA_ARGS__)
#define QLINK_DBG_NODE(fmt, ...) QLINK_DBG_THIS ("NODE", fmt, ##__VA_ARGS__)

//  Severity-based macros (with this pointer)
#define QLINK_LOG_ERROR(fmt, ...) QLINK_DBG_THIS ("ERROR", fmt, ##__VA_ARGS__)
#define QLINK_LOG_WARN(fmt, ...) QLINK_DBG_THIS ("WARN", fmt, ##__VA_ARGS__)
#define QLINK_LOG_INFO(fmt, ...) QLINK_DBG_THIS ("INFO", fmt, ##__VA_ARGS__)

//  Global severity macros (without this pointer)
#define QLINK_GLOBAL_ERROR(fmt, ...) QLINK_DBG ("ERROR", fmt, ##__VA_ARGS__)
#define QLINK_GLOBAL_WARN(fmt, ...) QLINK_DBG ("WARN", fmt, ##__VA_ARGS__)
#define QLINK_GLOBAL_INFO(fmt, ...) QLINK_DBG ("INFO", fmt, ##__VA_ARGS__)

#endif
