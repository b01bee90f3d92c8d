/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/clock.hpp"
#include "utils/err.hpp"

#include <time.h>

uint64_t qlink::clock_t::now_us ()
{
    struct timespec tv;
    const int rc = clock_gettime (CLOCK_MONOTONIC, &tv);
    errno_assert (rc == 0);
    return static_cast<uint64_t> (tv.tv_sec) * 1000000
           + static_cast<uint64_t> (tv.tv_nsec) / 1000;
}

uint64_t qlink::clock_t::now_ms ()
{
    return now_us () / 1000;
}
