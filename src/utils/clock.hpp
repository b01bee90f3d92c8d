/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_CLOCK_HPP_INCLUDED__
#define __QLINK_CLOCK_HPP_INCLUDED__

#include <stdint.h>

namespace qlink
{
class clock_t
{
  public:
    //  Monotonic time in microseconds.
    static uint64_t now_us ();

    //  Monotonic time in milliseconds.
    static uint64_t now_ms ();
};
}

#endif
