/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_RECONNECT_BACKOFF_HPP_INCLUDED__
#define __QLINK_RECONNECT_BACKOFF_HPP_INCLUDED__

#include <stdint.h>

namespace qlink
{
struct options_t;

//  Retry schedule of one reconnection episode. With reconnect_ivl_max set
//  the interval doubles from reconnect_ivl up to the cap; without it every
//  attempt waits reconnect_ivl. Random jitter below reconnect_ivl is added
//  in both cases and the result never exceeds the cap.
class reconnect_backoff_t
{
  public:
    explicit reconnect_backoff_t (const options_t &options_);

    //  Starts a new episode at now_ms_.
    void reset (uint64_t now_ms_);

    //  Interval to wait before the next attempt, or -1 once the attempt
    //  count or the episode duration is exhausted.
    int next (uint64_t now_ms_);

    int attempts () const { return _attempts; }

  private:
    const options_t &_options;
    int _current_ivl;
    int _attempts;
    uint64_t _started_ms;
};
}

#endif
