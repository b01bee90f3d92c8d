/* SPDX-License-Identifier: MPL-2.0 */

#include "session/reconnect_backoff.hpp"
#include "core/options.hpp"
#include "utils/random.hpp"

#include <limits>

qlink::reconnect_backoff_t::reconnect_backoff_t (const options_t &options_) :
    _options (options_),
    _current_ivl (-1),
    _attempts (0),
    _started_ms (0)
{
}

void qlink::reconnect_backoff_t::reset (uint64_t now_ms_)
{
    _current_ivl = -1;
    _attempts = 0;
    _started_ms = now_ms_;
}

int qlink::reconnect_backoff_t::next (uint64_t now_ms_)
{
    if (_options.reconnect_max_attempts > 0
        && _attempts >= _options.reconnect_max_attempts)
        return -1;
    if (_options.reconnect_max_duration > 0
        && now_ms_ - _started_ms
             >= static_cast<uint64_t> (_options.reconnect_max_duration))
        return -1;

    if (_current_ivl == -1)
        _current_ivl = _options.reconnect_ivl;
    else if (_options.reconnect_ivl_max > 0) {
        if (_current_ivl > std::numeric_limits<int>::max () / 2)
            _current_ivl = std::numeric_limits<int>::max ();
        else
            _current_ivl *= 2;
        if (_current_ivl > _options.reconnect_ivl_max)
            _current_ivl = _options.reconnect_ivl_max;
    }

    const int random_jitter =
      static_cast<int> (generate_random () % _options.reconnect_ivl);
    int interval = _current_ivl < std::numeric_limits<int>::max () - random_jitter
                     ? _current_ivl + random_jitter
                     : std::numeric_limits<int>::max ();
    if (_options.reconnect_ivl_max > 0 && interval > _options.reconnect_ivl_max)
        interval = _options.reconnect_ivl_max;

    _attempts++;
    return interval;
}
