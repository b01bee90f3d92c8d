/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_CONDITION_VARIABLE_HPP_INCLUDED__
#define __QLINK_CONDITION_VARIABLE_HPP_INCLUDED__

#include "utils/err.hpp"
#include "utils/macros.hpp"
#include "utils/mutex.hpp"

#include <pthread.h>
#include <time.h>

namespace qlink
{
//  Condition variable bound to a qlink mutex. The caller must hold the
//  mutex exactly once while waiting.
class condition_variable_t
{
  public:
    inline condition_variable_t ()
    {
        pthread_condattr_t attr;
        pthread_condattr_init (&attr);
        pthread_condattr_setclock (&attr, CLOCK_MONOTONIC);
        const int rc = pthread_cond_init (&_cond, &attr);
        posix_assert (rc);
        pthread_condattr_destroy (&attr);
    }

    inline ~condition_variable_t ()
    {
        const int rc = pthread_cond_destroy (&_cond);
        posix_assert (rc);
    }

    //  Waits for a signal or for timeout_ milliseconds. A negative timeout
    //  waits forever. Returns -1 with errno EAGAIN on timeout.
    inline int wait (mutex_t *mutex_, int timeout_)
    {
        int rc;
        if (timeout_ < 0) {
            rc = pthread_cond_wait (&_cond, mutex_->get_mutex ());
            posix_assert (rc);
            return 0;
        }

        struct timespec timeout;
        clock_gettime (CLOCK_MONOTONIC, &timeout);
        timeout.tv_sec += timeout_ / 1000;
        timeout.tv_nsec += (timeout_ % 1000) * 1000000;
        if (timeout.tv_nsec >= 1000000000) {
            timeout.tv_sec++;
            timeout.tv_nsec -= 1000000000;
        }
        rc = pthread_cond_timedwait (&_cond, mutex_->get_mutex (), &timeout);
        if (rc == ETIMEDOUT) {
            errno = EAGAIN;
            return -1;
        }
        posix_assert (rc);
        return 0;
    }

    inline void broadcast ()
    {
        const int rc = pthread_cond_broadcast (&_cond);
        posix_assert (rc);
    }

  private:
    pthread_cond_t _cond;

    QLINK_NON_COPYABLE_NOR_MOVABLE (condition_variable_t)
};
}

#endif
