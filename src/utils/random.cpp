/* SPDX-License-Identifier: MPL-2.0 */

#include <stdlib.h>
#include <unistd.h>

#include "utils/random.hpp"
#include "utils/clock.hpp"
#include "utils/mutex.hpp"

namespace
{
qlink::mutex_t random_sync;
unsigned int random_state = 0;
bool random_seeded = false;
}

void qlink::seed_random ()
{
    const int pid = static_cast<int> (getpid ());
    scoped_lock_t lock (random_sync);
    random_state = static_cast<unsigned int> (clock_t::now_us () + pid);
    random_seeded = true;
}

uint32_t qlink::generate_random ()
{
    scoped_lock_t lock (random_sync);
    if (!random_seeded) {
        random_state = static_cast<unsigned int> (clock_t::now_us ()
                                                  + getpid ());
        random_seeded = true;
    }
    const uint32_t low = static_cast<uint32_t> (rand_r (&random_state));
    uint32_t high = static_cast<uint32_t> (rand_r (&random_state));
    high <<= (sizeof (int) * 8 - 1);
    return high | low;
}

void qlink::generate_random_bytes (unsigned char *buf_, size_t size_)
{
    size_t pos = 0;
    while (pos < size_) {
        uint32_t value = generate_random ();
        for (int i = 0; i < 4 && pos < size_; i++, pos++) {
            buf_[pos] = static_cast<unsigned char> (value & 0xff);
            value >>= 8;
        }
    }
}
