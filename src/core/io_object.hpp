/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_IO_OBJECT_HPP_INCLUDED__
#define __QLINK_IO_OBJECT_HPP_INCLUDED__

#include "utils/macros.hpp"

#include <boost/asio/steady_timer.hpp>

#include <map>
#include <memory>
#include <stdint.h>

namespace qlink
{
class io_thread_t;

//  Base for objects living on an I/O thread. Provides id-keyed timers
//  whose handlers never reach the object after cancellation or
//  destruction.

class io_object_t
{
  public:
    io_object_t (io_thread_t *io_thread_);
    virtual ~io_object_t ();

    io_thread_t *get_io_thread () const { return _io_thread; }

  protected:
    //  Arms timer id_ to fire after timeout_ ms. An armed timer with the
    //  same id is replaced.
    void add_timer (int timeout_, int id_);
    void cancel_timer (int id_);
    void cancel_timers ();

    virtual void timer_event (int id_);

    //  Token that expires when the object is destroyed. Async handlers
    //  capture it and bail out once it has expired.
    typedef std::weak_ptr<io_object_t *> liveness_t;
    liveness_t liveness () const { return _alive; }

    //  Resolves a liveness token captured by a handler, NULL if gone.
    static io_object_t *resolve (const liveness_t &token_);

  private:
    void timer_fired (int id_, uint64_t generation_);

    struct timer_entry_t
    {
        boost::asio::steady_timer *timer;
        uint64_t generation;
    };
    typedef std::map<int, timer_entry_t> timers_t;
    timers_t _timers;
    uint64_t _timer_generation;

    io_thread_t *const _io_thread;
    std::shared_ptr<io_object_t *> _alive;

    QLINK_NON_COPYABLE_NOR_MOVABLE (io_object_t)
};
}

#endif
