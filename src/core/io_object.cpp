/* SPDX-License-Identifier: MPL-2.0 */

#include "core/io_object.hpp"
#include "core/io_thread.hpp"
#include "utils/err.hpp"

#include <chrono>

qlink::io_object_t::io_object_t (io_thread_t *io_thread_) :
    _timer_generation (0),
    _io_thread (io_thread_),
    _alive (std::make_shared<io_object_t *> (this))
{
}

qlink::io_object_t::~io_object_t ()
{
    _alive.reset ();
    cancel_timers ();
}

void qlink::io_object_t::add_timer (int timeout_, int id_)
{
    cancel_timer (id_);

    timer_entry_t entry;
    entry.timer = new (std::nothrow)
      boost::asio::steady_timer (_io_thread->get_io_context ());
    alloc_assert (entry.timer);
    entry.generation = ++_timer_generation;
    _timers.insert (timers_t::value_type (id_, entry));

    entry.timer->expires_after (std::chrono::milliseconds (timeout_));
    const liveness_t token = _alive;
    const uint64_t generation = entry.generation;
    entry.timer->async_wait (
      [token, id_, generation] (const boost::system::error_code &ec_) {
          if (ec_ == boost::asio::error::operation_aborted)
              return;
          io_object_t *self = resolve (token);
          if (self)
              self->timer_fired (id_, generation);
      });
}

void qlink::io_object_t::cancel_timer (int id_)
{
    const timers_t::iterator it = _timers.find (id_);
    if (it == _timers.end ())
        return;
    boost::asio::steady_timer *timer = it->second.timer;
    _timers.erase (it);
    timer->cancel ();
    delete timer;
}

void qlink::io_object_t::cancel_timers ()
{
    while (!_timers.empty ())
        cancel_timer (_timers.begin ()->first);
}

void qlink::io_object_t::timer_event (int)
{
    qlink_assert (false);
}

qlink::io_object_t *qlink::io_object_t::resolve (const liveness_t &token_)
{
    const std::shared_ptr<io_object_t *> alive = token_.lock ();
    return alive ? *alive : NULL;
}

void qlink::io_object_t::timer_fired (int id_, uint64_t generation_)
{
    //  A handler that completed before its timer was cancelled or re-armed
    //  is stale.
    const timers_t::iterator it = _timers.find (id_);
    if (it == _timers.end () || it->second.generation != generation_)
        return;
    boost::asio::steady_timer *timer = it->second.timer;
    _timers.erase (it);
    delete timer;
    timer_event (id_);
}
