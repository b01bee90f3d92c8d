/* SPDX-License-Identifier: MPL-2.0 */

#include "core/io_thread.hpp"
#include "core/io_object.hpp"
#include "utils/condition_variable.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <boost/asio/post.hpp>

#include <chrono>

namespace
{
//  Completion slot for io_thread_t::call.
struct call_state_t
{
    call_state_t () : done (false) {}

    qlink::mutex_t sync;
    qlink::condition_variable_t cond;
    bool done;
};
}

qlink::io_thread_t::io_thread_t () :
    _work_guard (boost::asio::make_work_guard (_io_context)),
    _stopping (false)
{
}

qlink::io_thread_t::~io_thread_t ()
{
    stop ();
    destroy_retired ();
}

void qlink::io_thread_t::start (const char *name_)
{
    _worker.start (worker_routine, this, name_);
}

void qlink::io_thread_t::stop ()
{
    {
        scoped_lock_t lock (_sync);
        if (_stopping)
            return;
        _stopping = true;
    }
    QLINK_DBG ("IO", "stop requested");
    _work_guard.reset ();
    _io_context.stop ();
    _worker.stop ();
}

void qlink::io_thread_t::post (const std::function<void ()> &fn_)
{
    boost::asio::post (_io_context, fn_);
}

void qlink::io_thread_t::call (const std::function<void ()> &fn_)
{
    if (in_this_thread ()) {
        fn_ ();
        return;
    }

    call_state_t state;
    post ([&state, &fn_] () {
        fn_ ();
        scoped_lock_t lock (state.sync);
        state.done = true;
        state.cond.broadcast ();
    });

    scoped_lock_t lock (state.sync);
    while (!state.done) {
        const int rc = state.cond.wait (&state.sync, -1);
        errno_assert (rc == 0);
    }
}

void qlink::io_thread_t::retire (io_object_t *object_)
{
    qlink_assert (in_this_thread () || !_worker.get_started ());
    _retired.push_back (object_);
}

void qlink::io_thread_t::worker_routine (void *arg_)
{
    static_cast<io_thread_t *> (arg_)->loop ();
}

void qlink::io_thread_t::loop ()
{
    QLINK_DBG ("IO", "loop: started, this=%p", static_cast<void *> (this));

    while (!_io_context.stopped ()) {
        //  Process all ready handlers first and only block when none were
        //  ready, so bursts of completions are batched.
        const std::size_t events_processed = _io_context.poll ();
        if (events_processed == 0) {
            static const int max_poll_timeout_ms = 100;
            _io_context.run_for (
              std::chrono::milliseconds (max_poll_timeout_ms));
        }

        destroy_retired ();
    }

    QLINK_DBG ("IO", "loop: finished");
}

void qlink::io_thread_t::destroy_retired ()
{
    //  Destructors may retire further objects.
    while (!_retired.empty ()) {
        retired_t retired;
        retired.swap (_retired);
        for (retired_t::iterator it = retired.begin (); it != retired.end ();
             ++it)
            delete *it;
    }
}
