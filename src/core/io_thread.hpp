/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_IO_THREAD_HPP_INCLUDED__
#define __QLINK_IO_THREAD_HPP_INCLUDED__

#include "core/thread.hpp"
#include "utils/macros.hpp"
#include "utils/mutex.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>

#include <functional>
#include <vector>

namespace qlink
{
class io_object_t;

//  Event loop thread. Runs a Boost.Asio io_context on a dedicated thread;
//  everything owned by a node (transports, connections, timers) lives on
//  it. Other threads hand work over with post or call.

class io_thread_t
{
  public:
    io_thread_t ();
    ~io_thread_t ();

    void start (const char *name_);

    //  Stops the loop and joins the thread. Handlers still queued are
    //  destroyed with the io_context without running. Idempotent.
    void stop ();

    boost::asio::io_context &get_io_context () { return _io_context; }

    //  Queues fn_ for execution on the loop thread.
    void post (const std::function<void ()> &fn_);

    //  Runs fn_ on the loop thread and waits for it to finish. Runs inline
    //  when called from the loop thread itself.
    void call (const std::function<void ()> &fn_);

    bool in_this_thread () const { return _worker.is_current_thread (); }

    //  Deletes the object at the end of the current loop iteration, once
    //  the handler that retired it has unwound.
    void retire (io_object_t *object_);

  private:
    static void worker_routine (void *arg_);
    void loop ();
    void destroy_retired ();

    boost::asio::io_context _io_context;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      _work_guard;

    typedef std::vector<io_object_t *> retired_t;
    retired_t _retired;

    thread_t _worker;
    bool _stopping;
    mutex_t _sync;

    QLINK_NON_COPYABLE_NOR_MOVABLE (io_thread_t)
};
}

#endif
