/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_THREAD_HPP_INCLUDED__
#define __QLINK_THREAD_HPP_INCLUDED__

#include "utils/macros.hpp"

#include <pthread.h>
#include <string>

namespace qlink
{
typedef void (thread_fn) (void *);

//  Class encapsulating OS thread. Thread initiation/termination is done
//  using special functions instead of in constructor/destructor so that
//  thread isn't created during object construction by accident.

class thread_t
{
  public:
    thread_t () : _tfn (NULL), _arg (NULL), _started (false) {}

    ~thread_t ();

    //  Creates OS thread. 'tfn' is main thread function. It'll be passed
    //  'arg' as an argument. Name is set if the platform supports it.
    void start (thread_fn *tfn_, void *arg_, const char *name_);

    //  Returns whether the thread was started, i.e. start was called.
    bool get_started () const { return _started; }

    //  Returns whether the executing thread is the thread represented by
    //  the thread object.
    bool is_current_thread () const;

    //  Waits for thread termination.
    void stop ();

    //  These are internal members. They should be private, however then
    //  they would not be accessible from the main C routine of the thread.
    void applyThreadName ();
    thread_fn *_tfn;
    void *_arg;

  private:
    std::string _name;
    bool _started;
    pthread_t _descriptor;

    QLINK_NON_COPYABLE_NOR_MOVABLE (thread_t)
};
}

#endif
