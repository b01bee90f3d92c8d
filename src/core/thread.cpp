/* SPDX-License-Identifier: MPL-2.0 */

#include "core/thread.hpp"
#include "utils/err.hpp"

#include <signal.h>

extern "C" {
static void *thread_routine (void *arg_)
{
    //  Following code will guarantee more predictable latencies as it'll
    //  disallow any signal handling in the I/O thread.
    sigset_t signal_set;
    int rc = sigfillset (&signal_set);
    errno_assert (rc == 0);
    rc = pthread_sigmask (SIG_BLOCK, &signal_set, NULL);
    posix_assert (rc);

    qlink::thread_t *self = static_cast<qlink::thread_t *> (arg_);
    self->applyThreadName ();
    self->_tfn (self->_arg);
    return NULL;
}
}

qlink::thread_t::~thread_t ()
{
    qlink_assert (!_started);
}

void qlink::thread_t::start (thread_fn *tfn_, void *arg_, const char *name_)
{
    _tfn = tfn_;
    _arg = arg_;
    if (name_)
        _name = name_;
    const int rc = pthread_create (&_descriptor, NULL, thread_routine, this);
    posix_assert (rc);
    _started = true;
}

bool qlink::thread_t::is_current_thread () const
{
    return _started && bool (pthread_equal (pthread_self (), _descriptor));
}

void qlink::thread_t::stop ()
{
    if (_started) {
        const int rc = pthread_join (_descriptor, NULL);
        posix_assert (rc);
        _started = false;
    }
}

void qlink::thread_t::applyThreadName ()
{
    if (_name.empty ())
        return;

#if defined __linux__
    //  Linux limits thread names to 15 characters plus terminator.
    const std::string name = _name.substr (0, 15);
    const int rc = pthread_setname_np (pthread_self (), name.c_str ());
    if (rc)
        return;
#endif
}
