/* SPDX-License-Identifier: MPL-2.0 */

#include "core/ctx.hpp"
#include "transports/inproc/inproc_mux.hpp"
#include "utils/err.hpp"
#include "utils/random.hpp"

qlink::ctx_t::ctx_t ()
{
    seed_random ();
}

qlink::ctx_t::~ctx_t ()
{
    scoped_lock_t lock (_sync);
    _endpoints.clear ();
}

int qlink::ctx_t::register_endpoint (
  const std::string &name_, const std::shared_ptr<inproc_listener_t> &listener_)
{
    scoped_lock_t lock (_sync);
    const bool inserted =
      _endpoints.insert (endpoints_t::value_type (name_, listener_)).second;
    if (!inserted) {
        errno = EADDRINUSE;
        return -1;
    }
    return 0;
}

void qlink::ctx_t::unregister_endpoint (const std::string &name_,
                                        const inproc_listener_t *listener_)
{
    scoped_lock_t lock (_sync);
    const endpoints_t::iterator it = _endpoints.find (name_);
    if (it != _endpoints.end () && it->second.get () == listener_)
        _endpoints.erase (it);
}

std::shared_ptr<qlink::inproc_listener_t>
qlink::ctx_t::find_endpoint (const std::string &name_)
{
    scoped_lock_t lock (_sync);
    const endpoints_t::iterator it = _endpoints.find (name_);
    if (it == _endpoints.end ())
        return std::shared_ptr<inproc_listener_t> ();
    return it->second;
}

void qlink::ctx_t::set_partitioned (const std::string &name_,
                                    bool partitioned_)
{
    scoped_lock_t lock (_sync);
    if (partitioned_)
        _partitioned.insert (name_);
    else
        _partitioned.erase (name_);
}

bool qlink::ctx_t::is_partitioned (const std::string &name_)
{
    scoped_lock_t lock (_sync);
    return _partitioned.count (name_) > 0;
}
