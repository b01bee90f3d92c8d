/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_CTX_HPP_INCLUDED__
#define __QLINK_CTX_HPP_INCLUDED__

#include "utils/macros.hpp"
#include "utils/mutex.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>

namespace qlink
{
class inproc_listener_t;

//  Context shared by the nodes of one process that want to talk over
//  inproc endpoints. It holds the endpoint table and the fault injection
//  switches; it is passed to every node explicitly and must outlive them.

class ctx_t
{
  public:
    ctx_t ();
    ~ctx_t ();

    //  Returns -1 with errno EADDRINUSE if name_ is taken.
    int register_endpoint (const std::string &name_,
                           const std::shared_ptr<inproc_listener_t> &listener_);

    //  Removes name_ if it is still bound to listener_.
    void unregister_endpoint (const std::string &name_,
                              const inproc_listener_t *listener_);

    std::shared_ptr<inproc_listener_t> find_endpoint (const std::string &name_);

    //  While partitioned, traffic between the two ends of every inproc
    //  connection made to name_ is silently lost and new connects fail.
    void set_partitioned (const std::string &name_, bool partitioned_);
    bool is_partitioned (const std::string &name_);

  private:
    typedef std::map<std::string, std::shared_ptr<inproc_listener_t> >
      endpoints_t;
    endpoints_t _endpoints;

    std::set<std::string> _partitioned;

    mutex_t _sync;

    QLINK_NON_COPYABLE_NOR_MOVABLE (ctx_t)
};
}

#endif
