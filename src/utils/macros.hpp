/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_MACROS_HPP_INCLUDED__
#define __QLINK_MACROS_HPP_INCLUDED__

/******************************************************************************/
/*  qlink Internal Use                                                        */
/******************************************************************************/

#define LIBQLINK_UNUSED(object) (void) object
#define LIBQLINK_DELETE(p_object)                                              \
    {                                                                          \
        delete p_object;                                                       \
        p_object = 0;                                                          \
    }

/******************************************************************************/

#if !defined QLINK_HAVE_NOEXCEPT && __cplusplus >= 201103L
#define QLINK_HAVE_NOEXCEPT
#endif

#if !defined QLINK_NOEXCEPT
#if defined QLINK_HAVE_NOEXCEPT
#define QLINK_NOEXCEPT noexcept
#else
#define QLINK_NOEXCEPT
#endif
#endif

#if !defined QLINK_OVERRIDE
#if defined QLINK_HAVE_NOEXCEPT
#define QLINK_OVERRIDE override
#else
#define QLINK_OVERRIDE
#endif
#endif

#if !defined QLINK_FINAL
#if defined QLINK_HAVE_NOEXCEPT
#define QLINK_FINAL final
#else
#define QLINK_FINAL
#endif
#endif

#if !defined QLINK_NON_COPYABLE_NOR_MOVABLE
#if defined QLINK_HAVE_NOEXCEPT
#define QLINK_NON_COPYABLE_NOR_MOVABLE(classname)                              \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#else
#define QLINK_NON_COPYABLE_NOR_MOVABLE(classname)                              \
  private:                                                                     \
    classname (const classname &);                                             \
    classname &operator= (const classname &);
#endif
#endif

#endif
