/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_UTIL_ABORT_H
#define BYTEWRIGHT_UTIL_ABORT_H

#include <bytewright/common.h>

namespace bytewright {
namespace util {

class Aborter {
 public:
  virtual void NO_RETURN abort() = 0;
};

inline void NO_RETURN abort(Aborter* a)
{
  a->abort();
  ::abort();
}

inline void expect(Aborter* a, bool v)
{
  if (UNLIKELY(!v)) {
    abort(a);
  }
}

#ifdef NDEBUG
inline void assertT(Aborter*, bool)
{
}
#else
inline void assertT(Aborter* a, bool v)
{
  expect(a, v);
}
#endif

}  // namespace util
}  // namespace bytewright

#endif  // BYTEWRIGHT_UTIL_ABORT_H
