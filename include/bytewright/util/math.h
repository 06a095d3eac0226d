/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_UTIL_MATH_H
#define BYTEWRIGHT_UTIL_MATH_H

#undef max
#undef min

namespace bytewright {
namespace util {

inline unsigned max(unsigned a, unsigned b)
{
  return (a > b ? a : b);
}

inline unsigned min(unsigned a, unsigned b)
{
  return (a < b ? a : b);
}

}  // namespace util
}  // namespace bytewright

#endif  // BYTEWRIGHT_UTIL_MATH_H
