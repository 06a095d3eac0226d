/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_UTIL_ASSERT_H
#define BYTEWRIGHT_UTIL_ASSERT_H

#include <stdlib.h>

#define UNREACHABLE(msg) ::abort()

#define ASSERT(that)    \
  if (!(that)) {        \
    UNREACHABLE(#that); \
  }

#endif  // BYTEWRIGHT_UTIL_ASSERT_H
