/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_COMMON_H
#define BYTEWRIGHT_COMMON_H

#include <new>

#include <stdint.h>
#include <stddef.h>
#include <stdlib.h>
#include <stdio.h>
#include <string.h>

#ifdef UNUSED
#undef UNUSED
#endif

#ifdef _MSC_VER

#define LIKELY(v) v
#define UNLIKELY(v) v

#define UNUSED

#define NO_RETURN __declspec(noreturn)

#else  // not _MSC_VER

#define LIKELY(v) __builtin_expect((v) != 0, true)
#define UNLIKELY(v) __builtin_expect((v) != 0, false)

#define UNUSED __attribute__((unused))

#define NO_RETURN __attribute__((noreturn))

#endif  // not _MSC_VER

namespace bytewright {

const unsigned BytesPerWord = sizeof(uintptr_t);

const unsigned LikelyPageSizeInBytes = 4 * 1024;

inline unsigned pad(unsigned n, unsigned alignment)
{
  return (n + (alignment - 1)) & ~(alignment - 1);
}

inline unsigned pad(unsigned n)
{
  return pad(n, BytesPerWord);
}

inline bool equal(const char* a, const char* b)
{
  return strcmp(a, b) == 0;
}

}  // namespace bytewright

#endif  // BYTEWRIGHT_COMMON_H
