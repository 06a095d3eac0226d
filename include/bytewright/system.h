/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_SYSTEM_H
#define BYTEWRIGHT_SYSTEM_H

#include <bytewright/common.h>
#include <bytewright/util/allocator.h>
#include <bytewright/util/abort.h>

namespace bytewright {

class System : public util::Aborter {
 public:
  virtual void* tryAllocate(size_t sizeInBytes) = 0;
  virtual void free(const void* p) = 0;
  virtual void dispose() = 0;
};

inline void* allocate(System* s, size_t size)
{
  void* p = s->tryAllocate(size);
  if (p == 0)
    s->abort();
  return p;
}

// Adapts a System to the allocator interfaces used by Zone and ByteVector.
class SystemAllocator : public util::Alloc {
 public:
  SystemAllocator(System* s) : s(s)
  {
  }

  virtual void* allocate(size_t size)
  {
    return bytewright::allocate(s, size);
  }

  virtual void free(const void* p, size_t)
  {
    s->free(p);
  }

  System* s;
};

System* makeSystem();

}  // namespace bytewright

#endif  // BYTEWRIGHT_SYSTEM_H
