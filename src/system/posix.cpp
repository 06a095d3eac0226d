/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <stdlib.h>
#include <new>

#include <bytewright/system.h>

using namespace bytewright;

namespace {

class MySystem : public System {
 public:
  virtual void* tryAllocate(size_t sizeInBytes)
  {
    return malloc(sizeInBytes);
  }

  virtual void free(const void* p)
  {
    if (p)
      ::free(const_cast<void*>(p));
  }

  virtual void abort()
  {
    ::abort();
  }

  virtual void dispose()
  {
    ::free(this);
  }
};

}  // namespace

namespace bytewright {

System* makeSystem()
{
  return new (malloc(sizeof(MySystem))) MySystem();
}

}  // namespace bytewright
