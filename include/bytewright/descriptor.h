/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_DESCRIPTOR_H
#define BYTEWRIGHT_DESCRIPTOR_H

#include <bytewright/common.h>
#include <bytewright/util/abort.h>

namespace bytewright {

class MethodSpecIterator {
 public:
  MethodSpecIterator(util::Aborter* a, const char* s) : a(a), s(s + 1)
  {
    util::expect(a, *s == '(');
  }

  const char* next();

  bool hasNext()
  {
    return *s != ')';
  }

  const char* returnSpec()
  {
    util::assertT(a, *s == ')');
    return s + 1;
  }

  util::Aborter* a;
  const char* s;
};

// Length of the single field descriptor starting at spec.
unsigned fieldSpecLength(util::Aborter* a, const char* spec);

// Number of local variable slots taken by the arguments of a method
// descriptor, not counting any receiver.
unsigned argumentsSize(util::Aborter* a, const char* spec);

// Number of stack slots taken by the return value of a method descriptor.
unsigned returnSize(util::Aborter* a, const char* spec);

inline bool isWideSpec(const char* spec)
{
  return *spec == 'J' or *spec == 'D';
}

}  // namespace bytewright

#endif  // BYTEWRIGHT_DESCRIPTOR_H
