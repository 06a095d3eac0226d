/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <bytewright/descriptor.h>

using namespace bytewright::util;

namespace bytewright {

unsigned fieldSpecLength(Aborter* a, const char* spec)
{
  const char* s = spec;
  while (*s == '[')
    ++s;

  switch (*s) {
  case 'L':
    while (*s and *s != ';')
      ++s;
    expect(a, *s == ';');
    ++s;
    break;

  case 'Z':
  case 'B':
  case 'C':
  case 'S':
  case 'I':
  case 'F':
  case 'J':
  case 'D':
  case 'V':
    ++s;
    break;

  default:
    abort(a);
  }

  return s - spec;
}

const char* MethodSpecIterator::next()
{
  assertT(a, *s != ')');

  const char* p = s;
  s += fieldSpecLength(a, s);
  return p;
}

unsigned argumentsSize(Aborter* a, const char* spec)
{
  unsigned size = 0;
  for (MethodSpecIterator it(a, spec); it.hasNext();) {
    size += isWideSpec(it.next()) ? 2 : 1;
  }
  return size;
}

unsigned returnSize(Aborter* a, const char* spec)
{
  MethodSpecIterator it(a, spec);
  while (it.hasNext()) {
    it.next();
  }

  const char* r = it.returnSpec();
  if (*r == 'V') {
    return 0;
  } else {
    return isWideSpec(r) ? 2 : 1;
  }
}

}  // namespace bytewright
