/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_TEST_SUPPORT_H
#define BYTEWRIGHT_TEST_SUPPORT_H

#include <gtest/gtest.h>

#include <bytewright/abstract-type.h>
#include <bytewright/code.h>
#include <bytewright/symbol-table.h>
#include <bytewright/system.h>
#include <bytewright/zone.h>

namespace bytewright {
namespace test {

// Owns a System for the lifetime of a fixture.  Declared as the first
// member so that it is disposed after everything allocated from it.
class TestSystem {
 public:
  TestSystem() : s(makeSystem())
  {
  }

  ~TestSystem()
  {
    s->dispose();
  }

  System* s;
};

class SymbolsTest : public ::testing::Test {
 protected:
  SymbolsTest()
      : symbols(system.s, "test/Owner"),
        allocator(system.s),
        zone(&allocator, 4096),
        code(system.s, &symbols)
  {
  }

  AbstractType reference(const char* name)
  {
    return AbstractType::reference(symbols.addType(name));
  }

  TestSystem system;
  SymbolTable symbols;
  SystemAllocator allocator;
  Zone zone;
  Code code;
};

}  // namespace test
}  // namespace bytewright

#endif  // BYTEWRIGHT_TEST_SUPPORT_H
