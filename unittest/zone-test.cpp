/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <gtest/gtest.h>

#include <bytewright/zone.h>

#include "test-support.h"

using namespace bytewright;
using namespace bytewright::test;

TEST(Zone, allocationsAreAlignedAndDistinct)
{
  TestSystem system;
  SystemAllocator allocator(system.s);
  Zone zone(&allocator, 64);

  uint8_t* previous = 0;
  for (unsigned i = 1; i < 200; ++i) {
    uint8_t* p = static_cast<uint8_t*>(zone.allocate(i));
    EXPECT_EQ(0u, reinterpret_cast<uintptr_t>(p) % BytesPerWord);
    memset(p, i, i);
    if (previous) {
      EXPECT_EQ(static_cast<uint8_t>(i - 1), previous[i - 2]);
    }
    previous = p;
  }
}

TEST(Zone, largerThanAPage)
{
  TestSystem system;
  SystemAllocator allocator(system.s);
  Zone zone(&allocator, LikelyPageSizeInBytes);

  const char* small = zone.copy("small");
  uint8_t* large = static_cast<uint8_t*>(zone.allocate(3 * 4096));
  memset(large, 0xab, 3 * 4096);

  EXPECT_STREQ("small", small);
  EXPECT_EQ(0xab, large[3 * 4096 - 1]);
}
