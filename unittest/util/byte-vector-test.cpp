/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <gtest/gtest.h>

#include <bytewright/byte-vector.h>

#include "test-support.h"

using namespace bytewright;
using namespace bytewright::test;

TEST(ByteVector, writesBigEndian)
{
  TestSystem system;
  SystemAllocator allocator(system.s);
  ByteVector v(system.s, &allocator, 16);

  v.putByte(0xfe);
  v.putShort(0x1234);
  v.putInt(0xcafebabe);

  ASSERT_EQ(7u, v.length());
  EXPECT_EQ(0xfe, v.get(0));
  EXPECT_EQ(0x12, v.get(1));
  EXPECT_EQ(0x34, v.get(2));
  EXPECT_EQ(0x1234, v.get2(1));
  EXPECT_EQ(0xca, v.get(3));
  EXPECT_EQ(0xfe, v.get(4));
  EXPECT_EQ(0xba, v.get(5));
  EXPECT_EQ(0xbe, v.get(6));
}

TEST(ByteVector, growsPastMinimumCapacity)
{
  TestSystem system;
  SystemAllocator allocator(system.s);
  ByteVector v(system.s, &allocator, 16);

  for (unsigned i = 0; i < 1000; ++i) {
    v.putShort(i);
  }

  ASSERT_EQ(2000u, v.length());
  for (unsigned i = 0; i < 1000; ++i) {
    EXPECT_EQ(static_cast<uint16_t>(i), v.get2(i * 2));
  }

  const uint8_t tail[] = {1, 2, 3};
  v.putByteArray(tail, sizeof(tail));
  EXPECT_EQ(2003u, v.length());
  EXPECT_EQ(3, v.get(2002));
}
