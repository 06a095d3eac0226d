/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <gtest/gtest.h>

#include <bytewright/descriptor.h>

#include "test-support.h"

using namespace bytewright;
using namespace bytewright::test;

TEST(Descriptor, fieldSpecLength)
{
  TestSystem system;

  EXPECT_EQ(1u, fieldSpecLength(system.s, "I"));
  EXPECT_EQ(1u, fieldSpecLength(system.s, "JI"));
  EXPECT_EQ(3u, fieldSpecLength(system.s, "[[J"));
  EXPECT_EQ(18u, fieldSpecLength(system.s, "Ljava/lang/String;"));
  EXPECT_EQ(19u, fieldSpecLength(system.s, "[Ljava/lang/Object;I"));
}

TEST(Descriptor, fieldSpecLengthRejectsUnknownCharacter)
{
  TestSystem system;

  EXPECT_DEATH(fieldSpecLength(system.s, "Q"), "");
  EXPECT_DEATH(fieldSpecLength(system.s, "Lunterminated"), "");
}

TEST(Descriptor, iteratesArguments)
{
  TestSystem system;
  const char* spec = "(I[JLfoo/Bar;)Z";

  MethodSpecIterator it(system.s, spec);

  ASSERT_TRUE(it.hasNext());
  EXPECT_EQ(spec + 1, it.next());
  ASSERT_TRUE(it.hasNext());
  EXPECT_EQ(spec + 2, it.next());
  ASSERT_TRUE(it.hasNext());
  EXPECT_EQ(spec + 4, it.next());
  EXPECT_FALSE(it.hasNext());
  EXPECT_STREQ("Z", it.returnSpec());
}

TEST(Descriptor, sizes)
{
  TestSystem system;

  EXPECT_EQ(0u, argumentsSize(system.s, "()V"));
  EXPECT_EQ(5u, argumentsSize(system.s, "(IJLjava/lang/String;[D)V"));
  EXPECT_EQ(4u, argumentsSize(system.s, "(DD)D"));

  EXPECT_EQ(0u, returnSize(system.s, "()V"));
  EXPECT_EQ(2u, returnSize(system.s, "()J"));
  EXPECT_EQ(2u, returnSize(system.s, "(I)D"));
  EXPECT_EQ(1u, returnSize(system.s, "(I)Ljava/lang/Object;"));
  EXPECT_EQ(1u, returnSize(system.s, "()[J"));
}

TEST(Descriptor, wideSpecs)
{
  EXPECT_TRUE(isWideSpec("J"));
  EXPECT_TRUE(isWideSpec("D"));
  EXPECT_FALSE(isWideSpec("I"));
  EXPECT_FALSE(isWideSpec("[J"));
}
