/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <gtest/gtest.h>

#include <bytewright/system.h>
#include <bytewright/util/abort.h>

#include "test-support.h"

using namespace bytewright;
using namespace bytewright::test;

TEST(Abort, expect)
{
  TestSystem system;

  util::expect(system.s, true);
  EXPECT_DEATH(util::expect(system.s, false), "");
}

// Qualified calls must compile whether or not NDEBUG is defined.
TEST(Abort, qualifiedAssert)
{
  TestSystem system;

  util::assertT(system.s, true);
#ifdef NDEBUG
  util::assertT(system.s, false);
#else
  EXPECT_DEATH(util::assertT(system.s, false), "");
#endif
}
