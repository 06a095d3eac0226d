/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <gtest/gtest.h>

#include <bytewright/util/slice.h>

using namespace bytewright::util;

TEST(Slice, indexing)
{
  int items[] = {3, 5, 7};
  Slice<int> slice(items, 3);

  EXPECT_EQ(3, slice[0]);
  EXPECT_EQ(7, slice[2]);

  slice[1] = 11;
  EXPECT_EQ(11, items[1]);
}

TEST(Slice, indexPastEnd)
{
  int items[] = {3, 5, 7};
  Slice<int> slice(items, 3);

  EXPECT_DEATH(slice[3], "");
  EXPECT_DEATH(Slice<int>()[0], "");
}
