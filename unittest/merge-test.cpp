/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <gtest/gtest.h>

#include <bytewright/frame.h>

#include "test-support.h"

using namespace bytewright;
using namespace bytewright::test;

namespace {

class MergeTest : public SymbolsTest {
 protected:
  // Merges "source" into a slot holding "destination".
  AbstractType merge(AbstractType destination,
                     AbstractType source,
                     bool* changed = 0)
  {
    AbstractType slot[] = {destination};
    bool c = Frame::merge(
        &symbols, source, util::Slice<AbstractType>(slot, 1), 0);
    if (changed) {
      *changed = c;
    }
    return slot[0];
  }

  unsigned sampleTypes(AbstractType* types)
  {
    unsigned i = 0;
    types[i++] = AbstractType::top();
    types[i++] = AbstractType::integer();
    types[i++] = AbstractType::float_();
    types[i++] = AbstractType::long_();
    types[i++] = AbstractType::double_();
    types[i++] = AbstractType::null();
    types[i++] = AbstractType::uninitializedThis();
    types[i++] = AbstractType::uninitialized(
        symbols.addUninitializedType("foo/Bar", 4));
    types[i++] = reference("java/lang/String");
    types[i++] = reference("java/lang/Integer");
    types[i++] = reference("java/lang/String").arrayOf();
    types[i++] = reference("java/lang/Integer").arrayOf();
    types[i++] = AbstractType::integer().arrayOf();
    types[i++] = AbstractType::float_().arrayOf();
    types[i++] = AbstractType::integer().arrayOf().arrayOf();
    return i;
  }
};

}  // namespace

TEST_F(MergeTest, unassignedTakesSource)
{
  bool changed;
  EXPECT_EQ(reference("java/lang/String"),
            merge(AbstractType(), reference("java/lang/String"), &changed));
  EXPECT_TRUE(changed);
}

TEST_F(MergeTest, idempotent)
{
  AbstractType types[16];
  unsigned count = sampleTypes(types);

  for (unsigned i = 0; i < count; ++i) {
    bool changed;
    EXPECT_EQ(types[i], merge(types[i], types[i], &changed));
    EXPECT_FALSE(changed);
  }
}

TEST_F(MergeTest, symmetricOutcome)
{
  AbstractType types[16];
  unsigned count = sampleTypes(types);

  for (unsigned i = 0; i < count; ++i) {
    for (unsigned j = 0; j < count; ++j) {
      EXPECT_EQ(merge(types[i], types[j]), merge(types[j], types[i]))
          << "pair " << i << ", " << j;
    }
  }
}

TEST_F(MergeTest, nullAndReferences)
{
  AbstractType string = reference("java/lang/String");
  bool changed;

  EXPECT_EQ(string, merge(string, AbstractType::null(), &changed));
  EXPECT_FALSE(changed);

  EXPECT_EQ(string, merge(AbstractType::null(), string, &changed));
  EXPECT_TRUE(changed);

  EXPECT_EQ(AbstractType::null(),
            merge(AbstractType::null(), AbstractType::null(), &changed));
  EXPECT_FALSE(changed);

  AbstractType ints = AbstractType::integer().arrayOf();
  EXPECT_EQ(ints, merge(AbstractType::null(), ints));
  EXPECT_EQ(ints, merge(ints, AbstractType::null()));
}

TEST_F(MergeTest, nullAndPrimitives)
{
  EXPECT_EQ(AbstractType::top(),
            merge(AbstractType::integer(), AbstractType::null()));
  EXPECT_EQ(AbstractType::top(),
            merge(AbstractType::null(), AbstractType::integer()));
}

TEST_F(MergeTest, distinctClassesMergeToObject)
{
  EXPECT_EQ(reference("java/lang/Object"),
            merge(reference("java/lang/Integer"),
                  reference("java/lang/String")));
  EXPECT_EQ(reference("java/lang/Object").arrayOf(),
            merge(reference("java/lang/Integer").arrayOf(),
                  reference("java/lang/String").arrayOf()));
}

TEST_F(MergeTest, arraysOfDifferentShape)
{
  AbstractType object = reference("java/lang/Object");

  // int[] and float[]
  EXPECT_EQ(object,
            merge(AbstractType::float_().arrayOf(),
                  AbstractType::integer().arrayOf()));
  // String[][] and int[]
  EXPECT_EQ(object,
            merge(AbstractType::integer().arrayOf(),
                  reference("java/lang/String").arrayOf().arrayOf()));
  // String and int[]
  EXPECT_EQ(object,
            merge(AbstractType::integer().arrayOf(),
                  reference("java/lang/String")));
  // String[] and int[][]
  EXPECT_EQ(object.arrayOf(),
            merge(AbstractType::integer().arrayOf().arrayOf(),
                  reference("java/lang/String").arrayOf()));
}

TEST_F(MergeTest, incompatibleValuesBecomeTop)
{
  EXPECT_EQ(AbstractType::top(),
            merge(AbstractType::float_(), AbstractType::integer()));
  EXPECT_EQ(AbstractType::top(),
            merge(AbstractType::integer(), AbstractType::long_()));
  EXPECT_EQ(AbstractType::top(),
            merge(reference("java/lang/String"), AbstractType::integer()));
  EXPECT_EQ(AbstractType::top(),
            merge(reference("java/lang/String"), AbstractType::top()));
  EXPECT_EQ(AbstractType::top(),
            merge(reference("foo/Bar"),
                  AbstractType::uninitialized(
                      symbols.addUninitializedType("foo/Bar", 0))));
}

TEST_F(MergeTest, monotonic)
{
  AbstractType slot = AbstractType();
  bool changed;

  slot = merge(slot, reference("java/lang/String"), &changed);
  EXPECT_TRUE(changed);
  EXPECT_EQ(reference("java/lang/String"), slot);

  slot = merge(slot, AbstractType::null(), &changed);
  EXPECT_FALSE(changed);

  slot = merge(slot, reference("java/lang/Integer"), &changed);
  EXPECT_TRUE(changed);
  EXPECT_EQ(reference("java/lang/Object"), slot);

  slot = merge(slot, reference("java/lang/String"), &changed);
  EXPECT_FALSE(changed);

  slot = merge(slot, AbstractType::integer(), &changed);
  EXPECT_TRUE(changed);
  EXPECT_EQ(AbstractType::top(), slot);

  AbstractType types[16];
  unsigned count = sampleTypes(types);
  for (unsigned i = 0; i < count; ++i) {
    slot = merge(slot, types[i], &changed);
    EXPECT_FALSE(changed);
    EXPECT_EQ(AbstractType::top(), slot);
  }
}

namespace {

class NumberClient : public SymbolTable::Client {
 public:
  virtual const char* commonSuperClass(const char*, const char*)
  {
    return "java/lang/Number";
  }
};

}  // namespace

TEST_F(MergeTest, clientChoosesCommonSuperClass)
{
  NumberClient client;
  symbols.setClient(&client);

  EXPECT_EQ(reference("java/lang/Number"),
            merge(reference("java/lang/Integer"), reference("java/lang/Long")));
}
