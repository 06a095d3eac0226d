/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <gtest/gtest.h>

#include <bytewright/abstract-type.h>

#include "test-support.h"

using namespace bytewright;
using namespace bytewright::test;

TEST(AbstractType, packing)
{
  EXPECT_FALSE(AbstractType().assigned());
  EXPECT_EQ(0x400000u, AbstractType::top().raw());
  EXPECT_EQ(AbstractType::ConstantKind, AbstractType::integer().kind());
  EXPECT_EQ(static_cast<unsigned>(AbstractType::IntegerItem),
            AbstractType::integer().value());

  AbstractType local = AbstractType::local(3).withTopIfWide();
  EXPECT_EQ(AbstractType::LocalKind, local.kind());
  EXPECT_EQ(3u, local.value());
  EXPECT_TRUE(local.topIfWide());
  EXPECT_TRUE(local.isRelative());
  EXPECT_FALSE(AbstractType::local(3).topIfWide());
  EXPECT_TRUE(AbstractType::stack(1).isRelative());
  EXPECT_FALSE(AbstractType::reference(1).isRelative());
}

TEST(AbstractType, dimensions)
{
  AbstractType string = AbstractType::reference(5);
  AbstractType array = string.arrayOf();

  EXPECT_EQ(0, string.dimensions());
  EXPECT_EQ(1, array.dimensions());
  EXPECT_EQ(2, array.arrayOf().dimensions());
  EXPECT_EQ(string, array.elementOf());
  EXPECT_EQ(5u, array.value());
  EXPECT_EQ(AbstractType::ReferenceKind, array.kind());

  // relative types may refer to the elements of another slot
  EXPECT_EQ(-1, AbstractType::local(0).elementOf().dimensions());
  EXPECT_EQ(
      array,
      string.plusDimensions(AbstractType::local(0).arrayOf().dimensionBits()));
}

TEST(AbstractType, wideness)
{
  EXPECT_TRUE(AbstractType::long_().isWide());
  EXPECT_TRUE(AbstractType::double_().isWide());
  EXPECT_FALSE(AbstractType::integer().isWide());
  EXPECT_FALSE(AbstractType::long_().arrayOf().isWide());
  EXPECT_FALSE(AbstractType::local(0).isWide());
}

TEST(AbstractType, referenceLike)
{
  EXPECT_TRUE(AbstractType::reference(0).isReferenceLike());
  EXPECT_TRUE(AbstractType::integer().arrayOf().isReferenceLike());
  EXPECT_FALSE(AbstractType::null().isReferenceLike());
  EXPECT_FALSE(AbstractType::integer().isReferenceLike());
  EXPECT_FALSE(AbstractType::uninitialized(0).isReferenceLike());
  EXPECT_FALSE(AbstractType::uninitializedThis().isReferenceLike());
}

typedef SymbolsTest TypeFromDescriptor;

TEST_F(TypeFromDescriptor, primitives)
{
  EXPECT_EQ(AbstractType::integer(), typeFromDescriptor(&symbols, "I"));
  EXPECT_EQ(AbstractType::integer(), typeFromDescriptor(&symbols, "Z"));
  EXPECT_EQ(AbstractType::integer(), typeFromDescriptor(&symbols, "B"));
  EXPECT_EQ(AbstractType::integer(), typeFromDescriptor(&symbols, "C"));
  EXPECT_EQ(AbstractType::integer(), typeFromDescriptor(&symbols, "S"));
  EXPECT_EQ(AbstractType::float_(), typeFromDescriptor(&symbols, "F"));
  EXPECT_EQ(AbstractType::long_(), typeFromDescriptor(&symbols, "J"));
  EXPECT_EQ(AbstractType::double_(), typeFromDescriptor(&symbols, "D"));
  EXPECT_FALSE(typeFromDescriptor(&symbols, "V").assigned());
}

TEST_F(TypeFromDescriptor, references)
{
  EXPECT_EQ(reference("java/lang/String"),
            typeFromDescriptor(&symbols, "Ljava/lang/String;"));
  EXPECT_EQ(reference("foo/Bar"), typeFromDescriptor(&symbols, "Lfoo/Bar;I"));
  EXPECT_EQ(reference("java/lang/String").arrayOf().arrayOf(),
            typeFromDescriptor(&symbols, "[[Ljava/lang/String;"));
}

TEST_F(TypeFromDescriptor, primitiveArraysKeepTheirElementType)
{
  EXPECT_EQ(AbstractType::boolean().arrayOf(),
            typeFromDescriptor(&symbols, "[Z"));
  EXPECT_EQ(AbstractType::byte().arrayOf(), typeFromDescriptor(&symbols, "[B"));
  EXPECT_EQ(AbstractType::char_().arrayOf(),
            typeFromDescriptor(&symbols, "[C"));
  EXPECT_EQ(AbstractType::short_().arrayOf().arrayOf(),
            typeFromDescriptor(&symbols, "[[S"));
  EXPECT_EQ(AbstractType::long_().arrayOf(),
            typeFromDescriptor(&symbols, "[J"));
}

TEST_F(TypeFromDescriptor, internalNames)
{
  EXPECT_EQ(reference("java/lang/Object"),
            typeFromInternalName(&symbols, "java/lang/Object"));
  EXPECT_EQ(AbstractType::integer().arrayOf(),
            typeFromInternalName(&symbols, "[I"));
  EXPECT_EQ(reference("foo/Bar").arrayOf(),
            typeFromInternalName(&symbols, "[Lfoo/Bar;"));
}

TEST_F(TypeFromDescriptor, malformed)
{
  EXPECT_DEATH(typeFromDescriptor(&symbols, "Q"), "");
  EXPECT_DEATH(typeFromDescriptor(&symbols, "Lfoo/Bar"), "");
}
