/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <gtest/gtest.h>

#include <bytewright/symbol-table.h>

#include "test-support.h"

using namespace bytewright;
using namespace bytewright::test;

namespace {

class FixedSuperClass : public SymbolTable::Client {
 public:
  FixedSuperClass(const char* name) : name(name), calls(0)
  {
  }

  virtual const char* commonSuperClass(const char*, const char*)
  {
    ++calls;
    return name;
  }

  const char* name;
  unsigned calls;
};

}  // namespace

typedef SymbolsTest SymbolTableTest;

TEST_F(SymbolTableTest, typesAreInterned)
{
  EXPECT_EQ(0u, symbols.typeCount());

  unsigned string = symbols.addType("java/lang/String");
  unsigned object = symbols.addType("java/lang/Object");

  EXPECT_EQ(0u, string);
  EXPECT_EQ(1u, object);
  EXPECT_EQ(string, symbols.addType("java/lang/String"));
  EXPECT_EQ(2u, symbols.typeCount());

  Symbol* type = symbols.getType(string);
  EXPECT_EQ(TypeTag, type->tag);
  EXPECT_STREQ("java/lang/String", type->value);
}

TEST_F(SymbolTableTest, typeFromPrefix)
{
  unsigned string = symbols.addType("java/lang/String");

  EXPECT_EQ(string, symbols.addType("java/lang/String;I)V", 16));
  EXPECT_EQ(1u, symbols.typeCount());
}

TEST_F(SymbolTableTest, uninitializedTypesAreKeyedByOffset)
{
  unsigned bar = symbols.addType("foo/Bar");
  unsigned at3 = symbols.addUninitializedType("foo/Bar", 3);
  unsigned at7 = symbols.addUninitializedType("foo/Bar", 7);

  EXPECT_NE(bar, at3);
  EXPECT_NE(at3, at7);
  EXPECT_EQ(at3, symbols.addUninitializedType("foo/Bar", 3));

  Symbol* type = symbols.getType(at7);
  EXPECT_EQ(UninitializedTypeTag, type->tag);
  EXPECT_STREQ("foo/Bar", type->value);
  EXPECT_EQ(7, type->data);
}

TEST_F(SymbolTableTest, forwardUninitializedTypes)
{
  unsigned type = symbols.addForwardUninitializedType("foo/Bar", 5);

  EXPECT_EQ(type, symbols.addForwardUninitializedType("foo/Bar", 5));
  EXPECT_EQ(5u, symbols.getForwardUninitializedLabel(type));
  EXPECT_NE(type, symbols.addForwardUninitializedType("foo/Bar", 6));
}

TEST_F(SymbolTableTest, getTypeOutOfRange)
{
  symbols.addType("java/lang/String");

  EXPECT_DEATH(symbols.getType(1), "");
  EXPECT_DEATH(symbols.getForwardUninitializedLabel(0), "");
}

TEST_F(SymbolTableTest, mergedTypeDefaultsToObject)
{
  unsigned string = symbols.addType("java/lang/String");
  unsigned integer = symbols.addType("java/lang/Integer");

  unsigned merged = symbols.addMergedType(string, integer);

  EXPECT_STREQ("java/lang/Object", symbols.getType(merged)->value);
  EXPECT_EQ(merged, symbols.addMergedType(integer, string));
}

TEST_F(SymbolTableTest, mergedTypeAsksClientOnce)
{
  FixedSuperClass client("java/lang/Number");
  symbols.setClient(&client);

  unsigned integer = symbols.addType("java/lang/Integer");
  unsigned longType = symbols.addType("java/lang/Long");

  unsigned merged = symbols.addMergedType(integer, longType);
  EXPECT_STREQ("java/lang/Number", symbols.getType(merged)->value);
  EXPECT_EQ(merged, symbols.addMergedType(longType, integer));
  EXPECT_EQ(merged, symbols.addMergedType(integer, longType));
  EXPECT_EQ(1u, client.calls);
}

TEST_F(SymbolTableTest, constantPoolIndices)
{
  EXPECT_EQ(1u, symbols.constantPoolCount());

  Symbol* bar = symbols.addConstantClass("foo/Bar");
  EXPECT_EQ(2u, bar->index);
  EXPECT_EQ(CONSTANT_Class, bar->tag);
  EXPECT_EQ(1u, symbols.addConstantUtf8("foo/Bar")->index);
  EXPECT_EQ(bar, symbols.addConstantClass("foo/Bar"));
  EXPECT_EQ(3u, symbols.constantPoolCount());

  Symbol* longConstant = symbols.addConstantLong(5);
  EXPECT_EQ(3u, longConstant->index);
  EXPECT_EQ(5u, symbols.constantPoolCount());
  EXPECT_EQ(longConstant, symbols.addConstantLong(5));

  EXPECT_EQ(5u, symbols.addConstantInteger(1)->index);

  Symbol* method = symbols.addConstantMethodref("foo/Bar", "m", "()V", false);
  EXPECT_EQ(CONSTANT_Methodref, method->tag);
  EXPECT_EQ(6u, symbols.addConstantUtf8("m")->index);
  EXPECT_EQ(7u, symbols.addConstantUtf8("()V")->index);
  EXPECT_EQ(8u, symbols.addConstantNameAndType("m", "()V")->index);
  EXPECT_EQ(9u, method->index);
  EXPECT_STREQ("foo/Bar", method->owner);
  EXPECT_STREQ("m", method->name);
  EXPECT_STREQ("()V", method->value);

  Symbol* interfaceMethod
      = symbols.addConstantMethodref("foo/Bar", "m", "()V", true);
  EXPECT_EQ(CONSTANT_InterfaceMethodref, interfaceMethod->tag);
  EXPECT_EQ(10u, interfaceMethod->index);
  EXPECT_EQ(11u, symbols.constantPoolCount());
}

TEST_F(SymbolTableTest, numbersAreKeyedByBits)
{
  Symbol* intOne = symbols.addConstantInteger(1);
  Symbol* floatOne = symbols.addConstantFloat(1.0f);
  Symbol* doubleOne = symbols.addConstantDouble(1.0);

  EXPECT_NE(intOne, floatOne);
  EXPECT_EQ(CONSTANT_Float, floatOne->tag);
  EXPECT_EQ(floatOne, symbols.addConstantFloat(1.0f));
  EXPECT_EQ(CONSTANT_Double, doubleOne->tag);
  EXPECT_EQ(doubleOne->index + 2, symbols.constantPoolCount());
}

TEST_F(SymbolTableTest, stringsShareTheirUtf8)
{
  Symbol* string = symbols.addConstantString("hello");

  EXPECT_EQ(CONSTANT_String, string->tag);
  EXPECT_EQ(string, symbols.addConstantString("hello"));
  EXPECT_EQ(string->index - 1, symbols.addConstantUtf8("hello")->index);
}

TEST_F(SymbolTableTest, dynamicConstants)
{
  Symbol* dynamic = symbols.addConstantDynamic("x", "Ljava/util/List;", 0);
  Symbol* indy
      = symbols.addConstantInvokeDynamic("run", "()Ljava/lang/Runnable;", 0);

  EXPECT_EQ(CONSTANT_Dynamic, dynamic->tag);
  EXPECT_EQ(CONSTANT_InvokeDynamic, indy->tag);
  EXPECT_EQ(0, indy->data);
  EXPECT_NE(indy, symbols.addConstantInvokeDynamic(
                      "run", "()Ljava/lang/Runnable;", 1));

  EXPECT_EQ(indy,
            symbols.addConstantInvokeDynamic(
                "run", "()Ljava/lang/Runnable;", 0));
  EXPECT_EQ(dynamic, symbols.addConstantDynamic("x", "Ljava/util/List;", 0));
  EXPECT_NE(dynamic,
            symbols.addConstantInvokeDynamic("x", "Ljava/util/List;", 0));

  Symbol* handle = symbols.addConstantMethodHandle(
      REF_invokeStatic, "foo/Bar", "bsm", "()V", false);
  EXPECT_EQ(CONSTANT_MethodHandle, handle->tag);
  EXPECT_EQ(REF_invokeStatic, handle->data);
}

TEST_F(SymbolTableTest, survivesRehash)
{
  char name[32];
  for (unsigned i = 0; i < 1000; ++i) {
    snprintf(name, sizeof(name), "pkg/Type%u", i);
    EXPECT_EQ(i, symbols.addType(name));
  }

  for (unsigned i = 0; i < 1000; ++i) {
    snprintf(name, sizeof(name), "pkg/Type%u", i);
    EXPECT_EQ(i, symbols.addType(name));
    EXPECT_STREQ(name, symbols.getType(i)->value);
  }

  EXPECT_EQ(1000u, symbols.typeCount());
}
