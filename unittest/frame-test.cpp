/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <gtest/gtest.h>

#include <bytewright/frame.h>
#include <bytewright/opcodes.h>

#include "test-support.h"

using namespace bytewright;
using namespace bytewright::test;

namespace {

class FrameTest : public SymbolsTest {
 protected:
  Frame* newFrame()
  {
    return new (&zone) Frame(&zone, system.s, 0);
  }

  Frame* start(unsigned access,
               const char* descriptor,
               unsigned maxLocals,
               bool constructor = false)
  {
    Frame* f = newFrame();
    f->setInputFrameFromDescriptor(
        &symbols, access, constructor, descriptor, maxLocals);
    return f;
  }

  void execute(Frame* f, unsigned opcode, int arg = 0, Symbol* symbol = 0)
  {
    f->execute(opcode, arg, symbol, &symbols);
  }

  // Resolves the output frame of "f" as the input frame of a successor.
  Frame* successor(Frame* f)
  {
    Frame* dst = newFrame();
    EXPECT_TRUE(f->merge(&symbols, dst, AbstractType()));
    return dst;
  }
};

}  // namespace

TEST_F(FrameTest, inputFromDescriptor)
{
  Frame* f = start(0, "(IJLjava/lang/String;)V", 7);

  ASSERT_TRUE(f->hasInputFrame());
  ASSERT_EQ(7u, f->inputLocals.count);
  EXPECT_EQ(reference("test/Owner"), f->inputLocals[0]);
  EXPECT_EQ(AbstractType::integer(), f->inputLocals[1]);
  EXPECT_EQ(AbstractType::long_(), f->inputLocals[2]);
  EXPECT_EQ(AbstractType::top(), f->inputLocals[3]);
  EXPECT_EQ(reference("java/lang/String"), f->inputLocals[4]);
  EXPECT_EQ(AbstractType::top(), f->inputLocals[5]);
  EXPECT_EQ(AbstractType::top(), f->inputLocals[6]);
  EXPECT_EQ(0u, f->inputStackSize());
}

TEST_F(FrameTest, inputOfConstructorAndStaticMethod)
{
  Frame* init = start(0, "()V", 1, true);
  EXPECT_EQ(AbstractType::uninitializedThis(), init->inputLocals[0]);

  Frame* main = start(ACC_STATIC, "([I)V", 1);
  EXPECT_EQ(AbstractType::integer().arrayOf(), main->inputLocals[0]);
}

TEST_F(FrameTest, inputLargerThanMaxLocals)
{
  EXPECT_DEATH(start(ACC_STATIC, "(J)V", 1), "");
}

TEST_F(FrameTest, inputFromApiFormat)
{
  unsigned label = code.newLabel();
  FrameElement locals[] = {FrameElement::item(AbstractType::IntegerItem),
                           FrameElement::item(AbstractType::LongItem),
                           FrameElement::className("java/lang/String"),
                           FrameElement::label(label)};
  FrameElement stack[] = {FrameElement::item(AbstractType::DoubleItem)};

  Frame* f = newFrame();
  f->setInputFrameFromApiFormat(&symbols, &code, 3, 4, locals, 1, stack);

  ASSERT_EQ(5u, f->inputLocals.count);
  EXPECT_EQ(AbstractType::integer(), f->inputLocals[0]);
  EXPECT_EQ(AbstractType::long_(), f->inputLocals[1]);
  EXPECT_EQ(AbstractType::top(), f->inputLocals[2]);
  EXPECT_EQ(reference("java/lang/String"), f->inputLocals[3]);
  EXPECT_EQ(AbstractType::ForwardUninitializedKind, f->inputLocals[4].kind());
  EXPECT_EQ(label,
            symbols.getForwardUninitializedLabel(f->inputLocals[4].value()));

  ASSERT_EQ(2u, f->inputStackSize());
  EXPECT_EQ(AbstractType::double_(), f->inputStack[0]);
  EXPECT_EQ(AbstractType::top(), f->inputStack[1]);
}

TEST_F(FrameTest, boundLabelIsUninitialized)
{
  unsigned label = code.newLabel();
  code.insn(nop);
  code.insn(nop);
  code.bind(label);
  code.typeInsn(new_, "foo/Bar");

  AbstractType type = typeFromApiFormat(
      &symbols, &code, FrameElement::label(label));

  EXPECT_EQ(AbstractType::UninitializedKind, type.kind());
  EXPECT_EQ(2, symbols.getType(type.value())->data);
}

TEST_F(FrameTest, arithmetic)
{
  Frame* f = start(ACC_STATIC, "(II)I", 2);
  execute(f, iload, 0);
  execute(f, iload, 1);
  execute(f, iadd);

  EXPECT_EQ(2, f->outputStackMax);

  Frame* next = successor(f);
  ASSERT_EQ(1u, next->inputStackSize());
  EXPECT_EQ(AbstractType::integer(), next->inputStack[0]);
  EXPECT_EQ(AbstractType::integer(), next->inputLocals[1]);
}

TEST_F(FrameTest, intStoreOverLongStore)
{
  Frame* f = start(ACC_STATIC, "()V", 5);
  execute(f, lconst_0);
  execute(f, lstore, 3);

  Frame* afterLong = successor(f);
  EXPECT_EQ(AbstractType::long_(), afterLong->inputLocals[3]);
  EXPECT_EQ(AbstractType::top(), afterLong->inputLocals[4]);

  execute(f, iconst_0);
  execute(f, istore, 3);

  Frame* next = successor(f);
  EXPECT_EQ(AbstractType::top(), next->inputLocals[2]);
  EXPECT_EQ(AbstractType::integer(), next->inputLocals[3]);
  EXPECT_EQ(AbstractType::top(), next->inputLocals[4]);
}

TEST_F(FrameTest, storeSplitsInputLong)
{
  Frame* f = start(ACC_STATIC, "(IJLjava/lang/String;)V", 5);
  execute(f, iconst_0);
  execute(f, istore, 2);

  Frame* next = successor(f);
  EXPECT_EQ(AbstractType::integer(), next->inputLocals[0]);
  EXPECT_EQ(AbstractType::top(), next->inputLocals[1]);
  EXPECT_EQ(AbstractType::integer(), next->inputLocals[2]);
  EXPECT_EQ(reference("java/lang/String"), next->inputLocals[3]);
}

TEST_F(FrameTest, storeSplitsOutputLong)
{
  Frame* f = start(ACC_STATIC, "(IJLjava/lang/String;)V", 5);
  execute(f, lconst_1);
  execute(f, lstore, 1);
  execute(f, iconst_0);
  execute(f, istore, 2);

  Frame* next = successor(f);
  EXPECT_EQ(AbstractType::top(), next->inputLocals[1]);
  EXPECT_EQ(AbstractType::integer(), next->inputLocals[2]);
}

TEST_F(FrameTest, arrayLoads)
{
  Frame* f = start(ACC_STATIC, "([Ljava/lang/String;)V", 1);
  execute(f, aload, 0);
  execute(f, iconst_0);
  execute(f, aaload);
  execute(f, aconst_null);
  execute(f, iconst_0);
  execute(f, aaload);

  Frame* next = successor(f);
  ASSERT_EQ(2u, next->inputStackSize());
  EXPECT_EQ(reference("java/lang/String"), next->inputStack[0]);
  EXPECT_EQ(AbstractType::null(), next->inputStack[1]);
}

TEST_F(FrameTest, dupX1)
{
  Frame* f = start(ACC_STATIC, "()V", 0);
  execute(f, iconst_0);
  execute(f, aconst_null);
  execute(f, dup_x1);

  Frame* next = successor(f);
  ASSERT_EQ(3u, next->inputStackSize());
  EXPECT_EQ(AbstractType::null(), next->inputStack[0]);
  EXPECT_EQ(AbstractType::integer(), next->inputStack[1]);
  EXPECT_EQ(AbstractType::null(), next->inputStack[2]);
}

TEST_F(FrameTest, swapBelowInputStack)
{
  FrameElement stack[] = {FrameElement::item(AbstractType::IntegerItem),
                          FrameElement::className("java/lang/String")};

  Frame* f = newFrame();
  f->setInputFrameFromApiFormat(&symbols, &code, 0, 0, 0, 2, stack);
  execute(f, swap);

  EXPECT_EQ(-2, f->outputStackStart);
  EXPECT_EQ(2u, f->outputStackTop);

  Frame* next = successor(f);
  ASSERT_EQ(2u, next->inputStackSize());
  EXPECT_EQ(reference("java/lang/String"), next->inputStack[0]);
  EXPECT_EQ(AbstractType::integer(), next->inputStack[1]);
}

TEST_F(FrameTest, popKeepsUnpoppedInputStack)
{
  FrameElement stack[] = {FrameElement::item(AbstractType::FloatItem),
                          FrameElement::item(AbstractType::LongItem)};

  Frame* f = newFrame();
  f->setInputFrameFromApiFormat(&symbols, &code, 0, 0, 0, 2, stack);
  execute(f, pop2);
  execute(f, iconst_1);

  Frame* next = successor(f);
  ASSERT_EQ(2u, next->inputStackSize());
  EXPECT_EQ(AbstractType::float_(), next->inputStack[0]);
  EXPECT_EQ(AbstractType::integer(), next->inputStack[1]);
}

TEST_F(FrameTest, fieldsAndMethods)
{
  Frame* f = start(0, "(Ljava/lang/String;)V", 2);

  execute(f, aload, 0);
  execute(f,
          getfield,
          0,
          symbols.addConstantFieldref("test/Owner", "count", "I"));
  execute(f, aload, 0);
  execute(f, iconst_0);
  execute(f,
          putfield,
          0,
          symbols.addConstantFieldref("test/Owner", "count", "I"));
  execute(f, aload, 1);
  execute(f,
          invokevirtual,
          0,
          symbols.addConstantMethodref(
              "java/lang/String", "length", "()I", false));
  execute(f, lconst_0);
  execute(f, lconst_0);
  execute(f,
          invokestatic,
          0,
          symbols.addConstantMethodref("foo/Util", "max", "(JJ)J", false));
  execute(f,
          getstatic,
          0,
          symbols.addConstantFieldref(
              "foo/Util", "NAME", "Ljava/lang/String;"));

  EXPECT_EQ(6, f->outputStackMax);

  Frame* next = successor(f);
  ASSERT_EQ(5u, next->inputStackSize());
  EXPECT_EQ(AbstractType::integer(), next->inputStack[0]);
  EXPECT_EQ(AbstractType::integer(), next->inputStack[1]);
  EXPECT_EQ(AbstractType::long_(), next->inputStack[2]);
  EXPECT_EQ(AbstractType::top(), next->inputStack[3]);
  EXPECT_EQ(reference("java/lang/String"), next->inputStack[4]);
}

TEST_F(FrameTest, newThenConstructor)
{
  Frame* f = start(0, "()V", 2);
  execute(f, new_, 4, symbols.addConstantClass("foo/Bar"));
  execute(f, dup_);
  execute(f, dup_);
  execute(f, astore, 1);
  execute(f,
          invokespecial,
          0,
          symbols.addConstantMethodref("foo/Bar", "<init>", "()V", false));

  Frame* next = successor(f);
  ASSERT_EQ(1u, next->inputStackSize());
  EXPECT_EQ(reference("foo/Bar"), next->inputStack[0]);
  EXPECT_EQ(reference("foo/Bar"), next->inputLocals[1]);
}

TEST_F(FrameTest, uninitializedUntilConstructorCalled)
{
  Frame* f = start(ACC_STATIC, "()V", 0);
  execute(f, new_, 4, symbols.addConstantClass("foo/Bar"));

  Frame* next = successor(f);
  ASSERT_EQ(1u, next->inputStackSize());
  EXPECT_EQ(AbstractType::uninitialized(
                symbols.addUninitializedType("foo/Bar", 4)),
            next->inputStack[0]);
}

TEST_F(FrameTest, constructorInitializesThis)
{
  Frame* f = start(0, "()V", 1, true);
  execute(f, aload, 0);
  execute(f,
          invokespecial,
          0,
          symbols.addConstantMethodref(
              "java/lang/Object", "<init>", "()V", false));

  Frame* next = successor(f);
  EXPECT_EQ(reference("test/Owner"), next->inputLocals[0]);
  EXPECT_EQ(0u, next->inputStackSize());
}

TEST_F(FrameTest, arrayCreation)
{
  Frame* f = start(ACC_STATIC, "()V", 0);
  execute(f, iconst_1);
  execute(f, newarray, T_INT);
  execute(f, iconst_1);
  execute(f, anewarray, 0, symbols.addConstantClass("java/lang/String"));
  execute(f, iconst_1);
  execute(f, anewarray, 0, symbols.addConstantClass("[I"));
  execute(f, aconst_null);
  execute(f, checkcast, 0, symbols.addConstantClass("[Ljava/lang/String;"));
  execute(f, iconst_1);
  execute(f, iconst_1);
  execute(f,
          multianewarray,
          2,
          symbols.addConstantClass("[[Ljava/lang/String;"));
  execute(f, aconst_null);
  execute(f, checkcast, 0, symbols.addConstantClass("foo/Bar"));

  AbstractType string = reference("java/lang/String");
  Frame* next = successor(f);
  ASSERT_EQ(6u, next->inputStackSize());
  EXPECT_EQ(AbstractType::integer().arrayOf(), next->inputStack[0]);
  EXPECT_EQ(string.arrayOf(), next->inputStack[1]);
  EXPECT_EQ(AbstractType::integer().arrayOf().arrayOf(), next->inputStack[2]);
  EXPECT_EQ(string.arrayOf(), next->inputStack[3]);
  EXPECT_EQ(string.arrayOf().arrayOf(), next->inputStack[4]);
  EXPECT_EQ(reference("foo/Bar"), next->inputStack[5]);
}

TEST_F(FrameTest, constants)
{
  Frame* f = start(ACC_STATIC, "()V", 0);
  execute(f, ldc, 0, symbols.addConstantString("hello"));
  execute(f, ldc, 0, symbols.addConstantClass("foo/Bar"));
  execute(f, ldc2_w, 0, symbols.addConstantLong(1));
  execute(f, ldc, 0, symbols.addConstantDynamic("x", "Ljava/util/List;", 0));
  execute(f, ldc, 0, symbols.addConstantMethodType("()V"));
  execute(f, ldc, 0, symbols.addConstantFloat(1.5f));

  Frame* next = successor(f);
  ASSERT_EQ(7u, next->inputStackSize());
  EXPECT_EQ(reference("java/lang/String"), next->inputStack[0]);
  EXPECT_EQ(reference("java/lang/Class"), next->inputStack[1]);
  EXPECT_EQ(AbstractType::long_(), next->inputStack[2]);
  EXPECT_EQ(AbstractType::top(), next->inputStack[3]);
  EXPECT_EQ(reference("java/util/List"), next->inputStack[4]);
  EXPECT_EQ(reference("java/lang/invoke/MethodType"), next->inputStack[5]);
  EXPECT_EQ(AbstractType::float_(), next->inputStack[6]);
}

TEST_F(FrameTest, invokeDynamic)
{
  Frame* f = start(ACC_STATIC, "()V", 0);
  execute(f, iconst_0);
  execute(f,
          invokedynamic,
          0,
          symbols.addConstantInvokeDynamic(
              "run", "(I)Ljava/lang/Runnable;", 0));

  Frame* next = successor(f);
  ASSERT_EQ(1u, next->inputStackSize());
  EXPECT_EQ(reference("java/lang/Runnable"), next->inputStack[0]);
}

TEST_F(FrameTest, subroutinesAbort)
{
  Frame* f = start(ACC_STATIC, "()V", 0);
  EXPECT_DEATH(execute(f, jsr), "");
}

TEST_F(FrameTest, exceptionEdge)
{
  Frame* f = start(ACC_STATIC, "()V", 1);
  execute(f, iconst_0);
  execute(f, istore, 0);
  execute(f, iconst_1);

  Frame* handler = newFrame();
  EXPECT_TRUE(f->merge(&symbols, handler, reference("java/io/IOException")));

  ASSERT_EQ(1u, handler->inputStackSize());
  EXPECT_EQ(reference("java/io/IOException"), handler->inputStack[0]);
  // the handler may be entered before or after the store
  EXPECT_EQ(AbstractType::top(), handler->inputLocals[0]);
}

TEST_F(FrameTest, mergeReportsChange)
{
  Frame* f = start(ACC_STATIC, "(I)V", 1);
  execute(f, aconst_null);

  Frame* dst = newFrame();
  EXPECT_TRUE(f->merge(&symbols, dst, AbstractType()));
  EXPECT_FALSE(f->merge(&symbols, dst, AbstractType()));

  Frame* other = start(ACC_STATIC, "(I)V", 1);
  execute(other, ldc, 0, symbols.addConstantString("x"));
  EXPECT_TRUE(other->merge(&symbols, dst, AbstractType()));
  EXPECT_EQ(reference("java/lang/String"), dst->inputStack[0]);
  EXPECT_FALSE(f->merge(&symbols, dst, AbstractType()));
}

TEST_F(FrameTest, copyFrom)
{
  Frame* f = start(ACC_STATIC, "(I)V", 2);
  execute(f, iconst_0);

  Frame* copy = newFrame();
  copy->copyFrom(f);

  EXPECT_TRUE(copy->hasInputFrame());
  EXPECT_EQ(f->inputLocals.count, copy->inputLocals.count);
  EXPECT_NE(f->inputLocals.begin(), copy->inputLocals.begin());
  EXPECT_EQ(AbstractType::integer(), copy->inputLocals[0]);
  EXPECT_EQ(f->outputStackTop, copy->outputStackTop);
  EXPECT_EQ(f->outputStackMax, copy->outputStackMax);
}
