/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <gtest/gtest.h>

#include <string>

#include <bytewright/byte-vector.h>
#include <bytewright/errors.h>
#include <bytewright/frame-computer.h>
#include <bytewright/opcodes.h>

#include "test-support.h"

using namespace bytewright;
using namespace bytewright::test;

namespace {

class FrameComputerTest : public SymbolsTest {
 protected:
  FrameComputerTest() : frames(0)
  {
  }

  ~FrameComputerTest()
  {
    if (frames) {
      frames->dispose();
    }
  }

  MethodFrames* compute(unsigned access,
                        const char* name,
                        const char* descriptor,
                        unsigned propertyCount = 0,
                        const char** properties = 0)
  {
    frames = computeFrames(system.s,
                           &symbols,
                           &code,
                           access,
                           name,
                           descriptor,
                           propertyCount,
                           properties);
    return frames;
  }

  StackMapTable::Entry* entry(unsigned index)
  {
    StackMapTable::Entry* e = frames->stackMapTable()->firstEntry();
    for (unsigned i = 0; i < index and e; ++i) {
      e = e->next;
    }
    return e;
  }

  MethodFrames* frames;
};

}  // namespace

TEST_F(FrameComputerTest, straightLineCodeNeedsNoFrames)
{
  code.varInsn(iload, 0);
  code.varInsn(iload, 1);
  code.insn(iadd);
  code.insn(ireturn);

  compute(ACC_STATIC, "add", "(II)I");

  EXPECT_EQ(0u, frames->stackMapTable()->entryCount());
  EXPECT_EQ(2u, frames->maxStack());
  EXPECT_EQ(2u, frames->maxLocals());
  EXPECT_TRUE(frames->block(0)->reachable());
  EXPECT_TRUE(frames->firstDeadCode() == 0);
}

TEST_F(FrameComputerTest, maxLocalsCoversArguments)
{
  code.insn(return_);

  compute(0, "run", "(JLjava/lang/String;)V");

  EXPECT_EQ(4u, frames->maxLocals());
  EXPECT_EQ(0u, frames->maxStack());
}

TEST_F(FrameComputerTest, diamondMergesStringAndNull)
{
  unsigned otherwise = code.newLabel();
  unsigned join = code.newLabel();

  code.varInsn(iload, 0);
  code.jumpInsn(ifeq, otherwise);
  code.ldcInsn(symbols.addConstantString("s"));
  code.jumpInsn(goto_, join);
  code.bind(otherwise);
  code.insn(aconst_null);
  code.bind(join);
  code.insn(areturn);

  compute(ACC_STATIC, "choose", "(I)Ljava/lang/Object;");

  Block* joinBlock = frames->blockOfLabel(join);
  EXPECT_EQ(10u, joinBlock->offset);
  EXPECT_TRUE(joinBlock->jumpTarget());
  ASSERT_EQ(1u, joinBlock->frame->inputStackSize());
  EXPECT_EQ(reference("java/lang/String"), joinBlock->frame->inputStack[0]);
  EXPECT_EQ(1u, frames->maxStack());

  ASSERT_EQ(2u, frames->stackMapTable()->entryCount());
  EXPECT_EQ(StackMapTable::SameFrame, entry(0)->frameType);
  EXPECT_EQ(9u, entry(0)->offset);
  EXPECT_EQ(StackMapTable::SameLocals1StackItemFrame, entry(1)->frameType);
  EXPECT_STREQ("java/lang/String", entry(1)->stack[0].className);

  ByteVector out(system.s, &allocator, 16);
  frames->stackMapTable()->write(&out);

  const uint8_t expected[] = {0x00, 0x02, 0x09, 0x40, 0x07, 0x00, 0x04};
  ASSERT_EQ(sizeof(expected), out.length());
  for (unsigned i = 0; i < sizeof(expected); ++i) {
    EXPECT_EQ(expected[i], out.get(i)) << "byte " << i;
  }
}

TEST_F(FrameComputerTest, handlerStackHoldsCaughtType)
{
  unsigned start = code.newLabel();
  unsigned end = code.newLabel();
  unsigned handler = code.newLabel();

  code.bind(start);
  code.insn(iconst_1);
  code.varInsn(istore, 0);
  code.bind(end);
  code.insn(return_);
  code.bind(handler);
  code.varInsn(astore, 0);
  code.insn(return_);
  code.tryCatchBlock(start, end, handler, "java/io/IOException");

  compute(ACC_STATIC, "io", "()V");

  Block* handlerBlock = frames->blockOfLabel(handler);
  EXPECT_TRUE(handlerBlock->reachable());
  ASSERT_EQ(1u, handlerBlock->frame->inputStackSize());
  EXPECT_EQ(reference("java/io/IOException"),
            handlerBlock->frame->inputStack[0]);
  EXPECT_EQ(AbstractType::top(), handlerBlock->frame->inputLocals[0]);
  EXPECT_EQ(1u, frames->maxStack());

  ASSERT_EQ(1u, frames->stackMapTable()->entryCount());
  EXPECT_EQ(StackMapTable::SameLocals1StackItemFrame, entry(0)->frameType);
  EXPECT_EQ(3u, entry(0)->offset);
  EXPECT_STREQ("java/io/IOException", entry(0)->stack[0].className);
}

TEST_F(FrameComputerTest, catchAllHandlerCatchesThrowable)
{
  unsigned start = code.newLabel();
  unsigned end = code.newLabel();
  unsigned handler = code.newLabel();

  code.bind(start);
  code.insn(nop);
  code.bind(end);
  code.insn(return_);
  code.bind(handler);
  code.insn(athrow);
  code.tryCatchBlock(start, end, handler, 0);

  compute(ACC_STATIC, "any", "()V");

  EXPECT_EQ(reference("java/lang/Throwable"),
            frames->blockOfLabel(handler)->frame->inputStack[0]);
}

TEST_F(FrameComputerTest, intStoreOverLongLeavesTop)
{
  unsigned next = code.newLabel();

  code.insn(lconst_0);
  code.varInsn(lstore, 3);
  code.insn(iconst_0);
  code.varInsn(istore, 3);
  code.jumpInsn(goto_, next);
  code.bind(next);
  code.insn(return_);

  compute(ACC_STATIC, "split", "()V");

  Frame* f = frames->blockOfLabel(next)->frame;
  ASSERT_EQ(5u, f->inputLocals.count);
  EXPECT_EQ(AbstractType::integer(), f->inputLocals[3]);
  EXPECT_EQ(AbstractType::top(), f->inputLocals[4]);
  EXPECT_EQ(2u, frames->maxStack());
  EXPECT_EQ(5u, frames->maxLocals());

  StackMapTable::Entry* e = entry(0);
  ASSERT_TRUE(e != 0);
  EXPECT_EQ(StackMapTable::FullFrame, e->frameType);
  ASSERT_EQ(4u, e->locals.count);
  EXPECT_EQ(VerificationType::Top, e->locals[2].tag);
  EXPECT_EQ(VerificationType::Integer, e->locals[3].tag);
}

TEST_F(FrameComputerTest, constructorInitializesAcrossBlocks)
{
  unsigned second = code.newLabel();
  unsigned third = code.newLabel();

  code.varInsn(aload, 0);
  code.methodInsn(invokespecial, "java/lang/Object", "<init>", "()V", false);
  code.typeInsn(new_, "foo/Bar");
  code.insn(dup_);
  code.jumpInsn(goto_, second);
  code.bind(second);
  code.methodInsn(invokespecial, "foo/Bar", "<init>", "()V", false);
  code.varInsn(astore, 1);
  code.jumpInsn(goto_, third);
  code.bind(third);
  code.insn(return_);

  compute(0, "<init>", "()V");

  AbstractType uninitialized
      = AbstractType::uninitialized(symbols.addUninitializedType("foo/Bar", 4));

  Frame* f = frames->blockOfLabel(second)->frame;
  ASSERT_EQ(2u, f->inputStackSize());
  EXPECT_EQ(uninitialized, f->inputStack[0]);
  EXPECT_EQ(uninitialized, f->inputStack[1]);
  EXPECT_EQ(reference("test/Owner"), f->inputLocals[0]);

  f = frames->blockOfLabel(third)->frame;
  EXPECT_EQ(0u, f->inputStackSize());
  EXPECT_EQ(reference("test/Owner"), f->inputLocals[0]);
  EXPECT_EQ(reference("foo/Bar"), f->inputLocals[1]);

  StackMapTable::Entry* e = entry(0);
  ASSERT_TRUE(e != 0);
  ASSERT_EQ(2u, e->stack.count);
  EXPECT_EQ(VerificationType::Uninitialized, e->stack[0].tag);
  EXPECT_EQ(4u, e->stack[0].offset);
  EXPECT_EQ(VerificationType::Object, e->locals[0].tag);
  EXPECT_STREQ("test/Owner", e->locals[0].className);
}

TEST_F(FrameComputerTest, loopReachesFixedPoint)
{
  unsigned loop = code.newLabel();

  code.insn(iconst_0);
  code.varInsn(istore, 1);
  code.bind(loop);
  code.iincInsn(1, 1);
  code.varInsn(iload, 1);
  code.varInsn(iload, 0);
  code.jumpInsn(if_icmplt, loop);
  code.insn(return_);

  compute(ACC_STATIC, "count", "(I)V");

  Frame* f = frames->blockOfLabel(loop)->frame;
  EXPECT_EQ(AbstractType::integer(), f->inputLocals[0]);
  EXPECT_EQ(AbstractType::integer(), f->inputLocals[1]);
  EXPECT_EQ(2u, frames->maxStack());

  ASSERT_EQ(1u, frames->stackMapTable()->entryCount());
  EXPECT_EQ(StackMapTable::AppendFrame, entry(0)->frameType);
  EXPECT_EQ(2u, entry(0)->offset);
}

TEST_F(FrameComputerTest, loopWithObjectsWidensToCommonType)
{
  unsigned loop = code.newLabel();

  code.ldcInsn(symbols.addConstantString("x"));
  code.varInsn(astore, 1);
  code.bind(loop);
  code.fieldInsn(getstatic, "foo/Bar", "VALUE", "Ljava/lang/Integer;");
  code.varInsn(astore, 1);
  code.varInsn(iload, 0);
  code.jumpInsn(ifne, loop);
  code.insn(return_);

  compute(ACC_STATIC, "widen", "(I)V");

  EXPECT_EQ(reference("java/lang/Object"),
            frames->blockOfLabel(loop)->frame->inputLocals[1]);
}

TEST_F(FrameComputerTest, switchTargets)
{
  unsigned zero = code.newLabel();
  unsigned one = code.newLabel();
  unsigned otherwise = code.newLabel();
  unsigned targets[] = {zero, one};

  code.varInsn(iload, 0);
  code.tableSwitchInsn(0, 1, otherwise, targets);
  code.bind(zero);
  code.insn(iconst_1);
  code.insn(ireturn);
  code.bind(one);
  code.insn(iconst_2);
  code.insn(ireturn);
  code.bind(otherwise);
  code.insn(iconst_0);
  code.insn(ireturn);

  compute(ACC_STATIC, "select", "(I)I");

  EXPECT_EQ(24u, frames->blockOfLabel(zero)->offset);
  ASSERT_EQ(3u, frames->stackMapTable()->entryCount());
  EXPECT_EQ(24u, entry(0)->offset);
  EXPECT_EQ(26u, entry(1)->offset);
  EXPECT_EQ(28u, entry(2)->offset);
  for (unsigned i = 0; i < 3; ++i) {
    EXPECT_EQ(StackMapTable::SameFrame, entry(i)->frameType);
  }
  EXPECT_TRUE(frames->firstDeadCode() == 0);
}

TEST_F(FrameComputerTest, deadCodeGetsThrowableFrame)
{
  code.insn(return_);
  code.insn(iconst_0);
  code.insn(bytewright::pop);
  code.insn(return_);

  compute(ACC_STATIC, "dead", "()V");

  DeadCode* d = frames->firstDeadCode();
  ASSERT_TRUE(d != 0);
  EXPECT_EQ(1u, d->start);
  EXPECT_EQ(4u, d->end);
  EXPECT_TRUE(d->next == 0);
  EXPECT_FALSE(frames->block(1)->reachable());
  EXPECT_EQ(1u, frames->maxStack());

  ASSERT_EQ(1u, frames->stackMapTable()->entryCount());
  StackMapTable::Entry* e = entry(0);
  EXPECT_EQ(1u, e->offset);
  EXPECT_EQ(StackMapTable::SameLocals1StackItemFrame, e->frameType);
  EXPECT_STREQ("java/lang/Throwable", e->stack[0].className);
}

TEST_F(FrameComputerTest, deadCodeInsideTryRange)
{
  unsigned start = code.newLabel();
  unsigned next = code.newLabel();
  unsigned end = code.newLabel();
  unsigned handler = code.newLabel();

  code.bind(start);
  code.insn(nop);
  code.jumpInsn(goto_, next);
  code.insn(iconst_0);
  code.insn(bytewright::pop);
  code.bind(next);
  code.insn(return_);
  code.bind(end);
  code.bind(handler);
  code.insn(athrow);
  code.tryCatchBlock(start, end, handler, "java/lang/Exception");

  compute(ACC_STATIC, "guarded", "()V");

  DeadCode* d = frames->firstDeadCode();
  ASSERT_TRUE(d != 0);
  EXPECT_EQ(4u, d->start);
  EXPECT_EQ(6u, d->end);
  EXPECT_TRUE(d->next == 0);

  // the protected range no longer covers the dead instructions
  Code::Handler* h = code.firstHandler();
  ASSERT_TRUE(h != 0);
  EXPECT_EQ(0u, code.labelOffset(h->start));
  EXPECT_EQ(4u, code.labelOffset(h->end));
  EXPECT_EQ(handler, h->handler);
  h = h->next;
  ASSERT_TRUE(h != 0);
  EXPECT_EQ(next, h->start);
  EXPECT_EQ(end, h->end);
  EXPECT_EQ(handler, h->handler);
  EXPECT_STREQ("java/lang/Exception", h->type);
  EXPECT_TRUE(h->next == 0);

  EXPECT_TRUE(frames->blockOfLabel(handler)->reachable());
  EXPECT_EQ(reference("java/lang/Exception"),
            frames->blockOfLabel(handler)->frame->inputStack[0]);
}

TEST_F(FrameComputerTest, subroutinesAreRejected)
{
  unsigned target = code.newLabel();
  code.insn(nop);
  code.jumpInsn(jsr, target);
  code.bind(target);
  code.insn(return_);

  try {
    compute(ACC_STATIC, "old", "()V");
    FAIL() << "expected UnsupportedInput";
  } catch (UnsupportedInput& e) {
    EXPECT_EQ(1u, e.instruction);
    EXPECT_EQ(jsr, e.opcode);
  }
}

TEST_F(FrameComputerTest, retIsRejected)
{
  code.varInsn(ret, 0);

  EXPECT_THROW(compute(ACC_STATIC, "old", "()V"), UnsupportedInput);
}

TEST_F(FrameComputerTest, unboundTargetIsRejected)
{
  unsigned nowhere = code.newLabel();
  code.varInsn(iload, 0);
  code.jumpInsn(ifeq, nowhere);
  code.insn(return_);

  try {
    compute(ACC_STATIC, "broken", "(I)V");
    FAIL() << "expected UnsupportedInput";
  } catch (UnsupportedInput& e) {
    EXPECT_EQ(1u, e.instruction);
    EXPECT_EQ(ifeq, e.opcode);
  }
}

TEST_F(FrameComputerTest, unboundHandlerIsRejected)
{
  unsigned start = code.newLabel();
  unsigned end = code.newLabel();
  unsigned handler = code.newLabel();
  code.bind(start);
  code.insn(nop);
  code.bind(end);
  code.insn(return_);
  code.tryCatchBlock(start, end, handler, 0);

  EXPECT_THROW(compute(ACC_STATIC, "broken", "()V"), UnsupportedInput);
}

TEST_F(FrameComputerTest, wideReturnValue)
{
  code.insn(lconst_1);
  code.insn(lreturn);

  compute(ACC_STATIC, "one", "()J");

  EXPECT_EQ(2u, frames->maxStack());
  EXPECT_EQ(0u, frames->maxLocals());
}

TEST_F(FrameComputerTest, logProperty)
{
  std::string path = ::testing::TempDir() + "bytewright-frames.log";
  remove(path.c_str());

  std::string property = "bytewright.frames.log=" + path;
  const char* properties[] = {property.c_str()};

  unsigned label = code.newLabel();
  code.jumpInsn(goto_, label);
  code.bind(label);
  code.insn(return_);

  compute(ACC_STATIC, "logged", "()V", 1, properties);
  frames->dispose();
  frames = 0;

  FILE* f = fopen(path.c_str(), "r");
  ASSERT_TRUE(f != 0);
  char line[256];
  ASSERT_TRUE(fgets(line, sizeof(line), f) != 0);
  EXPECT_STREQ("frames for test/Owner.logged()V\n", line);
  fclose(f);
  remove(path.c_str());
}
