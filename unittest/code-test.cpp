/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <gtest/gtest.h>

#include <bytewright/code.h>
#include <bytewright/errors.h>
#include <bytewright/opcodes.h>

#include "test-support.h"

using namespace bytewright;
using namespace bytewright::test;

namespace {

// Offset of the instruction with the given index.
unsigned offsetOf(Code* code, unsigned index)
{
  for (Code::Node* n = code->firstNode(); n; n = n->next) {
    if (n->type == Code::InstructionNode and n->index == index) {
      return n->offset;
    }
  }
  ADD_FAILURE() << "no instruction " << index;
  return 0;
}

}  // namespace

typedef SymbolsTest CodeTest;

TEST_F(CodeTest, localVariableEncodings)
{
  code.varInsn(iload, 0);
  code.varInsn(iload, 5);
  code.varInsn(iload, 300);
  code.insn(ireturn);

  EXPECT_EQ(0u, offsetOf(&code, 0));
  EXPECT_EQ(1u, offsetOf(&code, 1));
  EXPECT_EQ(3u, offsetOf(&code, 2));
  EXPECT_EQ(7u, offsetOf(&code, 3));
  EXPECT_EQ(8u, code.length());
  EXPECT_EQ(4u, code.instructionCount());
  EXPECT_EQ(301u, code.maxLocals());
}

TEST_F(CodeTest, wideLocalsTakeTwoSlots)
{
  code.varInsn(lstore, 3);
  EXPECT_EQ(5u, code.maxLocals());

  code.varInsn(dload, 300);
  EXPECT_EQ(302u, code.maxLocals());

  code.varInsn(istore, 1);
  EXPECT_EQ(302u, code.maxLocals());
}

TEST_F(CodeTest, iinc)
{
  code.iincInsn(1, 1);
  code.iincInsn(1, 200);
  code.iincInsn(400, -1);

  EXPECT_EQ(3u, offsetOf(&code, 1));
  EXPECT_EQ(9u, offsetOf(&code, 2));
  EXPECT_EQ(15u, code.length());
  EXPECT_EQ(401u, code.maxLocals());
}

TEST_F(CodeTest, operandSizes)
{
  code.intInsn(bipush, 10);
  code.intInsn(sipush, 1000);
  code.intInsn(newarray, T_INT);
  code.typeInsn(new_, "foo/Bar");
  code.fieldInsn(getstatic, "foo/Bar", "x", "I");
  code.methodInsn(invokeinterface, "java/util/List", "size", "()I", true);
  code.methodInsn(invokestatic, "foo/Bar", "f", "()V", false);
  code.invokeDynamicInsn("run", "()Ljava/lang/Runnable;", 0);
  code.multiANewArrayInsn("[[I", 2);

  EXPECT_EQ(2u, offsetOf(&code, 1));
  EXPECT_EQ(5u, offsetOf(&code, 2));
  EXPECT_EQ(7u, offsetOf(&code, 3));
  EXPECT_EQ(10u, offsetOf(&code, 4));
  EXPECT_EQ(13u, offsetOf(&code, 5));
  EXPECT_EQ(18u, offsetOf(&code, 6));
  EXPECT_EQ(21u, offsetOf(&code, 7));
  EXPECT_EQ(26u, offsetOf(&code, 8));
  EXPECT_EQ(30u, code.length());
}

TEST_F(CodeTest, ldcForms)
{
  code.ldcInsn(symbols.addConstantString("a"));
  code.ldcInsn(symbols.addConstantLong(1));
  code.ldcInsn(symbols.addConstantDouble(2.0));

  EXPECT_EQ(2u, offsetOf(&code, 1));
  EXPECT_EQ(5u, offsetOf(&code, 2));
  EXPECT_EQ(8u, code.length());

  Symbol* last = 0;
  while (symbols.constantPoolCount() < 300) {
    last = symbols.addConstantInteger(symbols.constantPoolCount());
  }
  ASSERT_TRUE(last->index >= 256);

  code.ldcInsn(last);
  EXPECT_EQ(11u, code.length());
}

TEST_F(CodeTest, jumps)
{
  unsigned label = code.newLabel();
  code.jumpInsn(goto_, label);
  code.jumpInsn(goto_w, label);
  code.bind(label);
  code.insn(return_);

  EXPECT_EQ(3u, offsetOf(&code, 1));
  EXPECT_TRUE(code.labelBound(label));
  EXPECT_EQ(8u, code.labelOffset(label));

  Code::Node* n = code.firstNode();
  EXPECT_EQ(Code::InstructionNode, n->type);
  EXPECT_EQ(label, n->label);
}

TEST_F(CodeTest, labelNodes)
{
  unsigned first = code.newLabel();
  unsigned second = code.newLabel();
  code.insn(nop);
  code.bind(first);
  code.bind(second);
  code.insn(nop);

  Code::Node* n = code.firstNode()->next;
  ASSERT_EQ(Code::LabelNode, n->type);
  EXPECT_EQ(first, n->label);
  EXPECT_EQ(1u, n->offset);
  EXPECT_EQ(1u, n->index);

  n = n->next;
  ASSERT_EQ(Code::LabelNode, n->type);
  EXPECT_EQ(second, n->label);
  EXPECT_EQ(2u, code.labelCount());
}

TEST_F(CodeTest, manyLabels)
{
  for (unsigned i = 0; i < 100; ++i) {
    EXPECT_EQ(i, code.newLabel());
  }
  code.bind(99);
  EXPECT_FALSE(code.labelBound(98));
  EXPECT_TRUE(code.labelBound(99));
}

TEST_F(CodeTest, bindingTwiceThrows)
{
  unsigned label = code.newLabel();
  code.bind(label);
  code.insn(nop);

  EXPECT_THROW(code.bind(label), UnsupportedInput);
}

TEST_F(CodeTest, switchPadding)
{
  unsigned labels[] = {code.newLabel(), code.newLabel()};

  code.tableSwitchInsn(0, 1, labels[0], labels);
  EXPECT_EQ(24u, code.length());

  code.insn(iconst_0);
  code.insn(iconst_0);
  code.insn(iconst_0);
  code.tableSwitchInsn(0, 1, labels[0], labels);
  EXPECT_EQ(27u + 21u, code.length());

  int keys[] = {10, 20};
  code.lookupSwitchInsn(labels[1], 2, keys, labels);
  // at 48: opcode, 3 bytes of padding, default, count, two pairs
  EXPECT_EQ(48u + 1u + 3u + 8u + 16u, code.length());

  Code::Node* n = code.firstNode();
  EXPECT_EQ(0, n->operand);
  EXPECT_EQ(labels[0], n->label);
  ASSERT_EQ(2u, n->labels.count);
  EXPECT_EQ(labels[1], n->labels[1]);
}

TEST_F(CodeTest, sortTryCatchBlocks)
{
  unsigned outerStart = code.newLabel();
  unsigned innerStart = code.newLabel();
  unsigned innerEnd = code.newLabel();
  unsigned outerEnd = code.newLabel();
  unsigned handler = code.newLabel();

  code.bind(outerStart);
  code.insn(nop);
  code.bind(innerStart);
  code.insn(nop);
  code.bind(innerEnd);
  code.insn(nop);
  code.bind(outerEnd);
  code.insn(return_);
  code.bind(handler);
  code.insn(athrow);

  code.tryCatchBlock(outerStart, outerEnd, handler, "java/lang/Exception");
  code.tryCatchBlock(innerStart, innerEnd, handler, "java/io/IOException");
  code.tryCatchBlock(outerStart, outerEnd, handler, 0);

  code.sortTryCatchBlocks();

  Code::Handler* h = code.firstHandler();
  ASSERT_TRUE(h != 0);
  EXPECT_STREQ("java/io/IOException", h->type);
  h = h->next;
  ASSERT_TRUE(h != 0);
  EXPECT_STREQ("java/lang/Exception", h->type);
  h = h->next;
  ASSERT_TRUE(h != 0);
  EXPECT_TRUE(h->type == 0);
  EXPECT_TRUE(h->next == 0);
}

TEST_F(CodeTest, sortRejectsUnboundRange)
{
  unsigned start = code.newLabel();
  unsigned end = code.newLabel();
  unsigned handler = code.newLabel();
  code.bind(start);
  code.insn(nop);
  code.bind(handler);
  code.insn(athrow);
  code.tryCatchBlock(start, end, handler, 0);

  EXPECT_THROW(code.sortTryCatchBlocks(), UnsupportedInput);
}

TEST_F(CodeTest, removeHandlerRange)
{
  unsigned labels[7];
  for (unsigned i = 0; i < 7; ++i) {
    labels[i] = code.newLabel();
  }
  unsigned handler = code.newLabel();

  for (unsigned i = 0; i < 6; ++i) {
    code.bind(labels[i]);
    code.insn(nop);
  }
  code.bind(labels[6]);
  code.insn(return_);
  code.bind(handler);
  code.insn(athrow);

  code.tryCatchBlock(labels[0], labels[6], handler, "a/Split");
  code.tryCatchBlock(labels[2], labels[3], handler, "a/Gone");
  code.tryCatchBlock(labels[0], labels[3], handler, "a/Tail");
  code.tryCatchBlock(labels[3], labels[6], handler, "a/Head");
  code.tryCatchBlock(labels[4], labels[6], handler, "a/Clear");

  code.removeHandlerRange(2, 4);

  const char* types[] = {"a/Split", "a/Split", "a/Tail", "a/Head", "a/Clear"};
  unsigned starts[] = {0, 4, 0, 4, 4};
  unsigned ends[] = {2, 6, 2, 6, 6};

  Code::Handler* h = code.firstHandler();
  for (unsigned i = 0; i < 5; ++i) {
    ASSERT_TRUE(h != 0);
    EXPECT_STREQ(types[i], h->type);
    EXPECT_EQ(starts[i], code.labelOffset(h->start));
    EXPECT_EQ(ends[i], code.labelOffset(h->end));
    EXPECT_EQ(handler, h->handler);
    h = h->next;
  }
  EXPECT_TRUE(h == 0);

  // existing labels are reused for the new boundaries
  EXPECT_EQ(labels[4], code.firstHandler()->next->start);
}
