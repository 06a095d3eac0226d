/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <gtest/gtest.h>

#include <bytewright/byte-vector.h>
#include <bytewright/frame.h>
#include <bytewright/opcodes.h>
#include <bytewright/stack-map.h>

#include "test-support.h"

using namespace bytewright;
using namespace bytewright::test;

namespace {

class StackMapTest : public SymbolsTest {
 protected:
  StackMapTest() : table(system.s, &zone, &symbols, &code)
  {
  }

  void frame(unsigned offset,
             unsigned numLocal,
             const AbstractType* locals,
             unsigned numStack,
             const AbstractType* stack)
  {
    table.visitFrameStart(offset, numLocal, numStack);
    for (unsigned i = 0; i < numLocal; ++i) {
      table.visitAbstractType(locals[i]);
    }
    for (unsigned i = 0; i < numStack; ++i) {
      table.visitAbstractType(stack[i]);
    }
    table.visitFrameEnd();
  }

  StackMapTable table;
};

}  // namespace

TEST_F(StackMapTest, implicitFrameHasNoEntry)
{
  AbstractType locals[] = {AbstractType::integer()};
  frame(0, 1, locals, 0, 0);

  EXPECT_EQ(0u, table.entryCount());
  EXPECT_TRUE(table.firstEntry() == 0);
}

TEST_F(StackMapTest, compressedFrames)
{
  AbstractType i = AbstractType::integer();
  AbstractType string = reference("java/lang/String");
  AbstractType intLocal[] = {i};
  AbstractType twoLocals[] = {i, AbstractType::float_()};
  AbstractType longLocal[] = {AbstractType::long_()};

  frame(0, 1, intLocal, 0, 0);
  frame(5, 1, intLocal, 0, 0);
  frame(100, 1, intLocal, 0, 0);
  frame(110, 1, intLocal, 1, &string);
  frame(120, 2, twoLocals, 0, 0);
  frame(130, 1, intLocal, 0, 0);
  frame(140, 1, longLocal, 0, 0);

  ASSERT_EQ(6u, table.entryCount());

  StackMapTable::Entry* e = table.firstEntry();
  EXPECT_EQ(StackMapTable::SameFrame, e->frameType);
  EXPECT_EQ(5u, e->offset);
  e = e->next;
  EXPECT_EQ(StackMapTable::SameFrameExtended, e->frameType);
  e = e->next;
  EXPECT_EQ(StackMapTable::SameLocals1StackItemFrame, e->frameType);
  ASSERT_EQ(1u, e->stack.count);
  EXPECT_EQ(VerificationType::Object, e->stack[0].tag);
  EXPECT_STREQ("java/lang/String", e->stack[0].className);
  e = e->next;
  EXPECT_EQ(StackMapTable::AppendFrame, e->frameType);
  e = e->next;
  EXPECT_EQ(StackMapTable::ChopFrame, e->frameType);
  e = e->next;
  EXPECT_EQ(StackMapTable::FullFrame, e->frameType);
  EXPECT_EQ(140u, e->offset);
  ASSERT_EQ(1u, e->locals.count);
  EXPECT_EQ(VerificationType::Long, e->locals[0].tag);
  EXPECT_TRUE(e->next == 0);

  ByteVector out(system.s, &allocator, 64);
  table.write(&out);

  const uint8_t expected[] = {
      0x00, 0x06,                                     // number_of_entries
      0x05,                                           // same, delta 5
      0xfb, 0x00, 0x5e,                               // same extended, 94
      0x49, 0x07, 0x00, 0x02,                         // one stack item, 9
      0xfc, 0x00, 0x09, 0x02,                         // append float
      0xfa, 0x00, 0x09,                               // chop 1
      0xff, 0x00, 0x09, 0x00, 0x01, 0x04, 0x00, 0x00  // full
  };
  ASSERT_EQ(sizeof(expected), out.length());
  for (unsigned i = 0; i < sizeof(expected); ++i) {
    EXPECT_EQ(expected[i], out.get(i)) << "byte " << i;
  }
}

TEST_F(StackMapTest, extendedSingleStackItem)
{
  AbstractType stack[] = {AbstractType::integer()};

  frame(0, 0, 0, 0, 0);
  frame(63, 0, 0, 1, stack);
  frame(200, 0, 0, 1, stack);

  StackMapTable::Entry* e = table.firstEntry();
  EXPECT_EQ(StackMapTable::SameLocals1StackItemFrameExtended, e->frameType);
  e = e->next;
  EXPECT_EQ(StackMapTable::SameLocals1StackItemFrameExtended, e->frameType);

  ByteVector out(system.s, &allocator, 64);
  table.write(&out);
  // 247, delta 63, integer
  EXPECT_EQ(247, out.get(2));
  EXPECT_EQ(63, out.get2(3));
  EXPECT_EQ(1, out.get(5));
  // 247, delta 200 - 63 - 1
  EXPECT_EQ(247, out.get(6));
  EXPECT_EQ(136, out.get2(7));
}

TEST_F(StackMapTest, differentCommonLocalsNeedFullFrame)
{
  AbstractType before[] = {AbstractType::integer()};
  AbstractType after[] = {AbstractType::float_(), AbstractType::integer()};

  frame(0, 1, before, 0, 0);
  frame(4, 2, after, 0, 0);

  EXPECT_EQ(StackMapTable::FullFrame, table.firstEntry()->frameType);
}

TEST_F(StackMapTest, tooManyNewLocalsNeedFullFrame)
{
  AbstractType i = AbstractType::integer();
  AbstractType locals[] = {i, i, i, i};

  frame(0, 0, 0, 0, 0);
  frame(4, 4, locals, 0, 0);

  EXPECT_EQ(StackMapTable::FullFrame, table.firstEntry()->frameType);
}

TEST_F(StackMapTest, resolvesArrays)
{
  VerificationType ints = table.resolve(
      AbstractType::integer().arrayOf().arrayOf());
  EXPECT_EQ(VerificationType::Object, ints.tag);
  EXPECT_STREQ("[[I", ints.className);
  EXPECT_EQ(symbols.addConstantClass("[[I")->index, ints.classIndex);

  EXPECT_STREQ("[Ljava/lang/String;",
               table.resolve(reference("java/lang/String").arrayOf())
                   .className);
  EXPECT_STREQ("[Z", table.resolve(AbstractType::boolean().arrayOf())
                         .className);
}

TEST_F(StackMapTest, resolvesConstants)
{
  EXPECT_EQ(VerificationType::Top, table.resolve(AbstractType::top()).tag);
  EXPECT_EQ(VerificationType::Null, table.resolve(AbstractType::null()).tag);
  EXPECT_EQ(VerificationType::UninitializedThis,
            table.resolve(AbstractType::uninitializedThis()).tag);
  EXPECT_EQ(VerificationType::Double,
            table.resolve(AbstractType::double_()).tag);
}

TEST_F(StackMapTest, resolvesUninitialized)
{
  VerificationType v = table.resolve(AbstractType::uninitialized(
      symbols.addUninitializedType("foo/Bar", 17)));
  EXPECT_EQ(VerificationType::Uninitialized, v.tag);
  EXPECT_EQ(17u, v.offset);
}

TEST_F(StackMapTest, resolvesForwardUninitialized)
{
  unsigned label = code.newLabel();
  AbstractType forward
      = typeFromApiFormat(&symbols, &code, FrameElement::label(label));
  EXPECT_EQ(AbstractType::ForwardUninitializedKind, forward.kind());

  code.insn(nop);
  code.insn(nop);
  code.insn(nop);
  code.bind(label);
  code.typeInsn(new_, "foo/Bar");

  VerificationType v = table.resolve(forward);
  EXPECT_EQ(VerificationType::Uninitialized, v.tag);
  EXPECT_EQ(3u, v.offset);
}

TEST_F(StackMapTest, unboundForwardUninitializedAborts)
{
  unsigned label = code.newLabel();
  AbstractType forward
      = typeFromApiFormat(&symbols, &code, FrameElement::label(label));

  EXPECT_DEATH(table.resolve(forward), "");
}

TEST_F(StackMapTest, acceptElidesWideHalvesAndTrailingTop)
{
  FrameElement locals[] = {FrameElement::item(AbstractType::IntegerItem),
                           FrameElement::item(AbstractType::LongItem),
                           FrameElement::item(AbstractType::TopItem)};
  FrameElement stack[] = {FrameElement::item(AbstractType::LongItem),
                          FrameElement::item(AbstractType::NullItem)};

  Frame* f = new (&zone) Frame(&zone, system.s, 0);
  f->setInputFrameFromApiFormat(&symbols, &code, 5, 3, locals, 2, stack);
  ASSERT_EQ(5u, f->inputLocals.count);
  ASSERT_EQ(3u, f->inputStackSize());

  frame(0, 0, 0, 0, 0);
  f->accept(&table, 10);

  StackMapTable::Entry* e = table.firstEntry();
  ASSERT_TRUE(e != 0);
  EXPECT_EQ(StackMapTable::FullFrame, e->frameType);
  ASSERT_EQ(2u, e->locals.count);
  EXPECT_EQ(VerificationType::Integer, e->locals[0].tag);
  EXPECT_EQ(VerificationType::Long, e->locals[1].tag);
  ASSERT_EQ(2u, e->stack.count);
  EXPECT_EQ(VerificationType::Long, e->stack[0].tag);
  EXPECT_EQ(VerificationType::Null, e->stack[1].tag);
}

TEST_F(StackMapTest, acceptKeepsInnerTop)
{
  FrameElement locals[] = {FrameElement::item(AbstractType::TopItem),
                           FrameElement::item(AbstractType::FloatItem)};

  Frame* f = new (&zone) Frame(&zone, system.s, 0);
  f->setInputFrameFromApiFormat(&symbols, &code, 2, 2, locals, 0, 0);

  frame(0, 0, 0, 0, 0);
  f->accept(&table, 3);

  StackMapTable::Entry* e = table.firstEntry();
  EXPECT_EQ(StackMapTable::AppendFrame, e->frameType);
  ASSERT_EQ(2u, e->locals.count);
  EXPECT_EQ(VerificationType::Top, e->locals[0].tag);
  EXPECT_EQ(VerificationType::Float, e->locals[1].tag);
}
