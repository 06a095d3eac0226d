/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_FRAME_H
#define BYTEWRIGHT_FRAME_H

#include <bytewright/abstract-type.h>
#include <bytewright/code.h>
#include <bytewright/symbol-table.h>
#include <bytewright/zone.h>
#include <bytewright/util/abort.h>
#include <bytewright/util/slice.h>

namespace bytewright {

class StackMapTable;

// One local variable or stack slot of a frame declared by a caller: a
// primitive or null item, an internal class name, or the label bound to the
// "new" instruction which created an uninitialized object.
class FrameElement {
 public:
  enum Type { ItemElement, ClassElement, LabelElement };

  static FrameElement item(unsigned item)
  {
    return FrameElement(ItemElement, item, 0);
  }

  static FrameElement className(const char* name)
  {
    return FrameElement(ClassElement, 0, name);
  }

  static FrameElement label(unsigned label)
  {
    return FrameElement(LabelElement, label, 0);
  }

  bool isWide() const
  {
    return type == ItemElement and (value == AbstractType::LongItem
                                    or value == AbstractType::DoubleItem);
  }

  Type type;
  unsigned value;
  const char* name;

 private:
  FrameElement(Type type, unsigned value, const char* name)
      : type(type), value(value), name(name)
  {
  }
};

AbstractType typeFromApiFormat(SymbolTable* symbols,
                               Code* code,
                               const FrameElement& element);

// The input and output frames of one basic block.
//
// The input frame holds the resolved types of the locals and stack slots on
// entry to the block.  It is computed by merging the output frames of the
// predecessors.  The output frame holds the types on exit, expressed
// relative to the input frame with the Local and Stack kinds since it is
// computed once, by simulating the instructions of the block, before the
// input frame is known.
//
// The output stack is outputStack[0..outputStackTop) on top of the input
// stack slots which remain unpopped.  outputStackStart is minus the number
// of input stack slots popped by the block.
class Frame {
 public:
  Frame(Zone* zone, util::Aborter* a, unsigned owner);

  void copyFrom(Frame* other);

  void setInputFrameFromDescriptor(SymbolTable* symbols,
                                   unsigned access,
                                   bool constructor,
                                   const char* descriptor,
                                   unsigned maxLocals);

  void setInputFrameFromApiFormat(SymbolTable* symbols,
                                  Code* code,
                                  unsigned maxLocals,
                                  unsigned numLocal,
                                  const FrameElement* locals,
                                  unsigned numStack,
                                  const FrameElement* stack);

  bool hasInputFrame()
  {
    return hasInputLocals;
  }

  unsigned inputStackSize()
  {
    return inputStack.count;
  }

  // Simulates one instruction on the output frame.  "arg" is the local
  // variable of load, store and iinc instructions, the array element code of
  // newarray, the dimensions of multianewarray and the bytecode offset of
  // new.  "argSymbol" is the constant pool operand, if any.
  void execute(unsigned opcode,
               int arg,
               Symbol* argSymbol,
               SymbolTable* symbols);

  // Merges the output frame of this block into the input frame of "dst".
  // For an exception edge "catchType" is the type of the caught exception:
  // the handler may be entered before any instruction of this block runs,
  // so the input locals are merged too.  Returns true if the input frame of
  // "dst" changed.
  bool merge(SymbolTable* symbols, Frame* dst, AbstractType catchType);

  // Merges a resolved type into dstTypes[dstIndex], returning true if it
  // changed.
  static bool merge(SymbolTable* symbols,
                    AbstractType sourceType,
                    util::Slice<AbstractType> dstTypes,
                    unsigned dstIndex);

  // Visits the input frame, without the Top slots following longs and
  // doubles and without trailing Top locals.
  void accept(StackMapTable* table, unsigned offset);

  Zone* zone;
  util::Aborter* a;
  unsigned owner;

  bool hasInputLocals;
  bool hasInputStack;
  util::Slice<AbstractType> inputLocals;
  util::Slice<AbstractType> inputStack;

  util::Slice<AbstractType> outputLocals;
  util::Slice<AbstractType> outputStack;
  int outputStackStart;
  unsigned outputStackTop;
  int outputStackMax;

  util::Slice<AbstractType> initializations;
  unsigned initializationCount;

 private:
  AbstractType getLocal(unsigned index);
  void setLocal(unsigned index, AbstractType type);
  void push(AbstractType type);
  void push(SymbolTable* symbols, const char* descriptor);
  AbstractType pop();
  void pop(unsigned count);
  void pop(const char* descriptor);
  void invalidatePreviousLocal(unsigned index);
  void addInitializedType(AbstractType type);
  AbstractType getInitializedType(SymbolTable* symbols, AbstractType type);
  AbstractType getConcreteOutputType(AbstractType type, unsigned numStack);
};

}  // namespace bytewright

#endif  // BYTEWRIGHT_FRAME_H
