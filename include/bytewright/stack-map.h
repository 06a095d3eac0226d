/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_STACK_MAP_H
#define BYTEWRIGHT_STACK_MAP_H

#include <bytewright/abstract-type.h>
#include <bytewright/byte-vector.h>
#include <bytewright/code.h>
#include <bytewright/symbol-table.h>
#include <bytewright/system.h>
#include <bytewright/zone.h>
#include <bytewright/util/slice.h>

namespace bytewright {

// A verification_type_info of the StackMapTable attribute.
class VerificationType {
 public:
  enum Tag {
    Top = 0,
    Integer = 1,
    Float = 2,
    Double = 3,
    Long = 4,
    Null = 5,
    UninitializedThis = 6,
    Object = 7,
    Uninitialized = 8
  };

  VerificationType() : tag(Top), classIndex(0), className(0), offset(0)
  {
  }

  unsigned tag;
  // constant pool index and internal name (or array descriptor) of Object
  unsigned classIndex;
  const char* className;
  // bytecode offset of the "new" instruction of Uninitialized
  unsigned offset;
};

// Builds a StackMapTable attribute from a sequence of frames, each
// compressed against the previous one.  The first frame visited is the
// implicit frame derived from the method descriptor and produces no entry.
class StackMapTable {
 public:
  enum FrameType {
    SameFrame = 0,
    SameLocals1StackItemFrame = 64,
    SameLocals1StackItemFrameExtended = 247,
    ChopFrame = 248,
    SameFrameExtended = 251,
    AppendFrame = 252,
    FullFrame = 255
  };

  class Entry {
   public:
    Entry(unsigned offset, unsigned frameType)
        : offset(offset),
          frameType(frameType),
          locals(0, 0),
          stack(0, 0),
          next(0)
    {
    }

    unsigned offset;
    unsigned frameType;
    util::Slice<VerificationType> locals;
    util::Slice<VerificationType> stack;
    Entry* next;
  };

  StackMapTable(System* s, Zone* zone, SymbolTable* symbols, Code* code);

  void visitFrameStart(unsigned offset, unsigned numLocal, unsigned numStack);
  void visitAbstractType(AbstractType type);
  void visitFrameEnd();

  VerificationType resolve(AbstractType type);

  unsigned entryCount()
  {
    return entryCount_;
  }

  Entry* firstEntry()
  {
    return first;
  }

  // Writes number_of_entries followed by the entries.
  void write(ByteVector* out);

  System* s;
  Zone* zone;
  SymbolTable* symbols;
  Code* code;
  SystemAllocator allocator;
  ByteVector entries;

 private:
  class FrameState {
   public:
    FrameState() : offset(0), numLocal(0), numStack(0), types(0, 0)
    {
    }

    unsigned offset;
    unsigned numLocal;
    unsigned numStack;
    util::Slice<AbstractType> types;
  };

  void putFrame();
  void putVerificationTypes(unsigned start,
                            unsigned end,
                            util::Slice<VerificationType> resolved);

  FrameState current;
  unsigned currentIndex;
  FrameState previous;
  bool hasPrevious;
  Entry* first;
  Entry* last;
  unsigned entryCount_;
};

}  // namespace bytewright

#endif  // BYTEWRIGHT_STACK_MAP_H
