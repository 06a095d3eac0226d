/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_CODE_H
#define BYTEWRIGHT_CODE_H

#include <bytewright/common.h>
#include <bytewright/opcodes.h>
#include <bytewright/symbol-table.h>
#include <bytewright/system.h>
#include <bytewright/zone.h>
#include <bytewright/util/slice.h>

namespace bytewright {

// The instructions, labels and exception handlers of one method body, in
// the order a class reader or a code generator produces them.  Bytecode
// offsets are assigned as instructions are appended, using the size each
// instruction takes once encoded.
class Code {
 public:
  enum NodeType { LabelNode, InstructionNode };

  class Node {
   public:
    Node(NodeType type, unsigned index, unsigned opcode, unsigned offset)
        : next(0),
          type(type),
          index(index),
          opcode(opcode),
          offset(offset),
          operand(0),
          increment(0),
          symbol(0),
          label(0),
          labels(0, 0)
    {
    }

    Node* next;
    NodeType type;
    // index of the instruction, or of the next instruction for a label
    unsigned index;
    unsigned opcode;
    unsigned offset;
    // local variable, immediate value, array element code or dimensions
    int operand;
    int increment;
    Symbol* symbol;
    // bound label or jump target (default target for switches)
    unsigned label;
    util::Slice<unsigned> labels;
  };

  class Handler {
   public:
    Handler(unsigned start, unsigned end, unsigned handler, const char* type)
        : start(start), end(end), handler(handler), type(type), next(0)
    {
    }

    unsigned start;
    unsigned end;
    unsigned handler;
    // internal name of the caught class, or 0 for any throwable
    const char* type;
    Handler* next;
  };

  Code(System* s, SymbolTable* symbols);

  unsigned newLabel();
  void bind(unsigned label);

  void insn(unsigned opcode);
  void intInsn(unsigned opcode, int operand);
  void varInsn(unsigned opcode, unsigned var);
  void typeInsn(unsigned opcode, const char* type);
  void fieldInsn(unsigned opcode,
                 const char* owner,
                 const char* name,
                 const char* descriptor);
  void methodInsn(unsigned opcode,
                  const char* owner,
                  const char* name,
                  const char* descriptor,
                  bool isInterface);
  void invokeDynamicInsn(const char* name,
                         const char* descriptor,
                         unsigned bootstrapMethodIndex);
  void jumpInsn(unsigned opcode, unsigned label);
  void ldcInsn(Symbol* constant);
  void iincInsn(unsigned var, int increment);
  void tableSwitchInsn(int low,
                       int high,
                       unsigned defaultLabel,
                       const unsigned* labels);
  void lookupSwitchInsn(unsigned defaultLabel,
                        unsigned count,
                        const int* keys,
                        const unsigned* labels);
  void multiANewArrayInsn(const char* descriptor, unsigned dimensions);

  void tryCatchBlock(unsigned start,
                     unsigned end,
                     unsigned handler,
                     const char* type);

  // Orders the exception handlers by increasing length of their protected
  // range so that nested handlers come before the handlers enclosing them.
  void sortTryCatchBlocks();

  // Removes the bytecode range [start, end) from every exception handler,
  // shortening or splitting the handlers which overlap it.
  void removeHandlerRange(unsigned start, unsigned end);

  bool labelBound(unsigned label);
  unsigned labelOffset(unsigned label);

  unsigned length()
  {
    return length_;
  }

  unsigned maxLocals()
  {
    return maxLocals_;
  }

  unsigned instructionCount()
  {
    return instructionCount_;
  }

  unsigned labelCount()
  {
    return labelCount_;
  }

  Node* firstNode()
  {
    return first;
  }

  Handler* firstHandler()
  {
    return handlers;
  }

  System* s;
  SymbolTable* symbols;
  SystemAllocator allocator;
  Zone zone;

 private:
  class Label {
   public:
    bool bound;
    unsigned offset;
  };

  Node* append(unsigned opcode, unsigned size);
  unsigned labelAt(unsigned offset);
  void useLocal(unsigned var, unsigned size);

  Node* first;
  Node* last;
  Handler* handlers;
  util::Slice<Label> labels;
  unsigned labelCount_;
  unsigned length_;
  unsigned maxLocals_;
  unsigned instructionCount_;
};

}  // namespace bytewright

#endif  // BYTEWRIGHT_CODE_H
