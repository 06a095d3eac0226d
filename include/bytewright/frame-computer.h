/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_FRAME_COMPUTER_H
#define BYTEWRIGHT_FRAME_COMPUTER_H

#include <bytewright/abstract-type.h>
#include <bytewright/code.h>
#include <bytewright/frame.h>
#include <bytewright/stack-map.h>
#include <bytewright/symbol-table.h>
#include <bytewright/system.h>

namespace bytewright {

// A control flow edge.  "info" is the unassigned type for jumps and fall
// through, and the type of the caught exception for exception edges.
class Edge {
 public:
  Edge(AbstractType info, unsigned successor, int label, Edge* next)
      : info(info), successor(successor), label(label), next(next)
  {
  }

  AbstractType info;
  unsigned successor;
  // label the successor is bound to, or -1 once resolved
  int label;
  Edge* next;
};

class Block {
 public:
  static const unsigned JumpTarget = 1 << 0;
  static const unsigned Reachable = 1 << 1;

  Block(unsigned id, unsigned offset, Frame* frame)
      : id(id), offset(offset), flags(0), frame(frame), edges(0)
  {
  }

  bool jumpTarget()
  {
    return (flags & JumpTarget) != 0;
  }

  bool reachable()
  {
    return (flags & Reachable) != 0;
  }

  // blocks are numbered in bytecode offset order
  unsigned id;
  unsigned offset;
  unsigned flags;
  Frame* frame;
  Edge* edges;
};

// Bytecode range [start, end) no execution path reaches.
class DeadCode {
 public:
  DeadCode(unsigned start, unsigned end, DeadCode* next)
      : start(start), end(end), next(next)
  {
  }

  unsigned start;
  unsigned end;
  DeadCode* next;
};

class MethodFrames {
 public:
  virtual unsigned maxStack() = 0;
  virtual unsigned maxLocals() = 0;

  virtual unsigned blockCount() = 0;
  virtual Block* block(unsigned id) = 0;
  virtual Block* blockOfLabel(unsigned label) = 0;

  virtual DeadCode* firstDeadCode() = 0;

  virtual StackMapTable* stackMapTable() = 0;

  virtual void dispose() = 0;
};

// Computes the stack map frames, max stack and max locals of a method
// body.  Exception handler ranges are removed from any dead code found.
// Throws UnsupportedInput if the body uses subroutines or refers to labels
// which are never bound.
MethodFrames* computeFrames(System* s,
                            SymbolTable* symbols,
                            Code* code,
                            unsigned access,
                            const char* name,
                            const char* descriptor,
                            unsigned propertyCount = 0,
                            const char** properties = 0);

}  // namespace bytewright

#endif  // BYTEWRIGHT_FRAME_COMPUTER_H
