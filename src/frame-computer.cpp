/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <errno.h>

#include <bytewright/frame-computer.h>
#include <bytewright/descriptor.h>
#include <bytewright/errors.h>
#include <bytewright/properties.h>
#include <bytewright/zone.h>

#include "debug-util.h"

using namespace bytewright;
using namespace bytewright::util;

namespace {

const bool DebugFrames = false;

const char* const ThrowableType = "java/lang/Throwable";

bool isJump(unsigned opcode)
{
  return (opcode >= ifeq and opcode <= if_acmpne) or opcode == goto_
         or opcode == goto_w or opcode == ifnull or opcode == ifnonnull;
}

bool isReturn(unsigned opcode)
{
  return (opcode >= ireturn and opcode <= return_) or opcode == athrow;
}

void checkLabel(Code* code, Code::Node* node, unsigned label)
{
  if (not code->labelBound(label)) {
    throw UnsupportedInput(
        "branch to a label which is never bound", node->index, node->opcode);
  }
}

// Rejects what the analysis cannot handle before anything is allocated.
void validate(Code* code)
{
  for (Code::Node* n = code->firstNode(); n; n = n->next) {
    if (n->type != Code::InstructionNode) {
      continue;
    }

    switch (n->opcode) {
    case jsr:
    case jsr_w:
    case ret:
      throw UnsupportedInput(
          "subroutines are not supported", n->index, n->opcode);

    case tableswitch:
    case lookupswitch:
      checkLabel(code, n, n->label);
      for (unsigned i = 0; i < n->labels.count; ++i) {
        checkLabel(code, n, n->labels[i]);
      }
      break;

    default:
      if (isJump(n->opcode)) {
        checkLabel(code, n, n->label);
      }
      break;
    }
  }

  for (Code::Handler* h = code->firstHandler(); h; h = h->next) {
    if (not (code->labelBound(h->start) and code->labelBound(h->end)
             and code->labelBound(h->handler))) {
      throw UnsupportedInput("exception handler refers to a label which is "
                             "never bound",
                             code->instructionCount(),
                             -1);
    }
    if (code->labelOffset(h->start) > code->labelOffset(h->end)) {
      throw UnsupportedInput("exception handler range ends before it starts",
                             code->instructionCount(),
                             -1);
    }
  }
}

class MyMethodFrames : public MethodFrames {
 public:
  MyMethodFrames(System* s,
                 SymbolTable* symbols,
                 Code* code,
                 unsigned access,
                 const char* name,
                 const char* descriptor,
                 FILE* log,
                 bool closeLog)
      : s(s),
        symbols(symbols),
        code(code),
        access(access),
        name(name),
        descriptor(descriptor),
        log(log),
        closeLog(closeLog),
        allocator(s),
        zone(&allocator, LikelyPageSizeInBytes),
        table(s, &zone, symbols, code),
        blocks(Slice<Block*>::alloc(
            &zone, code->instructionCount() + code->labelCount() + 1)),
        blockCount_(0),
        labelBlocks(
            Slice<Block*>::allocAndSet(&zone, code->labelCount(), 0)),
        labelFlags(
            Slice<unsigned>::allocAndSet(&zone, code->labelCount(), 0)),
        current(0),
        last(0),
        deadCode(0),
        lastDeadCode(0),
        maxStack_(0),
        maxLocals_(0)
  {
  }

  void compute()
  {
    unsigned argumentSlots = argumentsSize(s, descriptor)
                             + ((access & ACC_STATIC) ? 0 : 1);
    maxLocals_ = max(code->maxLocals(), argumentSlots);

    if (log) {
      fprintf(log,
              "frames for %s.%s%s\n",
              symbols->className(),
              name,
              descriptor);
    }

    buildBlocks();
    addExceptionEdges();

    Frame* first = blocks[0]->frame;
    first->setInputFrameFromDescriptor(
        symbols, access, equal(name, "<init>"), descriptor, maxLocals_);
    first->accept(&table, 0);

    propagate();
    emitFrames();

    if (log) {
      fprintf(log,
              "%d stack map entries, max stack %d, max locals %d\n",
              table.entryCount(),
              maxStack_,
              maxLocals_);
    }
  }

  virtual unsigned maxStack()
  {
    return maxStack_;
  }

  virtual unsigned maxLocals()
  {
    return maxLocals_;
  }

  virtual unsigned blockCount()
  {
    return blockCount_;
  }

  virtual Block* block(unsigned id)
  {
    expect(s, id < blockCount_);
    return blocks[id];
  }

  virtual Block* blockOfLabel(unsigned label)
  {
    expect(s, label < labelBlocks.count and labelBlocks[label]);
    return labelBlocks[label];
  }

  virtual DeadCode* firstDeadCode()
  {
    return deadCode;
  }

  virtual StackMapTable* stackMapTable()
  {
    return &table;
  }

  virtual void dispose()
  {
    if (closeLog) {
      fclose(log);
    }

    System* s = this->s;
    this->~MyMethodFrames();
    s->free(this);
  }

 private:
  Block* newBlock(unsigned offset)
  {
    expect(s, blockCount_ < blocks.count);

    Block* b = new (&zone) Block(
        blockCount_, offset, new (&zone) Frame(&zone, s, blockCount_));
    blocks[blockCount_++] = b;
    last = b;
    return b;
  }

  void addEdge(Block* from, unsigned successor, int label)
  {
    from->edges
        = new (&zone) Edge(AbstractType(), successor, label, from->edges);
  }

  void markJumpTarget(unsigned label)
  {
    if (labelBlocks[label]) {
      labelBlocks[label]->flags |= Block::JumpTarget;
    } else {
      labelFlags[label] |= Block::JumpTarget;
    }
  }

  void aliasLabel(int label, Block* b)
  {
    if (label >= 0) {
      labelBlocks[label] = b;
      b->flags |= labelFlags[label];
    }
  }

  // A label starts a new block unless it is at the offset of the current
  // block or of the last block created, in which case it designates that
  // block.  Synthetic labels (-1) start the block following a conditional
  // jump.
  void visitLabel(int label, unsigned offset)
  {
    if (current) {
      if (offset == current->offset) {
        aliasLabel(label, current);
        return;
      }
    } else if (last and offset == last->offset) {
      aliasLabel(label, last);
      current = last;
      return;
    }

    Block* previous = current;
    Block* b = newBlock(offset);
    aliasLabel(label, b);
    if (previous) {
      addEdge(previous, b->id, -1);
    }
    current = b;
  }

  // Ends the current block with no fall through.  Instructions up to the
  // next label belong to a new block which nothing reaches.
  void endBlock(unsigned endOffset)
  {
    newBlock(endOffset);
    current = 0;
  }

  void buildBlocks()
  {
    visitLabel(-1, 0);

    for (Code::Node* n = code->firstNode(); n; n = n->next) {
      if (n->type == Code::LabelNode) {
        visitLabel(n->label, n->offset);
        continue;
      }

      if (log) {
        debug::printNode(log, n);
        fprintf(log, "\n");
      }

      if (current == 0) {
        continue;
      }

      unsigned endOffset = n->next ? n->next->offset : code->length();
      int arg = n->opcode == new_ ? static_cast<int>(n->offset) : n->operand;
      current->frame->execute(n->opcode, arg, n->symbol, symbols);

      if (isJump(n->opcode)) {
        markJumpTarget(n->label);
        addEdge(current, 0, n->label);
        if (n->opcode == goto_ or n->opcode == goto_w) {
          endBlock(endOffset);
        } else {
          visitLabel(-1, endOffset);
        }
      } else if (n->opcode == tableswitch or n->opcode == lookupswitch) {
        markJumpTarget(n->label);
        addEdge(current, 0, n->label);
        for (unsigned i = 0; i < n->labels.count; ++i) {
          markJumpTarget(n->labels[i]);
          addEdge(current, 0, n->labels[i]);
        }
        endBlock(endOffset);
      } else if (isReturn(n->opcode)) {
        endBlock(endOffset);
      }
    }

    for (unsigned i = 0; i < blockCount_; ++i) {
      for (Edge* e = blocks[i]->edges; e; e = e->next) {
        if (e->label >= 0) {
          Block* target = labelBlocks[e->label];
          expect(s, target != 0);
          e->successor = target->id;
          e->label = -1;
        }
      }
    }
  }

  void addExceptionEdges()
  {
    for (Code::Handler* h = code->firstHandler(); h; h = h->next) {
      AbstractType catchType
          = typeFromInternalName(symbols, h->type ? h->type : ThrowableType);

      Block* handler = labelBlocks[h->handler];
      Block* start = labelBlocks[h->start];
      Block* end = labelBlocks[h->end];
      expect(s, handler and start and end);

      handler->flags |= Block::JumpTarget;
      for (unsigned id = start->id; id < end->id; ++id) {
        Block* b = blocks[id];
        b->edges = new (&zone) Edge(catchType, handler->id, -1, b->edges);
      }
    }

    if (log) {
      for (unsigned i = 0; i < blockCount_; ++i) {
        Block* b = blocks[i];
        fprintf(log, "block %d at %d:", b->id, b->offset);
        for (Edge* e = b->edges; e; e = e->next) {
          fprintf(log, " %d", e->successor);
          if (e->info.assigned()) {
            fprintf(log, "(");
            debug::printAbstractType(log, symbols, e->info);
            fprintf(log, ")");
          }
        }
        fprintf(log, "\n");
      }
    }
  }

  void propagate()
  {
    Slice<unsigned> worklist = Slice<unsigned>::alloc(&zone, blockCount_);
    Slice<bool> queued = Slice<bool>::allocAndSet(&zone, blockCount_, false);
    unsigned size = 0;

    worklist[size++] = 0;
    queued[0] = true;

    while (size) {
      Block* b = blocks[worklist[--size]];
      queued[b->id] = false;
      b->flags |= Block::Reachable;

      if (log) {
        fprintf(log, "visit block %d\n", b->id);
        debug::printFrame(log, symbols, b->frame);
      }

      int blockMaxStack = static_cast<int>(b->frame->inputStackSize())
                          + b->frame->outputStackMax;
      if (blockMaxStack > static_cast<int>(maxStack_)) {
        maxStack_ = blockMaxStack;
      }

      for (Edge* e = b->edges; e; e = e->next) {
        Block* successor = blocks[e->successor];
        bool changed
            = b->frame->merge(symbols, successor->frame, e->info);
        if (changed and not queued[successor->id]) {
          worklist[size++] = successor->id;
          queued[successor->id] = true;
        }
      }
    }
  }

  void emitFrames()
  {
    for (unsigned i = 0; i < blockCount_; ++i) {
      Block* b = blocks[i];
      if (b->jumpTarget() and b->reachable()) {
        b->frame->accept(&table, b->offset);

        if (log) {
          fprintf(log, "frame at %d:\n", b->offset);
          debug::printFrame(log, symbols, b->frame);
        }
      }

      if (not b->reachable()) {
        unsigned endOffset = i + 1 < blockCount_ ? blocks[i + 1]->offset
                                                 : code->length();
        if (endOffset > b->offset) {
          DeadCode* d = new (&zone) DeadCode(b->offset, endOffset, 0);
          if (lastDeadCode) {
            lastDeadCode->next = d;
          } else {
            deadCode = d;
          }
          lastDeadCode = d;

          table.visitFrameStart(b->offset, 0, 1);
          table.visitAbstractType(typeFromInternalName(symbols, ThrowableType));
          table.visitFrameEnd();

          maxStack_ = max(maxStack_, 1u);
          code->removeHandlerRange(b->offset, endOffset);

          if (log) {
            fprintf(log, "dead code from %d to %d\n", b->offset, endOffset);
          }
        }
      }
    }
  }

  System* s;
  SymbolTable* symbols;
  Code* code;
  unsigned access;
  const char* name;
  const char* descriptor;
  FILE* log;
  bool closeLog;
  SystemAllocator allocator;
  Zone zone;
  StackMapTable table;
  Slice<Block*> blocks;
  unsigned blockCount_;
  Slice<Block*> labelBlocks;
  Slice<unsigned> labelFlags;
  Block* current;
  Block* last;
  DeadCode* deadCode;
  DeadCode* lastDeadCode;
  unsigned maxStack_;
  unsigned maxLocals_;
};

FILE* openLog(unsigned propertyCount, const char** properties, bool* close)
{
  *close = false;

  const char* path
      = findProperty(propertyCount, properties, "bytewright.frames.log");
  if (path) {
    FILE* f = fopen(path, "a");
    if (f) {
      *close = true;
      return f;
    }
    fprintf(stderr, "unable to open %s: %s\n", path, strerror(errno));
    return stderr;
  }

  if (DebugFrames
      or findBooleanProperty(
             propertyCount, properties, "bytewright.frames.debug")) {
    return stderr;
  }

  return 0;
}

}  // namespace

namespace bytewright {

MethodFrames* computeFrames(System* s,
                            SymbolTable* symbols,
                            Code* code,
                            unsigned access,
                            const char* name,
                            const char* descriptor,
                            unsigned propertyCount,
                            const char** properties)
{
  validate(code);

  bool closeLog;
  FILE* log = openLog(propertyCount, properties, &closeLog);

  MyMethodFrames* frames
      = new (allocate(s, sizeof(MyMethodFrames))) MyMethodFrames(
          s, symbols, code, access, name, descriptor, log, closeLog);
  frames->compute();
  return frames;
}

}  // namespace bytewright
