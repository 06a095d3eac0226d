/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <bytewright/code.h>
#include <bytewright/errors.h>

using namespace bytewright::util;

namespace {

const unsigned InitialLabelCapacity = 16;

unsigned switchPadding(unsigned offset)
{
  return (4 - ((offset + 1) & 3)) & 3;
}

bool isWideLocal(unsigned opcode)
{
  switch (opcode) {
  case bytewright::lload:
  case bytewright::dload:
  case bytewright::lstore:
  case bytewright::dstore:
    return true;

  default:
    return false;
  }
}

}  // namespace

namespace bytewright {

Code::Code(System* s, SymbolTable* symbols)
    : s(s),
      symbols(symbols),
      allocator(s),
      zone(&allocator, LikelyPageSizeInBytes),
      first(0),
      last(0),
      handlers(0),
      labels(Slice<Label>::alloc(&zone, InitialLabelCapacity)),
      labelCount_(0),
      length_(0),
      maxLocals_(0),
      instructionCount_(0)
{
}

unsigned Code::newLabel()
{
  if (labelCount_ == labels.count) {
    labels = labels.clone(&zone, labels.count * 2);
  }

  Label* l = &labels[labelCount_];
  l->bound = false;
  l->offset = 0;
  return labelCount_++;
}

void Code::bind(unsigned label)
{
  expect(s, label < labelCount_);

  Label* l = &labels[label];
  if (l->bound) {
    throw UnsupportedInput("label bound twice", instructionCount_, -1);
  }

  l->bound = true;
  l->offset = length_;

  Node* n = new (&zone) Node(LabelNode, instructionCount_, nop, length_);
  n->label = label;

  if (last) {
    last->next = n;
  } else {
    first = n;
  }
  last = n;
}

bool Code::labelBound(unsigned label)
{
  expect(s, label < labelCount_);
  return labels[label].bound;
}

unsigned Code::labelOffset(unsigned label)
{
  expect(s, labelBound(label));
  return labels[label].offset;
}

Code::Node* Code::append(unsigned opcode, unsigned size)
{
  Node* n = new (&zone)
      Node(InstructionNode, instructionCount_++, opcode, length_);
  length_ += size;

  if (last) {
    last->next = n;
  } else {
    first = n;
  }
  last = n;

  return n;
}

void Code::useLocal(unsigned var, unsigned size)
{
  if (var + size > maxLocals_) {
    maxLocals_ = var + size;
  }
}

void Code::insn(unsigned opcode)
{
  append(opcode, 1);
}

void Code::intInsn(unsigned opcode, int operand)
{
  switch (opcode) {
  case bipush:
  case newarray:
    append(opcode, 2)->operand = operand;
    break;

  case sipush:
    append(opcode, 3)->operand = operand;
    break;

  default:
    abort(s);
  }
}

void Code::varInsn(unsigned opcode, unsigned var)
{
  unsigned size;
  if (var < 4 and opcode != ret) {
    size = 1;
  } else if (var < 256) {
    size = 2;
  } else {
    size = 4;
  }

  append(opcode, size)->operand = var;
  useLocal(var, isWideLocal(opcode) ? 2 : 1);
}

void Code::typeInsn(unsigned opcode, const char* type)
{
  append(opcode, 3)->symbol = symbols->addConstantClass(type);
}

void Code::fieldInsn(unsigned opcode,
                     const char* owner,
                     const char* name,
                     const char* descriptor)
{
  append(opcode, 3)->symbol
      = symbols->addConstantFieldref(owner, name, descriptor);
}

void Code::methodInsn(unsigned opcode,
                      const char* owner,
                      const char* name,
                      const char* descriptor,
                      bool isInterface)
{
  append(opcode, opcode == invokeinterface ? 5 : 3)->symbol
      = symbols->addConstantMethodref(owner, name, descriptor, isInterface);
}

void Code::invokeDynamicInsn(const char* name,
                             const char* descriptor,
                             unsigned bootstrapMethodIndex)
{
  append(invokedynamic, 5)->symbol = symbols->addConstantInvokeDynamic(
      name, descriptor, bootstrapMethodIndex);
}

void Code::jumpInsn(unsigned opcode, unsigned label)
{
  expect(s, label < labelCount_);
  append(opcode, opcode == goto_w or opcode == jsr_w ? 5 : 3)->label = label;
}

void Code::ldcInsn(Symbol* constant)
{
  Node* n;
  if (constant->tag == CONSTANT_Long or constant->tag == CONSTANT_Double) {
    n = append(ldc2_w, 3);
  } else if (constant->index < 256) {
    n = append(ldc, 2);
  } else {
    n = append(ldc_w, 3);
  }
  n->symbol = constant;
}

void Code::iincInsn(unsigned var, int increment)
{
  Node* n;
  if (var > 255 or increment > 127 or increment < -128) {
    n = append(iinc, 6);
  } else {
    n = append(iinc, 3);
  }
  n->operand = var;
  n->increment = increment;
  useLocal(var, 1);
}

void Code::tableSwitchInsn(int low,
                           int high,
                           unsigned defaultLabel,
                           const unsigned* targets)
{
  expect(s, high >= low);

  unsigned count = high - low + 1;
  Node* n = append(tableswitch,
                   1 + switchPadding(length_) + 12 + (4 * count));
  n->operand = low;
  n->label = defaultLabel;
  n->labels = Slice<unsigned>::alloc(&zone, count);
  for (unsigned i = 0; i < count; ++i) {
    expect(s, targets[i] < labelCount_);
    n->labels[i] = targets[i];
  }
}

void Code::lookupSwitchInsn(unsigned defaultLabel,
                            unsigned count,
                            const int* keys UNUSED,
                            const unsigned* targets)
{
  Node* n = append(lookupswitch,
                   1 + switchPadding(length_) + 8 + (8 * count));
  n->label = defaultLabel;
  n->labels = Slice<unsigned>::alloc(&zone, count);
  for (unsigned i = 0; i < count; ++i) {
    expect(s, targets[i] < labelCount_);
    n->labels[i] = targets[i];
  }
}

void Code::multiANewArrayInsn(const char* descriptor, unsigned dimensions)
{
  Node* n = append(multianewarray, 4);
  n->symbol = symbols->addConstantClass(descriptor);
  n->operand = dimensions;
}

void Code::tryCatchBlock(unsigned start,
                         unsigned end,
                         unsigned handler,
                         const char* type)
{
  expect(s, start < labelCount_ and end < labelCount_
                and handler < labelCount_);

  Handler* h = new (&zone)
      Handler(start, end, handler, type ? zone.copy(type) : 0);

  Handler** p = &handlers;
  while (*p) {
    p = &((*p)->next);
  }
  *p = h;
}

void Code::sortTryCatchBlocks()
{
  for (Handler* h = handlers; h; h = h->next) {
    if (not (labels[h->start].bound and labels[h->end].bound)) {
      throw UnsupportedInput(
          "exception handler range is not bound", instructionCount_, -1);
    }
  }

  // stable insertion sort by range length
  Handler* sorted = 0;
  for (Handler* h = handlers; h;) {
    Handler* next = h->next;
    unsigned length = labels[h->end].offset - labels[h->start].offset;

    Handler** p = &sorted;
    while (*p and labels[(*p)->end].offset - labels[(*p)->start].offset
                      <= length) {
      p = &((*p)->next);
    }
    h->next = *p;
    *p = h;

    h = next;
  }
  handlers = sorted;
}

void Code::removeHandlerRange(unsigned start, unsigned end)
{
  expect(s, start < end);

  for (Handler** p = &handlers; *p;) {
    Handler* h = *p;
    expect(s, labels[h->start].bound and labels[h->end].bound);

    unsigned handlerStart = labels[h->start].offset;
    unsigned handlerEnd = labels[h->end].offset;

    if (start >= handlerEnd or end <= handlerStart) {
      p = &(h->next);
    } else if (start <= handlerStart) {
      if (end >= handlerEnd) {
        *p = h->next;
      } else {
        h->start = labelAt(end);
        p = &(h->next);
      }
    } else if (end >= handlerEnd) {
      h->end = labelAt(start);
      p = &(h->next);
    } else {
      Handler* tail
          = new (&zone) Handler(labelAt(end), h->end, h->handler, h->type);
      tail->next = h->next;
      h->end = labelAt(start);
      h->next = tail;
      p = &(tail->next);
    }
  }
}

// Returns a label bound at "offset", creating one if none is.  A created
// label has no node in the instruction list.
unsigned Code::labelAt(unsigned offset)
{
  for (unsigned i = 0; i < labelCount_; ++i) {
    if (labels[i].bound and labels[i].offset == offset) {
      return i;
    }
  }

  unsigned label = newLabel();
  labels[label].bound = true;
  labels[label].offset = offset;
  return label;
}

}  // namespace bytewright
