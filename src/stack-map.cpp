/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <bytewright/stack-map.h>

using namespace bytewright::util;

namespace bytewright {

StackMapTable::StackMapTable(System* s,
                             Zone* zone,
                             SymbolTable* symbols,
                             Code* code)
    : s(s),
      zone(zone),
      symbols(symbols),
      code(code),
      allocator(s),
      entries(s, &allocator, 256),
      currentIndex(0),
      hasPrevious(false),
      first(0),
      last(0),
      entryCount_(0)
{
}

void StackMapTable::visitFrameStart(unsigned offset,
                                    unsigned numLocal,
                                    unsigned numStack)
{
  current.offset = offset;
  current.numLocal = numLocal;
  current.numStack = numStack;
  current.types = Slice<AbstractType>::alloc(zone, numLocal + numStack);
  currentIndex = 0;
}

void StackMapTable::visitAbstractType(AbstractType type)
{
  assertT(s, currentIndex < current.types.count);
  current.types[currentIndex++] = type;
}

void StackMapTable::visitFrameEnd()
{
  expect(s, currentIndex == current.types.count);

  if (hasPrevious) {
    putFrame();
    ++entryCount_;
  }
  previous = current;
  hasPrevious = true;
}

VerificationType StackMapTable::resolve(AbstractType type)
{
  VerificationType r;

  int dimensions = type.dimensions();
  expect(s, dimensions >= 0);

  if (dimensions == 0) {
    switch (type.kind()) {
    case AbstractType::ConstantKind:
      expect(s, type.value() <= AbstractType::UninitializedItem);
      r.tag = type.value();
      break;

    case AbstractType::ReferenceKind: {
      Symbol* c = symbols->addConstantClass(
          symbols->getType(type.value())->value);
      r.tag = VerificationType::Object;
      r.classIndex = c->index;
      r.className = c->value;
    } break;

    case AbstractType::UninitializedKind:
      r.tag = VerificationType::Uninitialized;
      r.offset = symbols->getType(type.value())->data;
      break;

    case AbstractType::ForwardUninitializedKind: {
      unsigned label = symbols->getForwardUninitializedLabel(type.value());
      expect(s, code->labelBound(label));
      r.tag = VerificationType::Uninitialized;
      r.offset = code->labelOffset(label);
    } break;

    default:
      abort(s);
    }
  } else {
    const char* name = 0;
    char element = 0;
    if (type.kind() == AbstractType::ReferenceKind) {
      name = symbols->getType(type.value())->value;
    } else {
      switch (type.value()) {
      case AbstractType::BooleanItem:
        element = 'Z';
        break;
      case AbstractType::ByteItem:
        element = 'B';
        break;
      case AbstractType::CharItem:
        element = 'C';
        break;
      case AbstractType::ShortItem:
        element = 'S';
        break;
      case AbstractType::IntegerItem:
        element = 'I';
        break;
      case AbstractType::FloatItem:
        element = 'F';
        break;
      case AbstractType::LongItem:
        element = 'J';
        break;
      case AbstractType::DoubleItem:
        element = 'D';
        break;
      default:
        abort(s);
      }
    }

    unsigned length = dimensions + (name ? strlen(name) + 2 : 1);
    char* descriptor = static_cast<char*>(zone->allocate(length + 1));
    char* p = descriptor;
    for (int i = 0; i < dimensions; ++i) {
      *(p++) = '[';
    }
    if (name) {
      *(p++) = 'L';
      memcpy(p, name, strlen(name));
      p += strlen(name);
      *(p++) = ';';
    } else {
      *(p++) = element;
    }
    *p = 0;

    Symbol* c = symbols->addConstantClass(descriptor);
    r.tag = VerificationType::Object;
    r.classIndex = c->index;
    r.className = c->value;
  }

  return r;
}

void StackMapTable::putVerificationTypes(unsigned start,
                                         unsigned end,
                                         Slice<VerificationType> resolved)
{
  for (unsigned i = start; i < end; ++i) {
    VerificationType& v = resolved[i];
    entries.putByte(v.tag);
    if (v.tag == VerificationType::Object) {
      entries.putShort(v.classIndex);
    } else if (v.tag == VerificationType::Uninitialized) {
      entries.putShort(v.offset);
    }
  }
}

void StackMapTable::putFrame()
{
  unsigned numLocal = current.numLocal;
  unsigned numStack = current.numStack;
  unsigned previousNumLocal = previous.numLocal;

  unsigned offsetDelta = entryCount_ == 0
                             ? current.offset
                             : current.offset - previous.offset - 1;
  int numLocalDelta = static_cast<int>(numLocal)
                      - static_cast<int>(previousNumLocal);

  unsigned type = FullFrame;
  if (numStack == 0) {
    switch (numLocalDelta) {
    case -3:
    case -2:
    case -1:
      type = ChopFrame;
      break;
    case 0:
      type = offsetDelta < 64 ? SameFrame : SameFrameExtended;
      break;
    case 1:
    case 2:
    case 3:
      type = AppendFrame;
      break;
    default:
      break;
    }
  } else if (numLocalDelta == 0 and numStack == 1) {
    type = offsetDelta < 63 ? SameLocals1StackItemFrame
                            : SameLocals1StackItemFrameExtended;
  }

  if (type != FullFrame) {
    // the locals the two frames have in common must be identical
    for (unsigned i = 0; i < previousNumLocal and i < numLocal; ++i) {
      if (current.types[i] != previous.types[i]) {
        type = FullFrame;
        break;
      }
    }
  }

  Slice<VerificationType> resolved
      = Slice<VerificationType>::alloc(zone, numLocal + numStack);
  for (unsigned i = 0; i < numLocal + numStack; ++i) {
    resolved[i] = resolve(current.types[i]);
  }

  switch (type) {
  case SameFrame:
    entries.putByte(offsetDelta);
    break;

  case SameLocals1StackItemFrame:
    entries.putByte(SameLocals1StackItemFrame + offsetDelta);
    putVerificationTypes(numLocal, numLocal + 1, resolved);
    break;

  case SameLocals1StackItemFrameExtended:
    entries.putByte(SameLocals1StackItemFrameExtended);
    entries.putShort(offsetDelta);
    putVerificationTypes(numLocal, numLocal + 1, resolved);
    break;

  case SameFrameExtended:
    entries.putByte(SameFrameExtended);
    entries.putShort(offsetDelta);
    break;

  case ChopFrame:
    entries.putByte(SameFrameExtended + numLocalDelta);
    entries.putShort(offsetDelta);
    break;

  case AppendFrame:
    entries.putByte(SameFrameExtended + numLocalDelta);
    entries.putShort(offsetDelta);
    putVerificationTypes(previousNumLocal, numLocal, resolved);
    break;

  default:
    entries.putByte(FullFrame);
    entries.putShort(offsetDelta);
    entries.putShort(numLocal);
    putVerificationTypes(0, numLocal, resolved);
    entries.putShort(numStack);
    putVerificationTypes(numLocal, numLocal + numStack, resolved);
    break;
  }

  Entry* e = new (zone) Entry(current.offset, type);
  e->locals = Slice<VerificationType>(resolved.begin(), numLocal);
  e->stack = Slice<VerificationType>(resolved.begin() + numLocal, numStack);
  if (last) {
    last->next = e;
  } else {
    first = e;
  }
  last = e;
}

void StackMapTable::write(ByteVector* out)
{
  out->putShort(entryCount_);
  if (entries.length()) {
    out->putByteArray(entries.begin(), entries.length());
  }
}

}  // namespace bytewright
