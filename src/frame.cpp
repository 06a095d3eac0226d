/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <bytewright/frame.h>
#include <bytewright/descriptor.h>
#include <bytewright/opcodes.h>
#include <bytewright/stack-map.h>

using namespace bytewright::util;

namespace {

const unsigned InitialLocalsCapacity = 10;
const unsigned InitialStackCapacity = 10;
const unsigned InitialInitializationsCapacity = 2;

const char* const RootType = "java/lang/Object";

}  // namespace

namespace bytewright {

AbstractType typeFromApiFormat(SymbolTable* symbols,
                               Code* code,
                               const FrameElement& element)
{
  switch (element.type) {
  case FrameElement::ItemElement:
    return AbstractType::constant(element.value);

  case FrameElement::ClassElement:
    return typeFromInternalName(symbols, element.name);

  case FrameElement::LabelElement:
    if (code->labelBound(element.value)) {
      return AbstractType::uninitialized(symbols->addUninitializedType(
          "", code->labelOffset(element.value)));
    } else {
      return AbstractType::forwardUninitialized(
          symbols->addForwardUninitializedType("", element.value));
    }

  default:
    abort(symbols->s);
  }
}

Frame::Frame(Zone* zone, Aborter* a, unsigned owner)
    : zone(zone),
      a(a),
      owner(owner),
      hasInputLocals(false),
      hasInputStack(false),
      inputLocals(0, 0),
      inputStack(0, 0),
      outputLocals(0, 0),
      outputStack(0, 0),
      outputStackStart(0),
      outputStackTop(0),
      outputStackMax(0),
      initializations(0, 0),
      initializationCount(0)
{
}

void Frame::copyFrom(Frame* other)
{
  hasInputLocals = other->hasInputLocals;
  hasInputStack = other->hasInputStack;
  inputLocals = other->inputLocals.clone(zone, other->inputLocals.count);
  inputStack = other->inputStack.clone(zone, other->inputStack.count);
  outputLocals = other->outputLocals.clone(zone, other->outputLocals.count);
  outputStack = other->outputStack.clone(zone, other->outputStack.count);
  outputStackStart = other->outputStackStart;
  outputStackTop = other->outputStackTop;
  outputStackMax = other->outputStackMax;
  initializations
      = other->initializations.clone(zone, other->initializations.count);
  initializationCount = other->initializationCount;
}

void Frame::setInputFrameFromDescriptor(SymbolTable* symbols,
                                        unsigned access,
                                        bool constructor,
                                        const char* descriptor,
                                        unsigned maxLocals)
{
  inputLocals = Slice<AbstractType>::allocAndSet(
      zone, maxLocals, AbstractType::top());
  inputStack = Slice<AbstractType>(0, 0);
  hasInputLocals = true;
  hasInputStack = true;

  unsigned index = 0;
  if ((access & ACC_STATIC) == 0) {
    expect(a, index < maxLocals);
    if (constructor) {
      inputLocals[index++] = AbstractType::uninitializedThis();
    } else {
      inputLocals[index++]
          = AbstractType::reference(symbols->addType(symbols->className()));
    }
  }

  for (MethodSpecIterator it(a, descriptor); it.hasNext();) {
    AbstractType type = typeFromDescriptor(symbols, it.next());
    expect(a, index + (type.isWide() ? 2 : 1) <= maxLocals);
    inputLocals[index++] = type;
    if (type.isWide()) {
      inputLocals[index++] = AbstractType::top();
    }
  }
}

void Frame::setInputFrameFromApiFormat(SymbolTable* symbols,
                                       Code* code,
                                       unsigned maxLocals,
                                       unsigned numLocal,
                                       const FrameElement* locals,
                                       unsigned numStack,
                                       const FrameElement* stack)
{
  unsigned localSize = 0;
  for (unsigned i = 0; i < numLocal; ++i) {
    localSize += locals[i].isWide() ? 2 : 1;
  }

  inputLocals = Slice<AbstractType>::allocAndSet(
      zone, max(maxLocals, localSize), AbstractType::top());
  hasInputLocals = true;

  unsigned index = 0;
  for (unsigned i = 0; i < numLocal; ++i) {
    inputLocals[index++] = typeFromApiFormat(symbols, code, locals[i]);
    if (locals[i].isWide()) {
      inputLocals[index++] = AbstractType::top();
    }
  }

  unsigned stackSize = 0;
  for (unsigned i = 0; i < numStack; ++i) {
    stackSize += stack[i].isWide() ? 2 : 1;
  }

  inputStack = Slice<AbstractType>::alloc(zone, stackSize);
  hasInputStack = true;

  index = 0;
  for (unsigned i = 0; i < numStack; ++i) {
    inputStack[index++] = typeFromApiFormat(symbols, code, stack[i]);
    if (stack[i].isWide()) {
      inputStack[index++] = AbstractType::top();
    }
  }

  outputStackTop = 0;
  initializationCount = 0;
}

AbstractType Frame::getLocal(unsigned index)
{
  if (index >= outputLocals.count) {
    return AbstractType::local(index);
  } else {
    AbstractType type = outputLocals[index];
    if (not type.assigned()) {
      type = outputLocals[index] = AbstractType::local(index);
    }
    return type;
  }
}

void Frame::setLocal(unsigned index, AbstractType type)
{
  if (index >= outputLocals.count) {
    unsigned capacity = max(index + 1,
                            max(InitialLocalsCapacity, outputLocals.count * 2));
    outputLocals = outputLocals.cloneAndSet(zone, capacity, AbstractType());
  }
  outputLocals[index] = type;
}

void Frame::push(AbstractType type)
{
  if (outputStackTop >= outputStack.count) {
    unsigned capacity = max(outputStackTop + 1,
                            max(InitialStackCapacity, outputStack.count * 2));
    outputStack = outputStack.cloneAndSet(zone, capacity, AbstractType());
  }
  outputStack[outputStackTop++] = type;

  int size = outputStackStart + static_cast<int>(outputStackTop);
  if (size > outputStackMax) {
    outputStackMax = size;
  }
}

void Frame::push(SymbolTable* symbols, const char* descriptor)
{
  if (*descriptor == '(') {
    MethodSpecIterator it(a, descriptor);
    while (it.hasNext()) {
      it.next();
    }
    descriptor = it.returnSpec();
  }

  AbstractType type = typeFromDescriptor(symbols, descriptor);
  if (type.assigned()) {
    push(type);
    if (type.isWide()) {
      push(AbstractType::top());
    }
  }
}

AbstractType Frame::pop()
{
  if (outputStackTop > 0) {
    return outputStack[--outputStackTop];
  } else {
    return AbstractType::stack(-(--outputStackStart));
  }
}

void Frame::pop(unsigned count)
{
  if (outputStackTop >= count) {
    outputStackTop -= count;
  } else {
    outputStackStart -= count - outputStackTop;
    outputStackTop = 0;
  }
}

void Frame::pop(const char* descriptor)
{
  if (*descriptor == '(') {
    pop(argumentsSize(a, descriptor));
  } else if (isWideSpec(descriptor)) {
    pop(2);
  } else {
    pop(1);
  }
}

// A store into "index" splits any long or double held by index - 1.
void Frame::invalidatePreviousLocal(unsigned index)
{
  if (index > 0) {
    AbstractType previous = getLocal(index - 1);
    if (previous.isWide()) {
      setLocal(index - 1, AbstractType::top());
    } else if (previous.isRelative()) {
      setLocal(index - 1, previous.withTopIfWide());
    }
  }
}

void Frame::addInitializedType(AbstractType type)
{
  if (initializationCount >= initializations.count) {
    unsigned capacity = max(initializationCount + 1,
                            max(InitialInitializationsCapacity,
                                initializations.count * 2));
    initializations
        = initializations.cloneAndSet(zone, capacity, AbstractType());
  }
  initializations[initializationCount++] = type;
}

// Returns the initialized type of "type" if it is an uninitialized type
// whose constructor is called in this block, and "type" otherwise.
AbstractType Frame::getInitializedType(SymbolTable* symbols,
                                       AbstractType type)
{
  uint32_t shape = type.raw()
                   & (AbstractType::DimMask | AbstractType::KindMask);
  if (type == AbstractType::uninitializedThis()
      or shape == AbstractType::UninitializedKind
      or shape == AbstractType::ForwardUninitializedKind) {
    for (unsigned i = 0; i < initializationCount; ++i) {
      AbstractType initialized = initializations[i];
      if (initialized.kind() == AbstractType::LocalKind) {
        initialized = inputLocals[initialized.value()].plusDimensions(
            initialized.dimensionBits());
      } else if (initialized.kind() == AbstractType::StackKind) {
        initialized
            = inputStack[inputStack.count - initialized.value()].plusDimensions(
                initialized.dimensionBits());
      }

      if (type == initialized) {
        if (type == AbstractType::uninitializedThis()) {
          return AbstractType::reference(
              symbols->addType(symbols->className()));
        } else {
          return AbstractType::reference(
              symbols->addType(symbols->getType(type.value())->value));
        }
      }
    }
  }
  return type;
}

AbstractType Frame::getConcreteOutputType(AbstractType type, unsigned numStack)
{
  AbstractType concrete;
  if (type.kind() == AbstractType::LocalKind) {
    concrete = inputLocals[type.value()].plusDimensions(type.dimensionBits());
  } else if (type.kind() == AbstractType::StackKind) {
    concrete = inputStack[numStack - type.value()].plusDimensions(
        type.dimensionBits());
  } else {
    return type;
  }

  if (type.topIfWide() and concrete.isWide()) {
    concrete = AbstractType::top();
  }
  return concrete;
}

void Frame::execute(unsigned opcode,
                    int arg,
                    Symbol* argSymbol,
                    SymbolTable* symbols)
{
  AbstractType t1;
  AbstractType t2;
  AbstractType t3;
  AbstractType t4;

  switch (opcode) {
  case nop:
  case ineg:
  case lneg:
  case fneg:
  case dneg:
  case i2b:
  case i2c:
  case i2s:
  case goto_:
  case goto_w:
  case return_:
    break;

  case aconst_null:
    push(AbstractType::null());
    break;

  case iconst_m1:
  case iconst_0:
  case iconst_1:
  case iconst_2:
  case iconst_3:
  case iconst_4:
  case iconst_5:
  case bipush:
  case sipush:
  case iload:
    push(AbstractType::integer());
    break;

  case lconst_0:
  case lconst_1:
  case lload:
    push(AbstractType::long_());
    push(AbstractType::top());
    break;

  case fconst_0:
  case fconst_1:
  case fconst_2:
  case fload:
    push(AbstractType::float_());
    break;

  case dconst_0:
  case dconst_1:
  case dload:
    push(AbstractType::double_());
    push(AbstractType::top());
    break;

  case ldc:
  case ldc_w:
  case ldc2_w:
    switch (argSymbol->tag) {
    case CONSTANT_Integer:
      push(AbstractType::integer());
      break;
    case CONSTANT_Long:
      push(AbstractType::long_());
      push(AbstractType::top());
      break;
    case CONSTANT_Float:
      push(AbstractType::float_());
      break;
    case CONSTANT_Double:
      push(AbstractType::double_());
      push(AbstractType::top());
      break;
    case CONSTANT_Class:
      push(AbstractType::reference(symbols->addType("java/lang/Class")));
      break;
    case CONSTANT_String:
      push(AbstractType::reference(symbols->addType("java/lang/String")));
      break;
    case CONSTANT_MethodType:
      push(AbstractType::reference(
          symbols->addType("java/lang/invoke/MethodType")));
      break;
    case CONSTANT_MethodHandle:
      push(AbstractType::reference(
          symbols->addType("java/lang/invoke/MethodHandle")));
      break;
    case CONSTANT_Dynamic:
      push(symbols, argSymbol->value);
      break;
    default:
      abort(a);
    }
    break;

  case aload:
    push(getLocal(arg));
    break;

  case laload:
  case d2l:
    pop(2);
    push(AbstractType::long_());
    push(AbstractType::top());
    break;

  case daload:
  case l2d:
    pop(2);
    push(AbstractType::double_());
    push(AbstractType::top());
    break;

  case aaload:
    pop(1);
    t1 = pop();
    push(t1 == AbstractType::null() ? t1 : t1.elementOf());
    break;

  case istore:
  case fstore:
  case astore:
    t1 = pop();
    setLocal(arg, t1);
    invalidatePreviousLocal(arg);
    break;

  case lstore:
  case dstore:
    pop(1);
    t1 = pop();
    setLocal(arg, t1);
    setLocal(arg + 1, AbstractType::top());
    invalidatePreviousLocal(arg);
    break;

  case iastore:
  case bastore:
  case castore:
  case sastore:
  case fastore:
  case aastore:
    pop(3);
    break;

  case lastore:
  case dastore:
    pop(4);
    break;

  case bytewright::pop:
  case ifeq:
  case ifne:
  case iflt:
  case ifge:
  case ifgt:
  case ifle:
  case ireturn:
  case freturn:
  case areturn:
  case tableswitch:
  case lookupswitch:
  case athrow:
  case monitorenter:
  case monitorexit:
  case ifnull:
  case ifnonnull:
    pop(1);
    break;

  case pop2:
  case if_icmpeq:
  case if_icmpne:
  case if_icmplt:
  case if_icmpge:
  case if_icmpgt:
  case if_icmple:
  case if_acmpeq:
  case if_acmpne:
  case lreturn:
  case dreturn:
    pop(2);
    break;

  case dup_:
    t1 = pop();
    push(t1);
    push(t1);
    break;

  case dup_x1:
    t1 = pop();
    t2 = pop();
    push(t1);
    push(t2);
    push(t1);
    break;

  case dup_x2:
    t1 = pop();
    t2 = pop();
    t3 = pop();
    push(t1);
    push(t3);
    push(t2);
    push(t1);
    break;

  case dup2_:
    t1 = pop();
    t2 = pop();
    push(t2);
    push(t1);
    push(t2);
    push(t1);
    break;

  case dup2_x1:
    t1 = pop();
    t2 = pop();
    t3 = pop();
    push(t2);
    push(t1);
    push(t3);
    push(t2);
    push(t1);
    break;

  case dup2_x2:
    t1 = pop();
    t2 = pop();
    t3 = pop();
    t4 = pop();
    push(t2);
    push(t1);
    push(t4);
    push(t3);
    push(t2);
    push(t1);
    break;

  case swap:
    t1 = pop();
    t2 = pop();
    push(t1);
    push(t2);
    break;

  case iaload:
  case baload:
  case caload:
  case saload:
  case iadd:
  case isub:
  case imul:
  case idiv:
  case irem:
  case iand:
  case ior:
  case ixor:
  case ishl:
  case ishr:
  case iushr:
  case l2i:
  case d2i:
  case fcmpl:
  case fcmpg:
    pop(2);
    push(AbstractType::integer());
    break;

  case ladd:
  case lsub:
  case lmul:
  case ldiv_:
  case lrem:
  case land:
  case lor:
  case lxor:
    pop(4);
    push(AbstractType::long_());
    push(AbstractType::top());
    break;

  case faload:
  case fadd:
  case fsub:
  case fmul:
  case fdiv:
  case frem:
  case l2f:
  case d2f:
    pop(2);
    push(AbstractType::float_());
    break;

  case dadd:
  case dsub:
  case dmul:
  case ddiv:
  case drem_:
    pop(4);
    push(AbstractType::double_());
    push(AbstractType::top());
    break;

  case lshl:
  case lshr:
  case lushr:
    pop(3);
    push(AbstractType::long_());
    push(AbstractType::top());
    break;

  case iinc:
    setLocal(arg, AbstractType::integer());
    break;

  case i2l:
  case f2l:
    pop(1);
    push(AbstractType::long_());
    push(AbstractType::top());
    break;

  case i2f:
    pop(1);
    push(AbstractType::float_());
    break;

  case i2d:
  case f2d:
    pop(1);
    push(AbstractType::double_());
    push(AbstractType::top());
    break;

  case f2i:
  case arraylength:
  case instanceof:
    pop(1);
    push(AbstractType::integer());
    break;

  case lcmp:
  case dcmpl:
  case dcmpg:
    pop(4);
    push(AbstractType::integer());
    break;

  case getstatic:
    push(symbols, argSymbol->value);
    break;

  case putstatic:
    pop(argSymbol->value);
    break;

  case getfield:
    pop(1);
    push(symbols, argSymbol->value);
    break;

  case putfield:
    pop(argSymbol->value);
    pop();
    break;

  case invokevirtual:
  case invokespecial:
  case invokestatic:
  case invokeinterface:
    pop(argSymbol->value);
    if (opcode != invokestatic) {
      t1 = pop();
      if (opcode == invokespecial and argSymbol->name[0] == '<') {
        addInitializedType(t1);
      }
    }
    push(symbols, argSymbol->value);
    break;

  case invokedynamic:
    pop(argSymbol->value);
    push(symbols, argSymbol->value);
    break;

  case new_:
    push(AbstractType::uninitialized(
        symbols->addUninitializedType(argSymbol->value, arg)));
    break;

  case newarray:
    pop();
    switch (arg) {
    case T_BOOLEAN:
      push(AbstractType::boolean().arrayOf());
      break;
    case T_CHAR:
      push(AbstractType::char_().arrayOf());
      break;
    case T_BYTE:
      push(AbstractType::byte().arrayOf());
      break;
    case T_SHORT:
      push(AbstractType::short_().arrayOf());
      break;
    case T_INT:
      push(AbstractType::integer().arrayOf());
      break;
    case T_FLOAT:
      push(AbstractType::float_().arrayOf());
      break;
    case T_DOUBLE:
      push(AbstractType::double_().arrayOf());
      break;
    case T_LONG:
      push(AbstractType::long_().arrayOf());
      break;
    default:
      abort(a);
    }
    break;

  case anewarray:
    pop();
    if (argSymbol->value[0] == '[') {
      size_t length = strlen(argSymbol->value);
      char* descriptor = static_cast<char*>(zone->allocate(length + 2));
      descriptor[0] = '[';
      memcpy(descriptor + 1, argSymbol->value, length + 1);
      push(symbols, descriptor);
    } else {
      push(AbstractType::reference(symbols->addType(argSymbol->value))
               .arrayOf());
    }
    break;

  case checkcast:
    pop();
    if (argSymbol->value[0] == '[') {
      push(symbols, argSymbol->value);
    } else {
      push(AbstractType::reference(symbols->addType(argSymbol->value)));
    }
    break;

  case multianewarray:
    pop(static_cast<unsigned>(arg));
    push(symbols, argSymbol->value);
    break;

  default:
    // jsr, ret and wide never reach here: they are rejected or folded
    // into the instructions they modify before simulation
    abort(a);
  }
}

bool Frame::merge(SymbolTable* symbols,
                  AbstractType sourceType,
                  Slice<AbstractType> dstTypes,
                  unsigned dstIndex)
{
  AbstractType dstType = dstTypes[dstIndex];
  if (dstType == sourceType) {
    return false;
  }

  AbstractType srcType = sourceType;
  if ((sourceType.raw() & ~AbstractType::DimMask)
      == AbstractType::null().raw()) {
    if (dstType == AbstractType::null()) {
      return false;
    }
    srcType = AbstractType::null();
  }

  if (not dstType.assigned()) {
    dstTypes[dstIndex] = srcType;
    return true;
  }

  const uint32_t Shape = AbstractType::DimMask | AbstractType::KindMask;

  AbstractType mergedType;
  if (dstType.isReferenceLike()) {
    if (srcType == AbstractType::null()) {
      return false;
    } else if ((srcType.raw() & Shape) == (dstType.raw() & Shape)) {
      if (dstType.kind() == AbstractType::ReferenceKind) {
        mergedType = AbstractType::reference(symbols->addMergedType(
                                                 srcType.value(),
                                                 dstType.value()))
                         .plusDimensions(srcType.dimensionBits());
      } else {
        mergedType = AbstractType::reference(symbols->addType(RootType))
                         .plusDimensions(srcType.dimensionBits()
                                         + AbstractType::ElementOf);
      }
    } else if (srcType.isReferenceLike()) {
      uint32_t srcDim = srcType.dimensionBits();
      if (srcDim != 0 and srcType.kind() != AbstractType::ReferenceKind) {
        srcDim += AbstractType::ElementOf;
      }
      uint32_t dstDim = dstType.dimensionBits();
      if (dstDim != 0 and dstType.kind() != AbstractType::ReferenceKind) {
        dstDim += AbstractType::ElementOf;
      }
      mergedType = AbstractType::reference(symbols->addType(RootType))
                       .plusDimensions(min(srcDim, dstDim));
    } else {
      mergedType = AbstractType::top();
    }
  } else if (dstType == AbstractType::null()) {
    mergedType = srcType.isReferenceLike() ? srcType : AbstractType::top();
  } else {
    mergedType = AbstractType::top();
  }

  if (mergedType != dstType) {
    dstTypes[dstIndex] = mergedType;
    return true;
  }
  return false;
}

bool Frame::merge(SymbolTable* symbols, Frame* dst, AbstractType catchType)
{
  bool changed = false;

  unsigned numLocal = inputLocals.count;
  unsigned numStack = inputStack.count;
  if (not dst->hasInputLocals) {
    dst->inputLocals
        = Slice<AbstractType>::allocAndSet(zone, numLocal, AbstractType());
    dst->hasInputLocals = true;
    changed = true;
  }

  for (unsigned i = 0; i < numLocal; ++i) {
    AbstractType concrete;
    if (i < outputLocals.count) {
      AbstractType output = outputLocals[i];
      if (not output.assigned()) {
        concrete = inputLocals[i];
      } else {
        concrete = getConcreteOutputType(output, numStack);
      }
    } else {
      concrete = inputLocals[i];
    }
    if (initializationCount) {
      concrete = getInitializedType(symbols, concrete);
    }
    changed |= merge(symbols, concrete, dst->inputLocals, i);
  }

  if (catchType.assigned()) {
    for (unsigned i = 0; i < numLocal; ++i) {
      changed |= merge(symbols, inputLocals[i], dst->inputLocals, i);
    }
    if (not dst->hasInputStack) {
      dst->inputStack
          = Slice<AbstractType>::allocAndSet(zone, 1, AbstractType());
      dst->hasInputStack = true;
      changed = true;
    }
    changed |= merge(symbols, catchType, dst->inputStack, 0);
    return changed;
  }

  unsigned numInputStack = numStack + outputStackStart;
  if (not dst->hasInputStack) {
    dst->inputStack = Slice<AbstractType>::allocAndSet(
        zone, numInputStack + outputStackTop, AbstractType());
    dst->hasInputStack = true;
    changed = true;
  }

  for (unsigned i = 0; i < numInputStack; ++i) {
    AbstractType concrete = inputStack[i];
    if (initializationCount) {
      concrete = getInitializedType(symbols, concrete);
    }
    changed |= merge(symbols, concrete, dst->inputStack, i);
  }

  for (unsigned i = 0; i < outputStackTop; ++i) {
    AbstractType concrete = getConcreteOutputType(outputStack[i], numStack);
    if (initializationCount) {
      concrete = getInitializedType(symbols, concrete);
    }
    changed |= merge(symbols, concrete, dst->inputStack, numInputStack + i);
  }

  return changed;
}

void Frame::accept(StackMapTable* table, unsigned offset)
{
  unsigned numLocal = 0;
  unsigned numTrailingTop = 0;
  for (unsigned i = 0; i < inputLocals.count;) {
    AbstractType type = inputLocals[i];
    i += type.isWide() ? 2 : 1;
    if (type == AbstractType::top()) {
      ++numTrailingTop;
    } else {
      numLocal += numTrailingTop + 1;
      numTrailingTop = 0;
    }
  }

  unsigned numStack = 0;
  for (unsigned i = 0; i < inputStack.count;) {
    i += inputStack[i].isWide() ? 2 : 1;
    ++numStack;
  }

  table->visitFrameStart(offset, numLocal, numStack);

  for (unsigned i = 0; numLocal > 0; --numLocal) {
    AbstractType type = inputLocals[i];
    i += type.isWide() ? 2 : 1;
    table->visitAbstractType(type);
  }

  for (unsigned i = 0; numStack > 0; --numStack) {
    AbstractType type = inputStack[i];
    i += type.isWide() ? 2 : 1;
    table->visitAbstractType(type);
  }

  table->visitFrameEnd();
}

}  // namespace bytewright
