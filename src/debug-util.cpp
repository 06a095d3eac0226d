/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include "debug-util.h"

namespace {

const char* const OpcodeNames[] = {
    "nop",
    "aconst_null",
    "iconst_m1",
    "iconst_0",
    "iconst_1",
    "iconst_2",
    "iconst_3",
    "iconst_4",
    "iconst_5",
    "lconst_0",
    "lconst_1",
    "fconst_0",
    "fconst_1",
    "fconst_2",
    "dconst_0",
    "dconst_1",
    "bipush",
    "sipush",
    "ldc",
    "ldc_w",
    "ldc2_w",
    "iload",
    "lload",
    "fload",
    "dload",
    "aload",
    "iload_0",
    "iload_1",
    "iload_2",
    "iload_3",
    "lload_0",
    "lload_1",
    "lload_2",
    "lload_3",
    "fload_0",
    "fload_1",
    "fload_2",
    "fload_3",
    "dload_0",
    "dload_1",
    "dload_2",
    "dload_3",
    "aload_0",
    "aload_1",
    "aload_2",
    "aload_3",
    "iaload",
    "laload",
    "faload",
    "daload",
    "aaload",
    "baload",
    "caload",
    "saload",
    "istore",
    "lstore",
    "fstore",
    "dstore",
    "astore",
    "istore_0",
    "istore_1",
    "istore_2",
    "istore_3",
    "lstore_0",
    "lstore_1",
    "lstore_2",
    "lstore_3",
    "fstore_0",
    "fstore_1",
    "fstore_2",
    "fstore_3",
    "dstore_0",
    "dstore_1",
    "dstore_2",
    "dstore_3",
    "astore_0",
    "astore_1",
    "astore_2",
    "astore_3",
    "iastore",
    "lastore",
    "fastore",
    "dastore",
    "aastore",
    "bastore",
    "castore",
    "sastore",
    "pop",
    "pop2",
    "dup",
    "dup_x1",
    "dup_x2",
    "dup2",
    "dup2_x1",
    "dup2_x2",
    "swap",
    "iadd",
    "ladd",
    "fadd",
    "dadd",
    "isub",
    "lsub",
    "fsub",
    "dsub",
    "imul",
    "lmul",
    "fmul",
    "dmul",
    "idiv",
    "ldiv",
    "fdiv",
    "ddiv",
    "irem",
    "lrem",
    "frem",
    "drem",
    "ineg",
    "lneg",
    "fneg",
    "dneg",
    "ishl",
    "lshl",
    "ishr",
    "lshr",
    "iushr",
    "lushr",
    "iand",
    "land",
    "ior",
    "lor",
    "ixor",
    "lxor",
    "iinc",
    "i2l",
    "i2f",
    "i2d",
    "l2i",
    "l2f",
    "l2d",
    "f2i",
    "f2l",
    "f2d",
    "d2i",
    "d2l",
    "d2f",
    "i2b",
    "i2c",
    "i2s",
    "lcmp",
    "fcmpl",
    "fcmpg",
    "dcmpl",
    "dcmpg",
    "ifeq",
    "ifne",
    "iflt",
    "ifge",
    "ifgt",
    "ifle",
    "if_icmpeq",
    "if_icmpne",
    "if_icmplt",
    "if_icmpge",
    "if_icmpgt",
    "if_icmple",
    "if_acmpeq",
    "if_acmpne",
    "goto",
    "jsr",
    "ret",
    "tableswitch",
    "lookupswitch",
    "ireturn",
    "lreturn",
    "freturn",
    "dreturn",
    "areturn",
    "return",
    "getstatic",
    "putstatic",
    "getfield",
    "putfield",
    "invokevirtual",
    "invokespecial",
    "invokestatic",
    "invokeinterface",
    "invokedynamic",
    "new",
    "newarray",
    "anewarray",
    "arraylength",
    "athrow",
    "checkcast",
    "instanceof",
    "monitorenter",
    "monitorexit",
    "wide",
    "multianewarray",
    "ifnull",
    "ifnonnull",
    "goto_w",
    "jsr_w",
};

}  // namespace

namespace bytewright {
namespace debug {

const char* opcodeName(unsigned opcode)
{
  if (opcode < sizeof(OpcodeNames) / sizeof(OpcodeNames[0])) {
    return OpcodeNames[opcode];
  } else {
    return "<unknown>";
  }
}

int printAbstractType(FILE* out, SymbolTable* symbols, AbstractType type)
{
  if (not type.assigned()) {
    return fprintf(out, ".");
  }

  int n = 0;
  int dimensions = type.dimensions();
  if (dimensions < 0) {
    n += fprintf(out, "elementOf%d:", -dimensions);
  } else {
    for (int i = 0; i < dimensions; ++i) {
      n += fprintf(out, "[");
    }
  }

  switch (type.kind()) {
  case AbstractType::ConstantKind:
    switch (type.value()) {
    case AbstractType::TopItem:
      return n + fprintf(out, "T");
    case AbstractType::IntegerItem:
      return n + fprintf(out, "I");
    case AbstractType::FloatItem:
      return n + fprintf(out, "F");
    case AbstractType::DoubleItem:
      return n + fprintf(out, "D");
    case AbstractType::LongItem:
      return n + fprintf(out, "J");
    case AbstractType::NullItem:
      return n + fprintf(out, "null");
    case AbstractType::UninitializedThisItem:
      return n + fprintf(out, "uninitializedThis");
    case AbstractType::BooleanItem:
      return n + fprintf(out, "Z");
    case AbstractType::ByteItem:
      return n + fprintf(out, "B");
    case AbstractType::CharItem:
      return n + fprintf(out, "C");
    case AbstractType::ShortItem:
      return n + fprintf(out, "S");
    default:
      return n + fprintf(out, "constant%d", type.value());
    }

  case AbstractType::ReferenceKind:
    return n + fprintf(
                   out, "L%s;", symbols->getType(type.value())->value);

  case AbstractType::UninitializedKind: {
    Symbol* t = symbols->getType(type.value());
    return n + fprintf(out,
                       "uninitialized(%s@%d)",
                       t->value,
                       static_cast<int>(t->data));
  }

  case AbstractType::ForwardUninitializedKind: {
    Symbol* t = symbols->getType(type.value());
    return n + fprintf(out,
                       "uninitialized(%s@label%d)",
                       t->value,
                       static_cast<int>(t->data));
  }

  case AbstractType::LocalKind:
    return n + fprintf(out,
                       "local%d%s",
                       type.value(),
                       type.topIfWide() ? "?" : "");

  case AbstractType::StackKind:
    return n + fprintf(out,
                       "stack%d%s",
                       type.value(),
                       type.topIfWide() ? "?" : "");

  default:
    return n + fprintf(out, "0x%x", type.raw());
  }
}

int printNode(FILE* out, Code::Node* node)
{
  if (node->type == Code::LabelNode) {
    return fprintf(out, "label%d:", node->label);
  }

  int n = fprintf(out, "%5d: %s", node->offset, opcodeName(node->opcode));

  switch (node->opcode) {
  case bipush:
  case sipush:
  case newarray:
  case iload:
  case lload:
  case fload:
  case dload:
  case aload:
  case istore:
  case lstore:
  case fstore:
  case dstore:
  case astore:
  case ret:
    return n + fprintf(out, " %d", node->operand);

  case iinc:
    return n + fprintf(out, " %d %d", node->operand, node->increment);

  case ifeq:
  case ifne:
  case iflt:
  case ifge:
  case ifgt:
  case ifle:
  case if_icmpeq:
  case if_icmpne:
  case if_icmplt:
  case if_icmpge:
  case if_icmpgt:
  case if_icmple:
  case if_acmpeq:
  case if_acmpne:
  case goto_:
  case goto_w:
  case jsr:
  case jsr_w:
  case ifnull:
  case ifnonnull:
    return n + fprintf(out, " label%d", node->label);

  case tableswitch:
  case lookupswitch:
    n += fprintf(out, " default: label%d", node->label);
    for (unsigned i = 0; i < node->labels.count; ++i) {
      n += fprintf(out, " label%d", node->labels[i]);
    }
    return n;

  case getstatic:
  case putstatic:
  case getfield:
  case putfield:
    return n + fprintf(out,
                       " %s.%s %s",
                       node->symbol->owner,
                       node->symbol->name,
                       node->symbol->value);

  case invokevirtual:
  case invokespecial:
  case invokestatic:
  case invokeinterface:
    return n + fprintf(out,
                       " %s.%s%s",
                       node->symbol->owner,
                       node->symbol->name,
                       node->symbol->value);

  case invokedynamic:
    return n + fprintf(
                   out, " %s%s", node->symbol->name, node->symbol->value);

  case new_:
  case anewarray:
  case checkcast:
  case instanceof:
    return n + fprintf(out, " %s", node->symbol->value);

  case multianewarray:
    return n + fprintf(
                   out, " %s %d", node->symbol->value, node->operand);

  case ldc:
  case ldc_w:
  case ldc2_w:
    return n + fprintf(out, " #%d", node->symbol->index);

  default:
    return n;
  }
}

void printFrame(FILE* out, SymbolTable* symbols, Frame* frame)
{
  fprintf(out, "  locals:");
  for (unsigned i = 0; i < frame->inputLocals.count; ++i) {
    fprintf(out, " ");
    printAbstractType(out, symbols, frame->inputLocals[i]);
  }
  fprintf(out, "\n  stack:");
  for (unsigned i = 0; i < frame->inputStack.count; ++i) {
    fprintf(out, " ");
    printAbstractType(out, symbols, frame->inputStack[i]);
  }
  fprintf(out, "\n");
}

}  // namespace debug
}  // namespace bytewright
