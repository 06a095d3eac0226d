/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <bytewright/abstract-type.h>
#include <bytewright/symbol-table.h>

using namespace bytewright::util;

namespace bytewright {

const unsigned AbstractType::DimShift;
const unsigned AbstractType::KindShift;
const unsigned AbstractType::FlagsShift;
const uint32_t AbstractType::DimMask;
const uint32_t AbstractType::KindMask;
const uint32_t AbstractType::FlagsMask;
const uint32_t AbstractType::ValueMask;
const uint32_t AbstractType::ArrayOf;
const uint32_t AbstractType::ElementOf;
const uint32_t AbstractType::ConstantKind;
const uint32_t AbstractType::ReferenceKind;
const uint32_t AbstractType::UninitializedKind;
const uint32_t AbstractType::ForwardUninitializedKind;
const uint32_t AbstractType::LocalKind;
const uint32_t AbstractType::StackKind;
const uint32_t AbstractType::TopIfWideFlag;

namespace {

AbstractType referenceFromDescriptor(SymbolTable* symbols, const char* spec)
{
  const char* end = spec + 1;
  while (*end and *end != ';')
    ++end;
  expect(symbols->s, *end == ';');

  return AbstractType::reference(symbols->addType(spec + 1, end - spec - 1));
}

}  // namespace

AbstractType typeFromDescriptor(SymbolTable* symbols, const char* descriptor)
{
  switch (*descriptor) {
  case 'V':
    return AbstractType();

  case 'Z':
  case 'C':
  case 'B':
  case 'S':
  case 'I':
    return AbstractType::integer();

  case 'F':
    return AbstractType::float_();

  case 'J':
    return AbstractType::long_();

  case 'D':
    return AbstractType::double_();

  case 'L':
    return referenceFromDescriptor(symbols, descriptor);

  case '[': {
    const char* element = descriptor + 1;
    while (*element == '[')
      ++element;

    AbstractType type;
    switch (*element) {
    case 'Z':
      type = AbstractType::boolean();
      break;
    case 'C':
      type = AbstractType::char_();
      break;
    case 'B':
      type = AbstractType::byte();
      break;
    case 'S':
      type = AbstractType::short_();
      break;
    case 'I':
      type = AbstractType::integer();
      break;
    case 'F':
      type = AbstractType::float_();
      break;
    case 'J':
      type = AbstractType::long_();
      break;
    case 'D':
      type = AbstractType::double_();
      break;
    case 'L':
      type = referenceFromDescriptor(symbols, element);
      break;
    default:
      abort(symbols->s);
    }

    unsigned dimensions = element - descriptor;
    expect(symbols->s, dimensions < 32);
    return type.plusDimensions(dimensions << AbstractType::DimShift);
  }

  default:
    abort(symbols->s);
  }
}

AbstractType typeFromInternalName(SymbolTable* symbols,
                                  const char* internalName)
{
  if (*internalName == '[') {
    return typeFromDescriptor(symbols, internalName);
  } else {
    return AbstractType::reference(symbols->addType(internalName));
  }
}

}  // namespace bytewright
