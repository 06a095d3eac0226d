/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_ABSTRACT_TYPE_H
#define BYTEWRIGHT_ABSTRACT_TYPE_H

#include <bytewright/common.h>

namespace bytewright {

class SymbolTable;

// The type of a local variable or operand stack slot during frame
// computation, packed in 32 bits:
//
//   DIM (6 bits, signed) | KIND (4 bits) | FLAGS (2 bits) | VALUE (20 bits)
//
// DIM is the number of array dimensions, relative to the type of another
// slot for the Local and Stack kinds (and so possibly negative).  VALUE is a
// Item for the Constant kind, a type table index for the Reference,
// Uninitialized and ForwardUninitialized kinds, a local variable index for
// the Local kind and an offset from the top of the input stack for the Stack
// kind.  The all-zero value means "not assigned yet".
class AbstractType {
 public:
  static const unsigned DimShift = 26;
  static const unsigned KindShift = 22;
  static const unsigned FlagsShift = 20;

  static const uint32_t DimMask = 0xFC000000;
  static const uint32_t KindMask = 0x03C00000;
  static const uint32_t FlagsMask = 0x00300000;
  static const uint32_t ValueMask = 0x000FFFFF;

  static const uint32_t ArrayOf = 1u << DimShift;
  static const uint32_t ElementOf = 0xFC000000;

  static const uint32_t ConstantKind = 1u << KindShift;
  static const uint32_t ReferenceKind = 2u << KindShift;
  static const uint32_t UninitializedKind = 3u << KindShift;
  static const uint32_t ForwardUninitializedKind = 4u << KindShift;
  static const uint32_t LocalKind = 5u << KindShift;
  static const uint32_t StackKind = 6u << KindShift;

  // For Local and Stack kinds: resolve to Top if the referenced slot turns
  // out to hold a long or a double.
  static const uint32_t TopIfWideFlag = 1u << FlagsShift;

  // Values of the Constant kind.  The first nine match the verification
  // type tags of the StackMapTable attribute; the last four appear only as
  // array element types.
  enum Item {
    TopItem = 0,
    IntegerItem = 1,
    FloatItem = 2,
    DoubleItem = 3,
    LongItem = 4,
    NullItem = 5,
    UninitializedThisItem = 6,
    ObjectItem = 7,
    UninitializedItem = 8,
    BooleanItem = 9,
    ByteItem = 10,
    CharItem = 11,
    ShortItem = 12
  };

  AbstractType() : bits(0)
  {
  }

  explicit AbstractType(uint32_t bits) : bits(bits)
  {
  }

  static AbstractType constant(unsigned item)
  {
    return AbstractType(ConstantKind | item);
  }

  static AbstractType top()
  {
    return constant(TopItem);
  }

  static AbstractType integer()
  {
    return constant(IntegerItem);
  }

  static AbstractType float_()
  {
    return constant(FloatItem);
  }

  static AbstractType double_()
  {
    return constant(DoubleItem);
  }

  static AbstractType long_()
  {
    return constant(LongItem);
  }

  static AbstractType null()
  {
    return constant(NullItem);
  }

  static AbstractType uninitializedThis()
  {
    return constant(UninitializedThisItem);
  }

  static AbstractType boolean()
  {
    return constant(BooleanItem);
  }

  static AbstractType byte()
  {
    return constant(ByteItem);
  }

  static AbstractType char_()
  {
    return constant(CharItem);
  }

  static AbstractType short_()
  {
    return constant(ShortItem);
  }

  static AbstractType reference(unsigned typeIndex)
  {
    return AbstractType(ReferenceKind | typeIndex);
  }

  static AbstractType uninitialized(unsigned typeIndex)
  {
    return AbstractType(UninitializedKind | typeIndex);
  }

  static AbstractType forwardUninitialized(unsigned typeIndex)
  {
    return AbstractType(ForwardUninitializedKind | typeIndex);
  }

  static AbstractType local(unsigned index)
  {
    return AbstractType(LocalKind | index);
  }

  static AbstractType stack(unsigned offset)
  {
    return AbstractType(StackKind | offset);
  }

  uint32_t raw() const
  {
    return bits;
  }

  uint32_t kind() const
  {
    return bits & KindMask;
  }

  uint32_t dimensionBits() const
  {
    return bits & DimMask;
  }

  int dimensions() const
  {
    return static_cast<int32_t>(bits) >> DimShift;
  }

  unsigned value() const
  {
    return bits & ValueMask;
  }

  bool assigned() const
  {
    return bits != 0;
  }

  bool topIfWide() const
  {
    return (bits & TopIfWideFlag) != 0;
  }

  bool isWide() const
  {
    return *this == long_() or *this == double_();
  }

  // True for object references and arrays, including arrays of primitives.
  bool isReferenceLike() const
  {
    return dimensionBits() != 0 or kind() == ReferenceKind;
  }

  bool isRelative() const
  {
    return kind() == LocalKind or kind() == StackKind;
  }

  AbstractType arrayOf() const
  {
    return AbstractType(bits + ArrayOf);
  }

  AbstractType elementOf() const
  {
    return AbstractType(bits + ElementOf);
  }

  // Adds the array dimensions of a relative type to the type it refers to.
  AbstractType plusDimensions(uint32_t dimensionBits) const
  {
    return AbstractType(bits + dimensionBits);
  }

  AbstractType withTopIfWide() const
  {
    return AbstractType(bits | TopIfWideFlag);
  }

  bool operator==(const AbstractType& o) const
  {
    return bits == o.bits;
  }

  bool operator!=(const AbstractType& o) const
  {
    return bits != o.bits;
  }

 private:
  uint32_t bits;
};

// Abstract type of a field descriptor, or of the return type of a method
// descriptor when given the descriptor from its ')'.  Returns the unassigned
// type for 'V'.  Booleans, bytes, chars and shorts are integers unless they
// are array elements.
AbstractType typeFromDescriptor(SymbolTable* symbols, const char* descriptor);

// Abstract type of an internal class name or array descriptor.
AbstractType typeFromInternalName(SymbolTable* symbols,
                                  const char* internalName);

}  // namespace bytewright

#endif  // BYTEWRIGHT_ABSTRACT_TYPE_H
