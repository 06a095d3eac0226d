/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_SYMBOL_TABLE_H
#define BYTEWRIGHT_SYMBOL_TABLE_H

#include <bytewright/common.h>
#include <bytewright/opcodes.h>
#include <bytewright/system.h>
#include <bytewright/zone.h>
#include <bytewright/util/slice.h>

namespace bytewright {

// Tags of the entries which live only in the type table, never in the
// constant pool.
const unsigned TypeTag = 128;
const unsigned UninitializedTypeTag = 129;
const unsigned ForwardUninitializedTypeTag = 130;
const unsigned MergedTypeTag = 131;

// An entry of a SymbolTable.  Symbols are immutable once created.
//
// Constant pool entries carry their pool index.  Type table entries
// (TypeTag, UninitializedTypeTag and ForwardUninitializedTypeTag) carry
// their type table index; for uninitialized types "data" is the bytecode
// offset of the "new" instruction, for forward uninitialized types it is the
// id of the label which will be bound to that instruction.  MergedTypeTag
// entries cache addMergedType results: "data" packs both type indices and
// "info" is the index of the common super type.
class Symbol {
 public:
  Symbol(unsigned index,
         unsigned tag,
         const char* owner,
         const char* name,
         const char* value,
         int64_t data,
         uint32_t hash)
      : index(index),
        tag(tag),
        owner(owner),
        name(name),
        value(value),
        data(data),
        info(0),
        hash(hash),
        next(0)
  {
  }

  unsigned index;
  unsigned tag;
  const char* owner;
  const char* name;
  const char* value;
  int64_t data;
  unsigned info;
  uint32_t hash;
  Symbol* next;
};

class SymbolTable {
 public:
  // Answers the common super class of two internal class names.  Without a
  // client every pair of distinct reference types merges to
  // java/lang/Object.
  class Client {
   public:
    virtual const char* commonSuperClass(const char* type1,
                                         const char* type2) = 0;
  };

  SymbolTable(System* s, const char* className);

  ~SymbolTable();

  void setClient(Client* client)
  {
    this->client = client;
  }

  const char* className()
  {
    return className_;
  }

  unsigned constantPoolCount()
  {
    return constantPoolCount_;
  }

  unsigned typeCount()
  {
    return typeCount_;
  }

  Symbol* getType(unsigned typeIndex);

  unsigned getForwardUninitializedLabel(unsigned typeIndex);

  Symbol* addConstantUtf8(const char* value);
  Symbol* addConstantClass(const char* value);
  Symbol* addConstantString(const char* value);
  Symbol* addConstantMethodType(const char* descriptor);
  Symbol* addConstantInteger(int32_t value);
  Symbol* addConstantFloat(float value);
  Symbol* addConstantLong(int64_t value);
  Symbol* addConstantDouble(double value);
  Symbol* addConstantNameAndType(const char* name, const char* descriptor);
  Symbol* addConstantFieldref(const char* owner,
                              const char* name,
                              const char* descriptor);
  Symbol* addConstantMethodref(const char* owner,
                               const char* name,
                               const char* descriptor,
                               bool isInterface);
  Symbol* addConstantMethodHandle(unsigned referenceKind,
                                  const char* owner,
                                  const char* name,
                                  const char* descriptor,
                                  bool isInterface);
  Symbol* addConstantDynamic(const char* name,
                             const char* descriptor,
                             unsigned bootstrapMethodIndex);
  Symbol* addConstantInvokeDynamic(const char* name,
                                   const char* descriptor,
                                   unsigned bootstrapMethodIndex);

  unsigned addType(const char* value);
  unsigned addType(const char* value, unsigned length);
  unsigned addUninitializedType(const char* value, unsigned bytecodeOffset);
  unsigned addForwardUninitializedType(const char* value, unsigned label);
  unsigned addMergedType(unsigned typeIndex1, unsigned typeIndex2);

  System* s;
  SystemAllocator allocator;
  Zone zone;

 private:
  Symbol* get(uint32_t hash);
  Symbol* put(Symbol* entry);
  Symbol* addConstantUtf8Reference(unsigned tag, const char* value);
  Symbol* addConstantMemberReference(unsigned tag,
                                     const char* owner,
                                     const char* name,
                                     const char* descriptor);
  Symbol* addConstantNumber(unsigned tag, int64_t bits, unsigned size);
  Symbol* addConstantDynamicOrInvokeDynamic(unsigned tag,
                                            const char* name,
                                            const char* descriptor,
                                            unsigned bootstrapMethodIndex);
  unsigned addTypeInternal(Symbol* entry);

  Client* client;
  const char* className_;
  util::Slice<Symbol*> entries;
  unsigned entryCount;
  unsigned constantPoolCount_;
  util::Slice<Symbol*> typeTable;
  unsigned typeCount_;
};

}  // namespace bytewright

#endif  // BYTEWRIGHT_SYMBOL_TABLE_H
