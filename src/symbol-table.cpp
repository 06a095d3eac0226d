/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <bytewright/symbol-table.h>
#include <bytewright/util/hash.h>

using namespace bytewright::util;

namespace {

const bool DebugSymbols = false;

const unsigned InitialEntryCapacity = 256;
const unsigned InitialTypeCapacity = 16;

const char* const RootType = "java/lang/Object";

uint32_t hashOf(unsigned tag, const char* value)
{
  return 0x7FFFFFFF & (tag + hash(value));
}

uint32_t hashOf(unsigned tag, const char* value, uint32_t data)
{
  return 0x7FFFFFFF & (tag + hash(value) + data);
}

uint32_t hashOf(unsigned tag, const char* value1, const char* value2)
{
  return 0x7FFFFFFF & (tag + hash(value1) * hash(value2));
}

uint32_t hashOf(unsigned tag,
                const char* value1,
                const char* value2,
                uint32_t data)
{
  return 0x7FFFFFFF & (tag + hash(value1) * hash(value2) * (data + 1));
}

uint32_t hashOf(unsigned tag,
                const char* value1,
                const char* value2,
                const char* value3)
{
  return 0x7FFFFFFF & (tag + hash(value1) * hash(value2) * hash(value3));
}

uint32_t hashOf(unsigned tag,
                const char* value1,
                const char* value2,
                const char* value3,
                uint32_t data)
{
  return 0x7FFFFFFF
         & (tag + hash(value1) * hash(value2) * hash(value3) * (data + 1));
}

bool same(const char* a, const char* b)
{
  return a == b or (a and b and bytewright::equal(a, b));
}

}  // namespace

namespace bytewright {

SymbolTable::SymbolTable(System* s, const char* className)
    : s(s),
      allocator(s),
      zone(&allocator, LikelyPageSizeInBytes),
      client(0),
      className_(zone.copy(className)),
      entries(Slice<Symbol*>::allocAndSet(&zone, InitialEntryCapacity, 0)),
      entryCount(0),
      constantPoolCount_(1),
      typeTable(Slice<Symbol*>::allocAndSet(&zone, InitialTypeCapacity, 0)),
      typeCount_(0)
{
}

SymbolTable::~SymbolTable()
{
  zone.dispose();
}

Symbol* SymbolTable::getType(unsigned typeIndex)
{
  expect(s, typeIndex < typeCount_);
  return typeTable[typeIndex];
}

unsigned SymbolTable::getForwardUninitializedLabel(unsigned typeIndex)
{
  Symbol* type = getType(typeIndex);
  expect(s, type->tag == ForwardUninitializedTypeTag);
  return type->data;
}

Symbol* SymbolTable::get(uint32_t hash)
{
  return entries[hash % entries.count];
}

Symbol* SymbolTable::put(Symbol* entry)
{
  if (entryCount > (entries.count * 3) / 4) {
    unsigned newCapacity = entries.count * 2 + 1;
    Slice<Symbol*> newEntries
        = Slice<Symbol*>::allocAndSet(&zone, newCapacity, 0);
    for (unsigned i = 0; i < entries.count; ++i) {
      for (Symbol* e = entries[i]; e;) {
        Symbol* next = e->next;
        unsigned index = e->hash % newCapacity;
        e->next = newEntries[index];
        newEntries[index] = e;
        e = next;
      }
    }
    entries = newEntries;
  }

  ++entryCount;
  unsigned index = entry->hash % entries.count;
  entry->next = entries[index];
  entries[index] = entry;
  return entry;
}

Symbol* SymbolTable::addConstantUtf8(const char* value)
{
  uint32_t hash = hashOf(CONSTANT_Utf8, value);
  for (Symbol* e = get(hash); e; e = e->next) {
    if (e->tag == CONSTANT_Utf8 and e->hash == hash and same(e->value, value)) {
      return e;
    }
  }

  return put(new (&zone) Symbol(constantPoolCount_++,
                                CONSTANT_Utf8,
                                0,
                                0,
                                zone.copy(value),
                                0,
                                hash));
}

Symbol* SymbolTable::addConstantUtf8Reference(unsigned tag, const char* value)
{
  uint32_t hash = hashOf(tag, value);
  for (Symbol* e = get(hash); e; e = e->next) {
    if (e->tag == tag and e->hash == hash and same(e->value, value)) {
      return e;
    }
  }

  addConstantUtf8(value);
  return put(new (&zone) Symbol(
      constantPoolCount_++, tag, 0, 0, zone.copy(value), 0, hash));
}

Symbol* SymbolTable::addConstantClass(const char* value)
{
  return addConstantUtf8Reference(CONSTANT_Class, value);
}

Symbol* SymbolTable::addConstantString(const char* value)
{
  return addConstantUtf8Reference(CONSTANT_String, value);
}

Symbol* SymbolTable::addConstantMethodType(const char* descriptor)
{
  return addConstantUtf8Reference(CONSTANT_MethodType, descriptor);
}

Symbol* SymbolTable::addConstantNumber(unsigned tag,
                                       int64_t bits,
                                       unsigned size)
{
  uint32_t hash = 0x7FFFFFFF & (tag + util::hash(static_cast<uint64_t>(bits)));
  for (Symbol* e = get(hash); e; e = e->next) {
    if (e->tag == tag and e->hash == hash and e->data == bits) {
      return e;
    }
  }

  unsigned index = constantPoolCount_;
  constantPoolCount_ += size;
  return put(new (&zone) Symbol(index, tag, 0, 0, 0, bits, hash));
}

Symbol* SymbolTable::addConstantInteger(int32_t value)
{
  return addConstantNumber(CONSTANT_Integer, value, 1);
}

Symbol* SymbolTable::addConstantFloat(float value)
{
  int32_t bits;
  memcpy(&bits, &value, 4);
  return addConstantNumber(CONSTANT_Float, bits, 1);
}

Symbol* SymbolTable::addConstantLong(int64_t value)
{
  return addConstantNumber(CONSTANT_Long, value, 2);
}

Symbol* SymbolTable::addConstantDouble(double value)
{
  int64_t bits;
  memcpy(&bits, &value, 8);
  return addConstantNumber(CONSTANT_Double, bits, 2);
}

Symbol* SymbolTable::addConstantNameAndType(const char* name,
                                            const char* descriptor)
{
  uint32_t hash = hashOf(CONSTANT_NameAndType, name, descriptor);
  for (Symbol* e = get(hash); e; e = e->next) {
    if (e->tag == CONSTANT_NameAndType and e->hash == hash
        and same(e->name, name) and same(e->value, descriptor)) {
      return e;
    }
  }

  addConstantUtf8(name);
  addConstantUtf8(descriptor);
  return put(new (&zone) Symbol(constantPoolCount_++,
                                CONSTANT_NameAndType,
                                0,
                                zone.copy(name),
                                zone.copy(descriptor),
                                0,
                                hash));
}

Symbol* SymbolTable::addConstantMemberReference(unsigned tag,
                                                const char* owner,
                                                const char* name,
                                                const char* descriptor)
{
  uint32_t hash = hashOf(tag, owner, name, descriptor);
  for (Symbol* e = get(hash); e; e = e->next) {
    if (e->tag == tag and e->hash == hash and same(e->owner, owner)
        and same(e->name, name) and same(e->value, descriptor)) {
      return e;
    }
  }

  addConstantClass(owner);
  addConstantNameAndType(name, descriptor);
  return put(new (&zone) Symbol(constantPoolCount_++,
                                tag,
                                zone.copy(owner),
                                zone.copy(name),
                                zone.copy(descriptor),
                                0,
                                hash));
}

Symbol* SymbolTable::addConstantFieldref(const char* owner,
                                         const char* name,
                                         const char* descriptor)
{
  return addConstantMemberReference(
      CONSTANT_Fieldref, owner, name, descriptor);
}

Symbol* SymbolTable::addConstantMethodref(const char* owner,
                                          const char* name,
                                          const char* descriptor,
                                          bool isInterface)
{
  return addConstantMemberReference(
      isInterface ? CONSTANT_InterfaceMethodref : CONSTANT_Methodref,
      owner,
      name,
      descriptor);
}

Symbol* SymbolTable::addConstantMethodHandle(unsigned referenceKind,
                                             const char* owner,
                                             const char* name,
                                             const char* descriptor,
                                             bool isInterface)
{
  expect(s,
         referenceKind >= REF_getField
         and referenceKind <= REF_invokeInterface);

  uint32_t hash = hashOf(
      CONSTANT_MethodHandle, owner, name, descriptor, referenceKind);
  for (Symbol* e = get(hash); e; e = e->next) {
    if (e->tag == CONSTANT_MethodHandle and e->hash == hash
        and e->data == referenceKind and same(e->owner, owner)
        and same(e->name, name) and same(e->value, descriptor)) {
      return e;
    }
  }

  if (referenceKind <= REF_putStatic) {
    addConstantFieldref(owner, name, descriptor);
  } else {
    addConstantMethodref(owner, name, descriptor, isInterface);
  }

  return put(new (&zone) Symbol(constantPoolCount_++,
                                CONSTANT_MethodHandle,
                                zone.copy(owner),
                                zone.copy(name),
                                zone.copy(descriptor),
                                referenceKind,
                                hash));
}

Symbol* SymbolTable::addConstantDynamicOrInvokeDynamic(
    unsigned tag,
    const char* name,
    const char* descriptor,
    unsigned bootstrapMethodIndex)
{
  uint32_t hash = hashOf(tag, name, descriptor, bootstrapMethodIndex);
  for (Symbol* e = get(hash); e; e = e->next) {
    if (e->tag == tag and e->hash == hash and e->data == bootstrapMethodIndex
        and same(e->name, name) and same(e->value, descriptor)) {
      return e;
    }
  }

  addConstantNameAndType(name, descriptor);
  return put(new (&zone) Symbol(constantPoolCount_++,
                                tag,
                                0,
                                zone.copy(name),
                                zone.copy(descriptor),
                                bootstrapMethodIndex,
                                hash));
}

Symbol* SymbolTable::addConstantDynamic(const char* name,
                                        const char* descriptor,
                                        unsigned bootstrapMethodIndex)
{
  return addConstantDynamicOrInvokeDynamic(
      CONSTANT_Dynamic, name, descriptor, bootstrapMethodIndex);
}

Symbol* SymbolTable::addConstantInvokeDynamic(const char* name,
                                              const char* descriptor,
                                              unsigned bootstrapMethodIndex)
{
  return addConstantDynamicOrInvokeDynamic(
      CONSTANT_InvokeDynamic, name, descriptor, bootstrapMethodIndex);
}

unsigned SymbolTable::addTypeInternal(Symbol* entry)
{
  if (typeCount_ == typeTable.count) {
    typeTable = typeTable.cloneAndSet(&zone, typeTable.count * 2, 0);
  }
  typeTable[typeCount_++] = entry;

  if (DebugSymbols) {
    fprintf(stderr,
            "type %d: tag %d value %s data %d\n",
            entry->index,
            entry->tag,
            entry->value,
            static_cast<int>(entry->data));
  }

  return put(entry)->index;
}

unsigned SymbolTable::addType(const char* value)
{
  return addType(value, strlen(value));
}

unsigned SymbolTable::addType(const char* value, unsigned length)
{
  uint32_t hash = 0x7FFFFFFF
                  & (TypeTag
                     + util::hash(Slice<const uint8_t>(
                           reinterpret_cast<const uint8_t*>(value), length)));
  for (Symbol* e = get(hash); e; e = e->next) {
    if (e->tag == TypeTag and e->hash == hash
        and strncmp(e->value, value, length) == 0 and e->value[length] == 0) {
      return e->index;
    }
  }

  char* copy = static_cast<char*>(zone.allocate(length + 1));
  memcpy(copy, value, length);
  copy[length] = 0;

  return addTypeInternal(
      new (&zone) Symbol(typeCount_, TypeTag, 0, 0, copy, 0, hash));
}

unsigned SymbolTable::addUninitializedType(const char* value,
                                           unsigned bytecodeOffset)
{
  uint32_t hash = hashOf(UninitializedTypeTag, value, bytecodeOffset);
  for (Symbol* e = get(hash); e; e = e->next) {
    if (e->tag == UninitializedTypeTag and e->hash == hash
        and e->data == bytecodeOffset and same(e->value, value)) {
      return e->index;
    }
  }

  return addTypeInternal(new (&zone) Symbol(typeCount_,
                                            UninitializedTypeTag,
                                            0,
                                            0,
                                            zone.copy(value),
                                            bytecodeOffset,
                                            hash));
}

unsigned SymbolTable::addForwardUninitializedType(const char* value,
                                                  unsigned label)
{
  uint32_t hash = hashOf(ForwardUninitializedTypeTag, value, label);
  for (Symbol* e = get(hash); e; e = e->next) {
    if (e->tag == ForwardUninitializedTypeTag and e->hash == hash
        and e->data == label and same(e->value, value)) {
      return e->index;
    }
  }

  return addTypeInternal(new (&zone) Symbol(typeCount_,
                                            ForwardUninitializedTypeTag,
                                            0,
                                            0,
                                            zone.copy(value),
                                            label,
                                            hash));
}

unsigned SymbolTable::addMergedType(unsigned typeIndex1, unsigned typeIndex2)
{
  int64_t data = typeIndex1 < typeIndex2
                     ? typeIndex1 | (static_cast<int64_t>(typeIndex2) << 32)
                     : typeIndex2 | (static_cast<int64_t>(typeIndex1) << 32);
  uint32_t hash = 0x7FFFFFFF & (MergedTypeTag + typeIndex1 + typeIndex2);
  for (Symbol* e = get(hash); e; e = e->next) {
    if (e->tag == MergedTypeTag and e->hash == hash and e->data == data) {
      return e->info;
    }
  }

  const char* type1 = getType(typeIndex1)->value;
  const char* type2 = getType(typeIndex2)->value;
  const char* superType = client ? client->commonSuperClass(type1, type2)
                                 : RootType;
  unsigned commonSuperTypeIndex = addType(superType);

  if (DebugSymbols) {
    fprintf(stderr, "merge %s and %s: %s\n", type1, type2, superType);
  }

  Symbol* entry = new (&zone)
      Symbol(typeCount_, MergedTypeTag, 0, 0, 0, data, hash);
  entry->info = commonSuperTypeIndex;
  put(entry);
  return commonSuperTypeIndex;
}

}  // namespace bytewright
