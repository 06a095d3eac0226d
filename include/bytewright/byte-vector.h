/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_BYTE_VECTOR_H
#define BYTEWRIGHT_BYTE_VECTOR_H

#include <bytewright/common.h>
#include <bytewright/util/abort.h>
#include <bytewright/util/allocator.h>
#include <bytewright/util/math.h>
#include <bytewright/util/slice.h>

namespace bytewright {

// Growable byte buffer which writes multi-byte values in class file
// (big-endian) order.
class ByteVector {
 public:
  ByteVector(util::Aborter* a, util::Alloc* allocator, size_t minimumCapacity)
      : a(a),
        allocator(allocator),
        data(0, 0),
        position(0),
        minimumCapacity(minimumCapacity)
  {
  }

  ~ByteVector()
  {
    dispose();
  }

  void dispose()
  {
    if (data.items and minimumCapacity > 0) {
      allocator->free(data.items, data.count);
      data.items = 0;
      data.count = 0;
    }
  }

  void ensure(size_t space)
  {
    if (position + space > data.count) {
      util::assertT(a, minimumCapacity > 0);

      size_t newCapacity = util::max(
          position + space, util::max(minimumCapacity, data.count * 2));
      if (data.begin()) {
        data.resize(allocator, newCapacity);
      } else {
        data = util::Slice<uint8_t>::alloc(allocator, newCapacity);
      }
    }
  }

  void putByte(uint8_t v)
  {
    ensure(1);
    data[position++] = v;
  }

  void putShort(uint16_t v)
  {
    ensure(2);
    data[position++] = v >> 8;
    data[position++] = v;
  }

  void putInt(uint32_t v)
  {
    ensure(4);
    data[position++] = v >> 24;
    data[position++] = v >> 16;
    data[position++] = v >> 8;
    data[position++] = v;
  }

  void putByteArray(const uint8_t* p, size_t size)
  {
    ensure(size);
    memcpy(data.begin() + position, p, size);
    position += size;
  }

  uint8_t get(size_t offset)
  {
    util::assertT(a, offset < position);
    return data[offset];
  }

  uint16_t get2(size_t offset)
  {
    return (static_cast<uint16_t>(get(offset)) << 8) | get(offset + 1);
  }

  size_t length()
  {
    return position;
  }

  uint8_t* begin()
  {
    return data.begin();
  }

  util::Aborter* a;
  util::Alloc* allocator;
  util::Slice<uint8_t> data;
  size_t position;
  size_t minimumCapacity;
};

}  // namespace bytewright

#endif  // BYTEWRIGHT_BYTE_VECTOR_H
