/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_UTIL_SLICE_H
#define BYTEWRIGHT_UTIL_SLICE_H

#include <string.h>

#include "allocator.h"
#include "assert.h"

namespace bytewright {
namespace util {

template <class T>
struct NonConst;

template <class T>
struct NonConst<const T> {
  typedef T Type;
};

template <class T>
struct NonConst {
  typedef T Type;
};

template <class T>
class Slice {
 public:
  T* items;
  size_t count;

  inline Slice() : items(0), count(0)
  {
  }

  inline Slice(T* items, size_t count) : items(items), count(count)
  {
  }

  inline Slice(const Slice<typename NonConst<T>::Type>& copy)
      : items(copy.items), count(copy.count)
  {
  }

  inline T& operator[](size_t index) const
  {
    ASSERT(index < count);
    return items[index];
  }

  inline T* begin() const
  {
    return items;
  }

  static Slice<T> alloc(AllocOnly* a, size_t count)
  {
    return Slice<T>((T*)a->allocate(sizeof(T) * count), count);
  }

  static Slice<T> allocAndSet(AllocOnly* a, size_t count, const T& item)
  {
    Slice<T> slice(alloc(a, count));
    for (size_t i = 0; i < count; i++) {
      slice[i] = item;
    }
    return slice;
  }

  Slice<T> clone(AllocOnly* a, size_t newCount) const
  {
    T* newItems = (T*)a->allocate(newCount * sizeof(T));
    if (count) {
      memcpy(newItems,
             items,
             (count < newCount ? count : newCount) * sizeof(T));
    }
    return Slice<T>(newItems, newCount);
  }

  Slice<T> cloneAndSet(AllocOnly* a, size_t newCount, const T& item) const
  {
    Slice<T> slice(clone(a, newCount));
    for (size_t i = count; i < newCount; i++) {
      slice[i] = item;
    }
    return slice;
  }

  void resize(Alloc* a, size_t newCount)
  {
    Slice<T> slice(clone(a, newCount));
    if (items) {
      a->free(items, count * sizeof(T));
    }
    *this = slice;
  }
};

}  // namespace util
}  // namespace bytewright

#endif  // BYTEWRIGHT_UTIL_SLICE_H
