/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_ZONE_H
#define BYTEWRIGHT_ZONE_H

#include <bytewright/common.h>
#include <bytewright/util/allocator.h>
#include <bytewright/util/math.h>

namespace bytewright {

// Bump allocator over a chain of segments.  Nothing allocated from a zone
// is freed before the zone itself.
class Zone : public util::AllocOnly {
 public:
  class Segment {
   public:
    Segment(Segment* next, unsigned size) : next(next), size(size), position(0)
    {
    }

    Segment* next;
    uintptr_t size;
    uintptr_t position;
    uint8_t data[0];
  };

  Zone(util::Alloc* allocator, size_t minimumFootprint)
      : allocator(allocator),
        segment(0),
        minimumFootprint(minimumFootprint < sizeof(Segment)
                             ? 0
                             : minimumFootprint - sizeof(Segment))
  {
  }

  ~Zone()
  {
    dispose();
  }

  void dispose()
  {
    for (Segment* seg = segment, *next; seg; seg = next) {
      next = seg->next;
      allocator->free(seg, sizeof(Segment) + seg->size);
    }

    segment = 0;
  }

  virtual void* allocate(size_t size)
  {
    size = pad(size);
    if (segment == 0 or segment->position + size > segment->size) {
      grow(size);
    }

    void* r = segment->data + segment->position;
    segment->position += size;
    return r;
  }

  // Copies a nul-terminated string into the zone.
  const char* copy(const char* s)
  {
    size_t length = strlen(s);
    char* r = static_cast<char*>(allocate(length + 1));
    memcpy(r, s, length + 1);
    return r;
  }

 private:
  // Each new segment is at least twice the size of the previous one.
  void grow(unsigned space)
  {
    unsigned size = util::max(
        space,
        util::max(minimumFootprint, segment == 0 ? 0 : segment->size * 2));
    size = pad(size + sizeof(Segment), LikelyPageSizeInBytes);

    segment = new (allocator->allocate(size))
        Segment(segment, size - sizeof(Segment));
  }

  util::Alloc* allocator;
  Segment* segment;
  unsigned minimumFootprint;
};

}  // namespace bytewright

#endif  // BYTEWRIGHT_ZONE_H
