/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_PROPERTIES_H
#define BYTEWRIGHT_PROPERTIES_H

#include <bytewright/common.h>

namespace bytewright {

// Looks up "name" in a list of "key=value" strings, returning the value or 0.
inline const char* findProperty(unsigned propertyCount,
                                const char** properties,
                                const char* name)
{
  for (unsigned i = 0; i < propertyCount; ++i) {
    const char* p = properties[i];
    const char* n = name;
    while (*p and *p != '=' and *n and *p == *n) {
      ++p;
      ++n;
    }
    if (*p == '=' and *n == 0) {
      return p + 1;
    }
  }
  return 0;
}

inline bool findBooleanProperty(unsigned propertyCount,
                                const char** properties,
                                const char* name)
{
  const char* value = findProperty(propertyCount, properties, name);
  return value and (equal(value, "true") or equal(value, "1"));
}

}  // namespace bytewright

#endif  // BYTEWRIGHT_PROPERTIES_H
