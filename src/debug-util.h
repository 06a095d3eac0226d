/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_DEBUG_UTIL_H
#define BYTEWRIGHT_DEBUG_UTIL_H

#include <stdio.h>

#include <bytewright/abstract-type.h>
#include <bytewright/code.h>
#include <bytewright/frame.h>
#include <bytewright/symbol-table.h>

namespace bytewright {
namespace debug {

const char* opcodeName(unsigned opcode);

int printAbstractType(FILE* out, SymbolTable* symbols, AbstractType type);

int printNode(FILE* out, Code::Node* node);

void printFrame(FILE* out, SymbolTable* symbols, Frame* frame);

}  // namespace debug
}  // namespace bytewright

#endif  // BYTEWRIGHT_DEBUG_UTIL_H
