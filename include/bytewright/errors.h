/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef BYTEWRIGHT_ERRORS_H
#define BYTEWRIGHT_ERRORS_H

#include <stdexcept>
#include <string>

namespace bytewright {

// Raised when a method body cannot be analyzed as given: subroutine
// instructions, branches to labels which are never bound, or a label bound
// twice.  Internal consistency failures go through util::Aborter instead.
class UnsupportedInput : public std::runtime_error {
 public:
  UnsupportedInput(const std::string& message, unsigned instruction, int opcode)
      : std::runtime_error(message), instruction(instruction), opcode(opcode)
  {
  }

  unsigned instruction;
  int opcode;
};

}  // namespace bytewright

#endif  // BYTEWRIGHT_ERRORS_H
