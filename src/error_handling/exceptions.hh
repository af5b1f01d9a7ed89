/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Base exception and throw policy for all Phreatic errors.

#ifndef PHREATIC_EXCEPTIONS_HH_
#define PHREATIC_EXCEPTIONS_HH_

#include <cstdlib>
#include <exception>
#include <iostream>

namespace Exceptions {

class Phreatic_exception : public std::exception {
 public:
  const char* what() const noexcept override { return "Phreatic exception"; }
};

// What happens when an exception is thrown: raise it, or print and abort.
enum Exception_action { RAISE, ABORT };

extern Exception_action behavior;

void set_exception_behavior_raise();
void set_exception_behavior_abort();
void set_exception_behavior(Exception_action action);
Exception_action exception_behavior();

template <typename E>
void
phreatic_throw(const E& exception)
{
  if (behavior == ABORT) {
    std::cerr << exception.what() << std::endl;
    std::abort();
  }
  throw exception;
}

} // namespace Exceptions

#endif
