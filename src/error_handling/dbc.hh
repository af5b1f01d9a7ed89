/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#ifndef PHREATIC_DBC_HH_
#define PHREATIC_DBC_HH_

#include <string>

#include "exceptions.hh"

namespace DBC {

// Exception class for DBC assertion violations.
class Assertion : public Exceptions::Phreatic_exception {
 public:
  Assertion(const char* condition, const char* file, unsigned int line);
  const char* what() const noexcept override { return message_.c_str(); }

 public:
  const char* assertion_;
  const char* filename_;
  unsigned int line_number_;

 private:
  std::string message_;
};

void phreatic_assert(const char* cond, const char* file, unsigned int line);

} // namespace DBC


// The do wrapper prevents the if statement from grabbing subsequent
// else statements away from enclosing ifs.  The version when DBC is
// not enabled compiles away to nothing, but surpresses warning about
// unused variables in the expression a.
#ifdef ENABLE_DBC
#  define PHREATIC_ASSERT(bool_expression)                                                         \
    do {                                                                                           \
      if (!(bool_expression)) DBC::phreatic_assert(#bool_expression, __FILE__, __LINE__);          \
    } while (0)
#else
#  define PHREATIC_ASSERT(a)                                                                       \
    do {                                                                                           \
      (void)sizeof(a);                                                                             \
    } while (0)
#endif

#endif
