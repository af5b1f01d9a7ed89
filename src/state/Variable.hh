/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! A registered, typed, shaped buffer owned by the VariableRegistry.

#ifndef PHREATIC_STATE_VARIABLE_HH_
#define PHREATIC_STATE_VARIABLE_HH_

#include <cstddef>
#include <string>
#include <vector>

#include "Teuchos_ArrayView.hpp"

#include "Key.hh"

namespace Phreatic {

enum class VariableKind { INTEGER, REAL };

std::string to_string(VariableKind kind);

// Logical handle: components keep the name, never the storage.
struct VariableHandle {
  Key origin;
  Key name;

  bool operator==(const VariableHandle& other) const
  {
    return origin == other.origin && name == other.name;
  }
};


class Variable {
 public:
  // extent is the number of entries; a scalar has extent 1
  Variable(const Key& origin, const Key& name, VariableKind kind, int extent, bool scalar);

  Variable(const Variable& other) = delete;
  Variable& operator=(const Variable& other) = delete;

  // metadata, immutable for the lifetime of the variable
  const Key& origin() const { return origin_; }
  const Key& name() const { return name_; }
  VariableKind kind() const { return kind_; }
  int extent() const { return extent_; }
  bool is_scalar() const { return scalar_; }
  std::size_t size_bytes() const;

  VariableHandle handle() const { return VariableHandle{ origin_, name_ }; }

  // data views, the kind is checked by the registry
  Teuchos::ArrayView<double> real_view();
  Teuchos::ArrayView<const double> real_view() const;
  Teuchos::ArrayView<int> int_view();
  Teuchos::ArrayView<const int> int_view() const;

 private:
  Key origin_, name_;
  VariableKind kind_;
  int extent_;
  bool scalar_;

  std::vector<double> rdata_;
  std::vector<int> idata_;
};

} // namespace Phreatic

#endif
