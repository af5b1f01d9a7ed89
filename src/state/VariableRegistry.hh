/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! VariableRegistry, the single owner of all numerical working storage.
/*!

The registry is a name-keyed store of typed, shaped buffers.  Each buffer is
registered by the component that owns it under an ORIGIN (e.g. "GWF_1" for a
model, "SLN_1" for a solution group, "SLN_1-linear" for that group's linear
solver) and a NAME (e.g. "X", "RHS", "K").

- Allocation acts as a factory.  A pair (origin, name) can be allocated only
  once; shape and kind never change afterwards.
- Access is by name.  Components keep a VariableHandle and look the data up
  when they need it, so storage is never aliased outside the registry.
- Release removes the entry.  ReleaseOrigin() tears down everything owned by
  a component.
- Report() sums the live entries and is exact; it is the basis of the
  end-of-run memory accounting.

A registry is created by the driver and injected into every component; there
is no process-wide instance, so tests can use a fresh registry each.

*/

#ifndef PHREATIC_STATE_VARIABLE_REGISTRY_HH_
#define PHREATIC_STATE_VARIABLE_REGISTRY_HH_

#include <cstddef>
#include <map>
#include <memory>
#include <ostream>

#include "Teuchos_ArrayView.hpp"

#include "Key.hh"
#include "Variable.hh"

namespace Phreatic {

struct RegistryReport {
  int num_integer = 0;
  int num_real = 0;
  std::size_t total_bytes = 0;
};


class VariableRegistry {
 private:
  using VariableMap = std::map<KeyPair, std::unique_ptr<Variable>>;

 public:
  VariableRegistry(){};

  VariableRegistry(const VariableRegistry& other) = delete;
  VariableRegistry& operator=(const VariableRegistry& other) = delete;

  // -----------------------------------------------------------------------------
  // Allocation
  // -----------------------------------------------------------------------------
  // Throws DuplicateNameError if (origin, name) exists and InvalidShapeError
  // if extent is not positive.
  VariableHandle Allocate(const Key& origin, const Key& name, VariableKind kind, int extent);
  VariableHandle AllocateScalar(const Key& origin, const Key& name, VariableKind kind);

  // Throws NotFoundError if absent, including on a second release.
  void Release(const Key& origin, const Key& name);
  void Release(const VariableHandle& h) { Release(h.origin, h.name); }

  // Releases every variable of an origin, returns how many were released.
  int ReleaseOrigin(const Key& origin);

  // -----------------------------------------------------------------------------
  // Access
  // -----------------------------------------------------------------------------
  bool Exists(const Key& origin, const Key& name) const;
  bool Exists(const VariableHandle& h) const { return Exists(h.origin, h.name); }

  const Variable& GetVariable(const Key& origin, const Key& name) const;

  // Throws NotFoundError if absent and KindMismatchError on the wrong kind.
  Teuchos::ArrayView<double> GetReal(const Key& origin, const Key& name);
  Teuchos::ArrayView<const double> GetReal(const Key& origin, const Key& name) const;
  Teuchos::ArrayView<int> GetInt(const Key& origin, const Key& name);
  Teuchos::ArrayView<const int> GetInt(const Key& origin, const Key& name) const;

  Teuchos::ArrayView<double> GetReal(const VariableHandle& h) { return GetReal(h.origin, h.name); }
  Teuchos::ArrayView<const double> GetReal(const VariableHandle& h) const
  {
    return GetReal(h.origin, h.name);
  }
  Teuchos::ArrayView<int> GetInt(const VariableHandle& h) { return GetInt(h.origin, h.name); }
  Teuchos::ArrayView<const int> GetInt(const VariableHandle& h) const
  {
    return GetInt(h.origin, h.name);
  }

  // Iterate over variables in (origin, name) order.
  typedef VariableMap::const_iterator const_iterator;
  const_iterator begin() const { return data_.begin(); }
  const_iterator end() const { return data_.end(); }
  VariableMap::size_type size() const { return data_.size(); }

  KeyVector Origins() const;

  // -----------------------------------------------------------------------------
  // Accounting
  // -----------------------------------------------------------------------------
  RegistryReport Report() const;
  RegistryReport OriginReport(const Key& origin) const;

  // per-origin memory table followed by the totals
  void WriteSummary(std::ostream& os) const;

 private:
  VariableHandle
  Allocate_(const Key& origin, const Key& name, VariableKind kind, int extent, bool scalar);
  Variable& GetVariableW_(const Key& origin, const Key& name);
  const Variable& GetVariableChecked_(const Key& origin, const Key& name, VariableKind kind) const;

 private:
  VariableMap data_;
};

} // namespace Phreatic

#endif
