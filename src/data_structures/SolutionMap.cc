/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <algorithm>

#include "errors.hh"
#include "SolutionMap.hh"

namespace Phreatic {

int
SolutionMap::AddBlock(const Key& name, int ndofs)
{
  if (finalized()) {
    Errors::Message msg;
    msg << "SolutionMap: cannot add block \"" << name << "\" after the map is finalized.";
    Exceptions::phreatic_throw(msg);
  }
  if (ndofs <= 0) {
    Errors::Message msg;
    msg << "SolutionMap: block \"" << name << "\" has " << ndofs << " degrees of freedom.";
    Exceptions::phreatic_throw(msg);
  }
  if (std::find(names_.begin(), names_.end(), name) != names_.end()) {
    Errors::Message msg;
    msg << "SolutionMap: block \"" << name << "\" was added twice.";
    Exceptions::phreatic_throw(msg);
  }

  if (offsets_.empty()) offsets_.push_back(0);
  names_.push_back(name);
  offsets_.push_back(offsets_.back() + ndofs);
  return names_.size() - 1;
}


void
SolutionMap::Finalize()
{
  if (names_.empty()) {
    Errors::Message msg("SolutionMap: no blocks were added.");
    Exceptions::phreatic_throw(msg);
  }
  map_ = Teuchos::rcp(new Epetra_Map(size(), 0, *comm_));
}


int
SolutionMap::BlockIndex(const Key& name) const
{
  auto it = std::find(names_.begin(), names_.end(), name);
  if (it == names_.end()) {
    Errors::Message msg;
    msg << "SolutionMap: no block named \"" << name << "\".";
    Exceptions::phreatic_throw(msg);
  }
  return it - names_.begin();
}


DofLocation
SolutionMap::Location(int gid) const
{
  DofLocation loc;
  if (gid < 0 || gid >= size()) return loc;

  // first offset strictly greater than gid closes the owning block
  auto it = std::upper_bound(offsets_.begin(), offsets_.end(), gid);
  loc.block = (it - offsets_.begin()) - 1;
  loc.local = gid - offsets_[loc.block];
  return loc;
}


const Epetra_Map&
SolutionMap::Map() const
{
  if (!finalized()) {
    Errors::Message msg("SolutionMap: Map() requested before Finalize().");
    Exceptions::phreatic_throw(msg);
  }
  return *map_;
}


Map_ptr_type
SolutionMap::MapPtr() const
{
  Map();
  return map_;
}

} // namespace Phreatic
