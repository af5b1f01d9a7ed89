/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! SolutionMap: layout of several models' unknowns in one joint system.
/*!

Each model of a solution group owns a contiguous block of global degrees of
freedom.  Blocks are laid out in the order they are added, so global index
order is (model index, cell index); this is the traversal order used
everywhere diagnostics must be reproducible.

*/

#ifndef PHREATIC_SOLUTION_MAP_HH_
#define PHREATIC_SOLUTION_MAP_HH_

#include <string>
#include <utility>
#include <vector>

#include "Teuchos_RCP.hpp"
#include "Epetra_Map.h"

#include "Key.hh"
#include "PhreaticTypes.hh"

namespace Phreatic {

// Where a global degree of freedom lives.
struct DofLocation {
  int block = -1;
  int local = -1;
};


class SolutionMap {
 public:
  explicit SolutionMap(const Comm_ptr_type& comm) : comm_(comm){};

  // Returns the index of the new block.  Throws after Finalize().
  int AddBlock(const Key& name, int ndofs);

  // Builds the Epetra map over all blocks.
  void Finalize();
  bool finalized() const { return map_ != Teuchos::null; }

  // layout
  int num_blocks() const { return names_.size(); }
  int size() const { return offsets_.empty() ? 0 : offsets_.back(); }
  int offset(int block) const { return offsets_[block]; }
  int block_size(int block) const { return offsets_[block + 1] - offsets_[block]; }
  const Key& block_name(int block) const { return names_[block]; }
  int BlockIndex(const Key& name) const;

  // index conversions
  int GlobalIndex(int block, int local) const { return offsets_[block] + local; }
  DofLocation Location(int gid) const;

  const Epetra_Map& Map() const;
  Map_ptr_type MapPtr() const;
  const Comm_ptr_type& Comm() const { return comm_; }

 private:
  Comm_ptr_type comm_;
  std::vector<Key> names_;
  std::vector<int> offsets_;
  Teuchos::RCP<Epetra_Map> map_;
};

} // namespace Phreatic

#endif
