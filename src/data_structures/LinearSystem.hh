/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! LinearSystem: the (A, b) pair assembled each outer iteration.
/*!

Assembly follows the construct, insert, complete fill paradigm of Epetra
graphs, in two phases:

* Symbolic: models and exchanges insert the entries they will ever
  contribute to with AddToGraph().  FillCompleteGraph() completes the
  Epetra_CrsGraph and builds the matrix on it.  This is done once, at
  setup, and again only if the stencils change.
* Numeric: each outer iteration calls Zero(), sums contributions with
  AddToMatrix() and AddToRhs(), and calls FillComplete().  Contributions to
  the same entry are summed.  An entry that is not in the graph is an
  error.

The matrix object is kept between assemblies.  structure_changed() is true
only for the first assembly after the graph was (re)built, which lets the
preconditioner keep its symbolic factorization otherwise.

Indices are global, or (block, local index) through the SolutionMap.  The
right-hand side lives in the registry as "RHS" under the owner's origin.

*/

#ifndef PHREATIC_LINEAR_SYSTEM_HH_
#define PHREATIC_LINEAR_SYSTEM_HH_

#include "Teuchos_RCP.hpp"
#include "Epetra_CrsGraph.h"
#include "Epetra_CrsMatrix.h"
#include "Epetra_Vector.h"

#include "Key.hh"
#include "SolutionMap.hh"
#include "VariableRegistry.hh"

namespace Phreatic {

class LinearSystem {
 public:
  LinearSystem(const Teuchos::RCP<const SolutionMap>& map,
               const Teuchos::RCP<VariableRegistry>& registry,
               const Key& origin);

  // symbolic phase, global indices
  void AddToGraph(int row, int col);
  void AddToGraph(int block, int row, int col)
  {
    AddToGraph(map_->GlobalIndex(block, row), map_->GlobalIndex(block, col));
  }
  void FillCompleteGraph();

  // Clears the matrix values and the right-hand side.
  void Zero();

  // global indices
  void AddToMatrix(int row, int col, double value);
  void AddToRhs(int row, double value);

  // local indices within a block of the solution map
  void AddToMatrix(int block, int row, int col, double value)
  {
    AddToMatrix(map_->GlobalIndex(block, row), map_->GlobalIndex(block, col), value);
  }
  void AddToRhs(int block, int row, double value) { AddToRhs(map_->GlobalIndex(block, row), value); }

  // Ends the numeric phase of an assembly.
  void FillComplete();
  bool structure_changed() const { return structure_changed_; }

  // access
  const SolutionMap& map() const { return *map_; }
  const Epetra_CrsMatrix& matrix() const;
  Teuchos::RCP<const Epetra_CrsMatrix> matrix_ptr() const;
  Teuchos::RCP<Epetra_Vector> rhs();
  Teuchos::RCP<const Epetra_Vector> rhs() const;

  double GetMatrixEntry(int row, int col) const;
  int num_nonzeros() const;

 private:
  void CheckIndex_(int gid) const;

 private:
  Teuchos::RCP<const SolutionMap> map_;
  Teuchos::RCP<VariableRegistry> registry_;
  VariableHandle rhs_handle_;

  Teuchos::RCP<Epetra_CrsGraph> graph_;
  Teuchos::RCP<Epetra_CrsMatrix> A_;
  bool graph_changed_, structure_changed_;
};

} // namespace Phreatic

#endif
