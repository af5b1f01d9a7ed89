/*
  Solvers

  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:

  Interface for the system solved by the outer (Picard) iteration:
  A(u) x = b(u), with the update du = x - u.
*/

#ifndef PHREATIC_SOLVER_FN_BASE_
#define PHREATIC_SOLVER_FN_BASE_

#include "Teuchos_RCP.hpp"
#include "Epetra_CrsMatrix.h"
#include "Epetra_Vector.h"

#include "SolutionMap.hh"

namespace Phreatic {
namespace PhreaticSolvers {

class SolverFnBase {
 public:
  virtual ~SolverFnBase() = default;

  // assembles A and b at the state u
  virtual void Assemble(const Epetra_Vector& u) = 0;
  virtual Teuchos::RCP<const Epetra_CrsMatrix> Matrix() const = 0;
  virtual Teuchos::RCP<const Epetra_Vector> Rhs() const = 0;

  // change per degree of freedom between the state u and the linear solution x
  virtual void ComputeChange(const Epetra_Vector& u, const Epetra_Vector& x, Epetra_Vector& du)
  {
    du.Update(1.0, x, -1.0, u, 0.0);
  }

  // u <- u + du
  virtual void ApplyUpdate(Epetra_Vector& u, const Epetra_Vector& du) { u.Update(1.0, du, 1.0); }

  // inactive degrees of freedom are never updated
  virtual bool IsActive(int gid) const { return true; }

  // (model, cell) of a degree of freedom, for diagnostics
  virtual DofLocation Location(int gid) const = 0;
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
