/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Right-preconditioned BiCGSTAB for non-symmetric systems.

/*!

Selected with `"iterative method`"=`"bicgstab`".  Parameters are those of
the linear solver list.  A breakdown (vanishing inner product) returns
LIN_SOLVER_BREAKDOWN.

*/

#ifndef PHREATIC_LINEAR_SOLVER_BICGSTAB_HH_
#define PHREATIC_LINEAR_SOLVER_BICGSTAB_HH_

#include "LinearSolver.hh"

namespace Phreatic {
namespace PhreaticSolvers {

class LinearSolverBiCGStab : public LinearSolver {
 public:
  LinearSolverBiCGStab(const Teuchos::RCP<VariableRegistry>& registry, const Key& origin)
    : LinearSolver("BiCGStab", registry, origin){};

  int Solve(const Teuchos::RCP<const Epetra_CrsMatrix>& A,
            const Epetra_Vector& b,
            Epetra_Vector& x) override;

 private:
  int BiCGStab_(const Epetra_CrsMatrix& A, const Epetra_Vector& f, Epetra_Vector& x);
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
