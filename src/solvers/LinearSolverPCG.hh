/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Preconditioned conjugate gradient method for a linear solver.

/*!

Requires a symmetric positive definite matrix and preconditioner.  Work
vectors R, Z, P and Q are registered under the solver's origin.

*/

#ifndef PHREATIC_LINEAR_SOLVER_PCG_HH_
#define PHREATIC_LINEAR_SOLVER_PCG_HH_

#include "LinearSolver.hh"

namespace Phreatic {
namespace PhreaticSolvers {

class LinearSolverPCG : public LinearSolver {
 public:
  LinearSolverPCG(const Teuchos::RCP<VariableRegistry>& registry, const Key& origin)
    : LinearSolver("PCG", registry, origin){};

  int Solve(const Teuchos::RCP<const Epetra_CrsMatrix>& A,
            const Epetra_Vector& b,
            Epetra_Vector& x) override;

 private:
  int PCG_(const Epetra_CrsMatrix& A, const Epetra_Vector& f, Epetra_Vector& x);
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
