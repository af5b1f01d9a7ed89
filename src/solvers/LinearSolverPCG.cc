/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <cmath>

#include "LinearSolverPCG.hh"

namespace Phreatic {
namespace PhreaticSolvers {

int
LinearSolverPCG::Solve(const Teuchos::RCP<const Epetra_CrsMatrix>& A,
                       const Epetra_Vector& b,
                       Epetra_Vector& x)
{
  CheckInitialized_(*A, b, x);
  returned_code_ = UpdatePreconditioner_(A, b, x);
  if (returned_code_ != 0) return returned_code_;

  returned_code_ = PCG_(*A, b, x);
  return returned_code_;
}


/* ******************************************************************
* PCG input/output data:
*  f [input]         the right-hand side
*  x [input/output]  initial guess / final solution
*
*  Return value. If it is positive, it indicates the successful
*  convergence criterion (criteria in a few exceptional cases) that
*  was checked first. If it is negative, it indicates a failure, see
*  LinearSolverDefs.hh for the error explanation.
****************************************************************** */
int
LinearSolverPCG::PCG_(const Epetra_CrsMatrix& A, const Epetra_Vector& f, Epetra_Vector& x)
{
  Teuchos::OSTab tab = vo_->getOSTab();

  const Epetra_BlockMap& map = A.RowMap();
  Teuchos::RCP<Epetra_Vector> r = WorkVector_("R", map);
  Teuchos::RCP<Epetra_Vector> z = WorkVector_("Z", map);
  Teuchos::RCP<Epetra_Vector> p = WorkVector_("P", map);
  Teuchos::RCP<Epetra_Vector> q = WorkVector_("Q", map);
  num_itrs_ = 0;

  double fnorm = Norm_(f);

  A.Multiply(false, x, *r); // r = f - A * x
  r->Update(1.0, f, -1.0);
  double rnorm0 = Norm_(*r);
  residual_ = rnorm0;

  if (!std::isfinite(rnorm0) || rnorm0 > overflow_tol_) {
    if (vo_->os_OK(Teuchos::VERB_MEDIUM)) *vo_->os() << "Diverged, ||r||=" << rnorm0 << std::endl;
    return LIN_SOLVER_RESIDUAL_OVERFLOW;
  }

  if (!(criteria_ & LIN_SOLVER_MAKE_ONE_ITERATION)) {
    int ierr = CheckConvergence_(rnorm0, fnorm, rnorm0, 0.0);
    if (ierr > 0) {
      if (vo_->os_OK(Teuchos::VERB_MEDIUM))
        *vo_->os() << "Converged, itr=" << num_itrs_ << " ||r||=" << rnorm0 << std::endl;
      return ierr;
    }
  }

  // rare case that can happen in practise
  if (rnorm0 == 0.0) {
    if (vo_->os_OK(Teuchos::VERB_MEDIUM))
      *vo_->os() << "Converged, itr=" << num_itrs_ << " ||r||=" << residual_ << std::endl;
    return criteria_; // Convergence for all criteria
  }

  pc_->ApplyInverse(*r, *z); // gamma = (H r,r)
  double gamma0;
  z->Dot(*r, &gamma0);
  if (gamma0 <= 0.0) {
    if (vo_->os_OK(Teuchos::VERB_MEDIUM))
      *vo_->os() << "Failed: non-SPD ApplyInverse: gamma0=" << gamma0 << std::endl;
    return LIN_SOLVER_NON_SPD_APPLY_INVERSE;
  }
  p->Update(1.0, *z, 0.0);

  for (int i = 0; i < max_itrs_; i++) {
    A.Multiply(false, *p, *q);
    double alpha;
    q->Dot(*p, &alpha);

    if (alpha <= 0.0) {
      if (vo_->os_OK(Teuchos::VERB_MEDIUM)) {
        double pnorm;
        p->Norm2(&pnorm);
        *vo_->os() << "Failed: non-SPD Apply: alpha=" << alpha << " ||p||=" << pnorm << std::endl;
      }
      return LIN_SOLVER_NON_SPD_APPLY;
    }
    alpha = gamma0 / alpha;

    x.Update(alpha, *p, 1.0);
    r->Update(-alpha, *q, 1.0);

    double pmax;
    p->NormInf(&pmax);
    double dxmax = std::abs(alpha) * pmax;

    double rnorm = Norm_(*r);
    residual_ = rnorm;
    num_itrs_ = i + 1;

    if (vo_->os_OK(Teuchos::VERB_EXTREME)) {
      *vo_->os() << i << " ||r||=" << residual_ << " max|dx|=" << dxmax << std::endl;
    }

    if (!std::isfinite(rnorm) || rnorm > overflow_tol_) {
      if (vo_->os_OK(Teuchos::VERB_MEDIUM)) *vo_->os() << "Diverged, ||r||=" << rnorm << std::endl;
      return LIN_SOLVER_RESIDUAL_OVERFLOW;
    }

    // Return the first criterion which is fulfilled.
    int ierr = CheckConvergence_(rnorm, fnorm, rnorm0, dxmax);
    if (ierr > 0) {
      if (vo_->os_OK(Teuchos::VERB_MEDIUM))
        *vo_->os() << "Converged, itr=" << num_itrs_ << " ||r||=" << rnorm << " ||f||=" << fnorm
                   << std::endl;
      return ierr;
    }

    pc_->ApplyInverse(*r, *z); // gamma1 = (H r, r)
    double gamma1;
    z->Dot(*r, &gamma1);
    if (gamma1 < 0.0) { // residual could be zero, so we use strict inequality
      if (vo_->os_OK(Teuchos::VERB_MEDIUM))
        *vo_->os() << "Failed: non-SPD ApplyInverse: gamma1=" << gamma1 << std::endl;
      return LIN_SOLVER_NON_SPD_APPLY_INVERSE;
    }

    double beta = gamma1 / gamma0;
    gamma0 = gamma1;

    p->Update(1.0, *z, beta);
  }

  if (vo_->os_OK(Teuchos::VERB_MEDIUM))
    *vo_->os() << "Failed (" << num_itrs_ << " itrs) ||r||=" << residual_ << " ||f||=" << fnorm
               << std::endl;

  return LIN_SOLVER_MAX_ITERATIONS;
}

} // namespace PhreaticSolvers
} // namespace Phreatic
