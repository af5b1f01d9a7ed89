/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <cmath>

#include "LinearSolverBiCGStab.hh"

namespace Phreatic {
namespace PhreaticSolvers {

int
LinearSolverBiCGStab::Solve(const Teuchos::RCP<const Epetra_CrsMatrix>& A,
                            const Epetra_Vector& b,
                            Epetra_Vector& x)
{
  CheckInitialized_(*A, b, x);
  returned_code_ = UpdatePreconditioner_(A, b, x);
  if (returned_code_ != 0) return returned_code_;

  returned_code_ = BiCGStab_(*A, b, x);
  return returned_code_;
}


/* ******************************************************************
* Return value follows the PCG convention.
****************************************************************** */
int
LinearSolverBiCGStab::BiCGStab_(const Epetra_CrsMatrix& A, const Epetra_Vector& f, Epetra_Vector& x)
{
  Teuchos::OSTab tab = vo_->getOSTab();

  const Epetra_BlockMap& map = A.RowMap();
  Teuchos::RCP<Epetra_Vector> r = WorkVector_("R", map);
  Teuchos::RCP<Epetra_Vector> rhat = WorkVector_("RHAT", map);
  Teuchos::RCP<Epetra_Vector> p = WorkVector_("P", map);
  Teuchos::RCP<Epetra_Vector> phat = WorkVector_("PHAT", map);
  Teuchos::RCP<Epetra_Vector> v = WorkVector_("V", map);
  Teuchos::RCP<Epetra_Vector> s = WorkVector_("S", map);
  Teuchos::RCP<Epetra_Vector> shat = WorkVector_("SHAT", map);
  Teuchos::RCP<Epetra_Vector> t = WorkVector_("T", map);
  Teuchos::RCP<Epetra_Vector> dx = WorkVector_("DX", map);
  num_itrs_ = 0;

  double fnorm = Norm_(f);

  A.Multiply(false, x, *r);
  r->Update(1.0, f, -1.0);
  double rnorm0 = Norm_(*r);
  residual_ = rnorm0;

  if (!std::isfinite(rnorm0) || rnorm0 > overflow_tol_) {
    if (vo_->os_OK(Teuchos::VERB_MEDIUM)) *vo_->os() << "Diverged, ||r||=" << rnorm0 << std::endl;
    return LIN_SOLVER_RESIDUAL_OVERFLOW;
  }

  if (!(criteria_ & LIN_SOLVER_MAKE_ONE_ITERATION)) {
    int ierr = CheckConvergence_(rnorm0, fnorm, rnorm0, 0.0);
    if (ierr > 0) return ierr;
  }
  if (rnorm0 == 0.0) return criteria_;

  rhat->Update(1.0, *r, 0.0);
  p->PutScalar(0.0);
  v->PutScalar(0.0);

  double rho_old(1.0), alpha(1.0), omega(1.0);

  for (int i = 0; i < max_itrs_; i++) {
    double rho;
    rhat->Dot(*r, &rho);
    if (rho == 0.0) {
      if (vo_->os_OK(Teuchos::VERB_MEDIUM)) *vo_->os() << "Breakdown: rho=0, itr=" << i << std::endl;
      return LIN_SOLVER_BREAKDOWN;
    }

    if (i == 0) {
      p->Update(1.0, *r, 0.0);
    } else {
      double beta = (rho / rho_old) * (alpha / omega);
      p->Update(-omega, *v, 1.0); // p = r + beta (p - omega v)
      p->Update(1.0, *r, beta);
    }

    pc_->ApplyInverse(*p, *phat);
    A.Multiply(false, *phat, *v);

    double tmp;
    rhat->Dot(*v, &tmp);
    if (tmp == 0.0) {
      if (vo_->os_OK(Teuchos::VERB_MEDIUM))
        *vo_->os() << "Breakdown: (rhat, v)=0, itr=" << i << std::endl;
      return LIN_SOLVER_BREAKDOWN;
    }
    alpha = rho / tmp;

    s->Update(1.0, *r, -alpha, *v, 0.0);
    num_itrs_ = i + 1;

    // early exit on the half step
    double snorm = Norm_(*s);
    double phat_max;
    phat->NormInf(&phat_max);
    int ierr = CheckConvergence_(snorm, fnorm, rnorm0, std::abs(alpha) * phat_max);
    if (ierr > 0) {
      x.Update(alpha, *phat, 1.0);
      residual_ = snorm;
      if (vo_->os_OK(Teuchos::VERB_MEDIUM))
        *vo_->os() << "Converged, itr=" << num_itrs_ << " ||r||=" << snorm << std::endl;
      return ierr;
    }

    pc_->ApplyInverse(*s, *shat);
    A.Multiply(false, *shat, *t);

    double tt, ts;
    t->Dot(*t, &tt);
    t->Dot(*s, &ts);
    if (tt == 0.0) {
      if (vo_->os_OK(Teuchos::VERB_MEDIUM)) *vo_->os() << "Breakdown: (t, t)=0, itr=" << i << std::endl;
      return LIN_SOLVER_BREAKDOWN;
    }
    omega = ts / tt;

    dx->Update(alpha, *phat, omega, *shat, 0.0);
    x.Update(1.0, *dx, 1.0);
    r->Update(1.0, *s, -omega, *t, 0.0);

    double dxmax;
    dx->NormInf(&dxmax);
    double rnorm = Norm_(*r);
    residual_ = rnorm;

    if (vo_->os_OK(Teuchos::VERB_EXTREME)) {
      *vo_->os() << i << " ||r||=" << residual_ << " max|dx|=" << dxmax << std::endl;
    }

    if (!std::isfinite(rnorm) || rnorm > overflow_tol_) {
      if (vo_->os_OK(Teuchos::VERB_MEDIUM)) *vo_->os() << "Diverged, ||r||=" << rnorm << std::endl;
      return LIN_SOLVER_RESIDUAL_OVERFLOW;
    }

    ierr = CheckConvergence_(rnorm, fnorm, rnorm0, dxmax);
    if (ierr > 0) {
      if (vo_->os_OK(Teuchos::VERB_MEDIUM))
        *vo_->os() << "Converged, itr=" << num_itrs_ << " ||r||=" << rnorm << " ||f||=" << fnorm
                   << std::endl;
      return ierr;
    }

    if (omega == 0.0) {
      if (vo_->os_OK(Teuchos::VERB_MEDIUM)) *vo_->os() << "Breakdown: omega=0, itr=" << i << std::endl;
      return LIN_SOLVER_BREAKDOWN;
    }
    rho_old = rho;
  }

  if (vo_->os_OK(Teuchos::VERB_MEDIUM))
    *vo_->os() << "Failed (" << num_itrs_ << " itrs) ||r||=" << residual_ << " ||f||=" << fnorm
               << std::endl;

  return LIN_SOLVER_MAX_ITERATIONS;
}

} // namespace PhreaticSolvers
} // namespace Phreatic
