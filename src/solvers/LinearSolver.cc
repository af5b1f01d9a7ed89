/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <algorithm>
#include <cmath>
#include <vector>

#include "Teuchos_Array.hpp"

#include "LinearSolver.hh"
#include "PreconditionerFactory.hh"

namespace Phreatic {
namespace PhreaticSolvers {

LinearSolver::LinearSolver(const std::string& name,
                           const Teuchos::RCP<VariableRegistry>& registry,
                           const Key& origin)
  : name_(name),
    registry_(registry),
    origin_(origin),
    max_itrs_(100),
    criteria_(LIN_SOLVER_ABSOLUTE_RESIDUAL | LIN_SOLVER_MAKE_ONE_ITERATION),
    norm_type_(LIN_SOLVER_NORM_LINF),
    tol_(1e-6),
    overflow_tol_(3.0e+50), // mass of the Universe (J.Hopkins)
    inner_hclose_(-1.0),
    num_itrs_(0),
    returned_code_(0),
    residual_(0.0),
    initialized_(false)
{}


/* ******************************************************************
* Initialization from a parameter list, see LinearSolver.hh.
****************************************************************** */
void
LinearSolver::Init(Teuchos::ParameterList& plist)
{
  vo_ = Teuchos::rcp(new VerboseObject("Solvers::" + name_, plist));

  tol_ = plist.get<double>("error tolerance", 1e-6);
  max_itrs_ = plist.get<int>("maximum number of iterations", 100);
  overflow_tol_ = plist.get<double>("overflow tolerance", 3.0e+50);
  inner_hclose_ = plist.get<double>("inner head tolerance", -1.0);

  if (tol_ <= 0.0 || max_itrs_ <= 0) {
    Errors::Message msg;
    msg << "LinearSolver: \"error tolerance\" and \"maximum number of iterations\" must be positive.";
    Exceptions::phreatic_throw(msg);
  }

  std::string norm = plist.get<std::string>("norm type", "infinity norm");
  if (norm == "infinity norm") {
    norm_type_ = LIN_SOLVER_NORM_LINF;
  } else if (norm == "L2 norm") {
    norm_type_ = LIN_SOLVER_NORM_L2;
  } else {
    Errors::Message msg;
    msg << "LinearSolver: \"norm type\" \"" << norm << "\" is not recognized.";
    Exceptions::phreatic_throw(msg);
  }

  if (plist.isParameter("convergence criteria")) {
    std::vector<std::string> names;
    names = plist.get<Teuchos::Array<std::string>>("convergence criteria").toVector();

    int criteria(0);
    for (int i = 0; i < names.size(); i++) {
      if (names[i] == "relative rhs") {
        criteria |= LIN_SOLVER_RELATIVE_RHS;
      } else if (names[i] == "relative residual") {
        criteria |= LIN_SOLVER_RELATIVE_RESIDUAL;
      } else if (names[i] == "absolute residual") {
        criteria |= LIN_SOLVER_ABSOLUTE_RESIDUAL;
      } else if (names[i] == "make one iteration") {
        criteria |= LIN_SOLVER_MAKE_ONE_ITERATION;
      } else {
        Errors::Message msg;
        msg << "LinearSolver: \"convergence criteria\" type \"" << names[i] << "\" is not recognized.";
        Exceptions::phreatic_throw(msg);
      }
    }
    if (!(criteria & (LIN_SOLVER_RELATIVE_RHS | LIN_SOLVER_RELATIVE_RESIDUAL |
                      LIN_SOLVER_ABSOLUTE_RESIDUAL))) {
      Errors::Message msg("LinearSolver: \"convergence criteria\" has no residual criterion.");
      Exceptions::phreatic_throw(msg);
    }
    criteria_ = criteria;
  }

  PreconditionerFactory factory;
  pc_ = factory.Create(plist);

  initialized_ = true;
}


double
LinearSolver::Norm_(const Epetra_Vector& v) const
{
  double norm(0.0);
  if (norm_type_ == LIN_SOLVER_NORM_L2) {
    v.Norm2(&norm);
  } else {
    // a NaN entry must not be skipped by the max
    for (int i = 0; i < v.MyLength(); ++i) {
      double a = std::abs(v[i]);
      if (std::isnan(a)) return a;
      norm = std::max(norm, a);
    }
  }
  return norm;
}


double
LinearSolver::TrueResidual(const Epetra_CrsMatrix& A,
                           const Epetra_Vector& b,
                           const Epetra_Vector& x) const
{
  Epetra_Vector r(b);
  A.Multiply(false, x, r); // r = b - A * x
  r.Update(1.0, b, -1.0);
  return Norm_(r);
}


/* ******************************************************************
* The first enabled residual criterion is checked.
****************************************************************** */
int
LinearSolver::CheckConvergence_(double rnorm, double fnorm, double rnorm0, double dxmax) const
{
  if (inner_hclose_ > 0.0 && dxmax > inner_hclose_) return 0;

  if (criteria_ & LIN_SOLVER_RELATIVE_RHS) {
    if (rnorm <= tol_ * fnorm) return LIN_SOLVER_RELATIVE_RHS;
  } else if (criteria_ & LIN_SOLVER_RELATIVE_RESIDUAL) {
    if (rnorm <= tol_ * rnorm0) return LIN_SOLVER_RELATIVE_RESIDUAL;
  } else if (criteria_ & LIN_SOLVER_ABSOLUTE_RESIDUAL) {
    if (rnorm <= tol_) return LIN_SOLVER_ABSOLUTE_RESIDUAL;
  }
  return 0;
}


Teuchos::RCP<Epetra_Vector>
LinearSolver::WorkVector_(const Key& name, const Epetra_BlockMap& map)
{
  int n = map.NumMyElements();
  if (registry_->Exists(origin_, name) && registry_->GetVariable(origin_, name).extent() != n) {
    registry_->Release(origin_, name);
  }
  if (!registry_->Exists(origin_, name)) {
    registry_->Allocate(origin_, name, VariableKind::REAL, n);
  }

  auto data = registry_->GetReal(origin_, name);
  return Teuchos::rcp(new Epetra_Vector(View, map, data.getRawPtr()));
}


void
LinearSolver::CheckInitialized_(const Epetra_CrsMatrix& A,
                                const Epetra_Vector& b,
                                const Epetra_Vector& x) const
{
  if (!initialized_) {
    Errors::Message msg;
    msg << "LinearSolver" << name_ << ": has not been initialized.";
    Exceptions::phreatic_throw(msg);
  }
  if (b.MyLength() != A.NumMyRows() || x.MyLength() != A.NumMyRows()) {
    Errors::Message msg;
    msg << "LinearSolver" << name_ << ": matrix has " << A.NumMyRows() << " rows, but b has "
        << b.MyLength() << " and x has " << x.MyLength() << " entries.";
    Exceptions::phreatic_throw(msg);
  }
}


int
LinearSolver::UpdatePreconditioner_(const Teuchos::RCP<const Epetra_CrsMatrix>& A,
                                    const Epetra_Vector& b,
                                    const Epetra_Vector& x)
{
  pc_->Update(A);
  int ierr = pc_->returned_code();
  if (ierr == 0) return 0;

  num_itrs_ = 0;
  residual_ = TrueResidual(*A, b, x);
  if (vo_->os_OK(Teuchos::VERB_MEDIUM)) {
    Teuchos::OSTab tab = vo_->getOSTab();
    *vo_->os() << "Failed: preconditioner \"" << pc_->name() << "\" returned code " << ierr
               << std::endl;
  }
  return LIN_SOLVER_PRECONDITIONER_FAILED;
}


Errors::Message
LinearSolver::DecodeErrorCode(int ierr) const
{
  Errors::Message msg;
  switch (ierr) {
  case LIN_SOLVER_NON_SPD_APPLY:
    msg << "Linear system is not SPD.\n";
    break;
  case LIN_SOLVER_MAX_ITERATIONS:
    msg << "Maximum iterations are reached in solution of linear system.\n";
    break;
  case LIN_SOLVER_RESIDUAL_OVERFLOW:
    msg << "Residual overflow in solution of linear system.\n";
    break;
  case LIN_SOLVER_BREAKDOWN:
    msg << "Breakdown of the Krylov method.\n";
    break;
  case LIN_SOLVER_PRECONDITIONER_FAILED:
    msg << "Preconditioner could not be built for the linear system.\n";
    break;
  default:
    msg << "\nLinear solver returned an unrecoverable error code: " << ierr << ".\n";
  }
  return msg;
}

} // namespace PhreaticSolvers
} // namespace Phreatic
