/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <cmath>

#include "errors.hh"
#include "NonlinearSolver.hh"

namespace Phreatic {
namespace PhreaticSolvers {

NonlinearSolver::NonlinearSolver(Teuchos::ParameterList& plist,
                                 const Teuchos::RCP<LinearSolver>& linear,
                                 const Teuchos::RCP<VariableRegistry>& registry,
                                 const Key& origin)
  : linear_(linear),
    registry_(registry),
    origin_(origin),
    criteria_(plist),
    relax_(plist, registry, origin),
    max_head_change_(-1.0),
    phase_(Phase::CONVERGED),
    num_itrs_(0),
    inner_itrs_(0),
    total_inner_itrs_(0),
    linear_calls_(0),
    linear_code_(0),
    returned_code_(SOLVER_CONTINUE),
    residual_(0.0),
    max_change_(0.0),
    relaxation_(1.0)
{
  vo_ = Teuchos::rcp(new VerboseObject("Solvers::Outer", plist));

  if (plist.isParameter("maximum head change")) {
    max_head_change_ = plist.get<double>("maximum head change");
    if (max_head_change_ <= 0.0) {
      Errors::Message msg("NonlinearSolver: \"maximum head change\" must be positive.");
      Exceptions::phreatic_throw(msg);
    }
  }

  linear_->set_tolerance(criteria_.residual_close());
  linear_->set_max_itrs(criteria_.max_inner());
}


void
NonlinearSolver::Init(const Teuchos::RCP<SolverFnBase>& fn, const Epetra_BlockMap& map)
{
  fn_ = fn;

  int n = map.NumMyElements();
  auto xh = registry_->Allocate(origin_, "XLIN", VariableKind::REAL, n);
  auto duh = registry_->Allocate(origin_, "DX", VariableKind::REAL, n);
  relax_.Setup(n);

  x_ = Teuchos::rcp(new Epetra_Vector(View, map, registry_->GetReal(xh).getRawPtr()));
  du_ = Teuchos::rcp(new Epetra_Vector(View, map, registry_->GetReal(duh).getRawPtr()));
}


void
NonlinearSolver::Start(const Teuchos::RCP<Epetra_Vector>& u)
{
  if (fn_ == Teuchos::null) {
    Errors::Message msg("NonlinearSolver: Init() must be called before Start().");
    Exceptions::phreatic_throw(msg);
  }
  if (!u->Map().SameAs(x_->Map())) {
    Errors::Message msg("NonlinearSolver: the state does not match the map given to Init().");
    Exceptions::phreatic_throw(msg);
  }

  u_ = u;
  phase_ = Phase::ASSEMBLING;
  num_itrs_ = 0;
  inner_itrs_ = 0;
  total_inner_itrs_ = 0;
  linear_calls_ = 0;
  linear_code_ = 0;
  returned_code_ = SOLVER_CONTINUE;
  residual_ = 0.0;
  max_change_ = 0.0;
  relaxation_ = 1.0;
  location_ = DofLocation();
  history_.Reset();
  relax_.Reset();
}


bool
NonlinearSolver::finished() const
{
  return phase_ == Phase::CONVERGED || phase_ == Phase::MAX_OUTER_REACHED ||
         phase_ == Phase::FAILED;
}


NonlinearSolver::Phase
NonlinearSolver::Step()
{
  CheckStarted_();
  Phase old = phase_;

  switch (phase_) {
  case Phase::ASSEMBLING:
    Assemble_();
    break;
  case Phase::LINEAR_SOLVING:
    LinearSolve_();
    break;
  case Phase::UPDATING:
    Update_();
    break;
  case Phase::CONVERGENCE_CHECK:
    CheckConvergence_();
    break;
  default:
    break;
  }

  if (vo_->os_OK(Teuchos::VERB_EXTREME)) {
    Teuchos::OSTab tab = vo_->getOSTab();
    *vo_->os() << PhaseName(old) << " -> " << PhaseName(phase_) << std::endl;
  }
  return phase_;
}


int
NonlinearSolver::Solve(const Teuchos::RCP<Epetra_Vector>& u)
{
  Start(u);
  while (!finished()) Step();
  return returned_code_;
}


void
NonlinearSolver::Assemble_()
{
  num_itrs_++;
  fn_->Assemble(*u_);
  phase_ = Phase::LINEAR_SOLVING;
}


/* ******************************************************************
* Initial guess of the linear solve is the current state.
****************************************************************** */
void
NonlinearSolver::LinearSolve_()
{
  x_->Update(1.0, *u_, 0.0);

  linear_code_ = linear_->Solve(fn_->Matrix(), *fn_->Rhs(), *x_);
  linear_calls_++;
  inner_itrs_ = linear_->num_itrs();
  total_inner_itrs_ += inner_itrs_;
  residual_ = linear_->residual();

  if (linear_code_ > 0 || linear_code_ == LIN_SOLVER_MAX_ITERATIONS) {
    if (linear_code_ == LIN_SOLVER_MAX_ITERATIONS && vo_->os_OK(Teuchos::VERB_HIGH)) {
      Teuchos::OSTab tab = vo_->getOSTab();
      *vo_->os() << "outer itr " << num_itrs_ << ": linear solver reached " << inner_itrs_
                 << " iterations, ||r||=" << residual_ << std::endl;
    }
    phase_ = Phase::UPDATING;
    return;
  }

  IterationRecord record;
  record.outer_itr = num_itrs_;
  record.inner_itr = inner_itrs_;
  record.total_inner_itr = total_inner_itrs_;
  record.linear_code = linear_code_;
  record.residual = residual_;
  history_.Add(record);

  if (vo_->os_OK(Teuchos::VERB_LOW)) {
    Teuchos::OSTab tab = vo_->getOSTab();
    *vo_->os() << vo_->color("red") << "outer itr " << num_itrs_ << ": linear solver failed. "
               << linear_->DecodeErrorCode(linear_code_).what() << vo_->reset() << std::endl;
  }

  returned_code_ = SOLVER_LINEAR_SOLVER_ERROR;
  phase_ = Phase::FAILED;
}


void
NonlinearSolver::Update_()
{
  fn_->ComputeChange(*u_, *x_, *du_);

  // largest change, first one wins in (block, cell) order
  double big(0.0);
  location_ = DofLocation();
  int n = du_->MyLength();
  for (int i = 0; i < n; ++i) {
    if (!fn_->IsActive(i)) {
      (*du_)[i] = 0.0;
      continue;
    }
    if (location_.block < 0 || std::abs((*du_)[i]) > std::abs(big)) {
      big = (*du_)[i];
      location_ = fn_->Location(i);
    }
  }
  max_change_ = std::abs(big);

  relaxation_ = relax_.Apply(num_itrs_, big, *du_);

  if (max_head_change_ > 0.0) {
    for (int i = 0; i < n; ++i) {
      double& d = (*du_)[i];
      if (d > max_head_change_) d = max_head_change_;
      if (d < -max_head_change_) d = -max_head_change_;
    }
  }

  fn_->ApplyUpdate(*u_, *du_);

  IterationRecord record;
  record.outer_itr = num_itrs_;
  record.inner_itr = inner_itrs_;
  record.total_inner_itr = total_inner_itrs_;
  record.max_change = big;
  record.location = location_;
  record.linear_code = linear_code_;
  record.residual = residual_;
  record.relaxation = relaxation_;
  history_.Add(record);

  phase_ = Phase::CONVERGENCE_CHECK;
}


void
NonlinearSolver::CheckConvergence_()
{
  bool converged = criteria_.IsConverged(max_change_, residual_);

  if (vo_->os_OK(Teuchos::VERB_MEDIUM)) {
    Teuchos::OSTab tab = vo_->getOSTab();
    const IterationRecord& rec = history_.back();
    *vo_->os() << "outer itr " << num_itrs_ << ": inner=" << inner_itrs_
               << " max|dx|=" << max_change_ << " ||r||=" << residual_;
    if (vo_->os_OK(Teuchos::VERB_HIGH)) {
      *vo_->os() << " at block " << rec.location.block << " cell " << rec.location.local
                 << " relax=" << rec.relaxation;
    }
    *vo_->os() << std::endl;
  }

  if (converged) {
    returned_code_ = SOLVER_CONVERGED;
    phase_ = Phase::CONVERGED;
  } else if (num_itrs_ >= criteria_.max_outer()) {
    returned_code_ = SOLVER_MAX_ITERATIONS;
    phase_ = Phase::MAX_OUTER_REACHED;

    if (vo_->os_OK(Teuchos::VERB_LOW)) {
      Teuchos::OSTab tab = vo_->getOSTab();
      *vo_->os() << vo_->color("red") << "outer iteration did not converge in " << num_itrs_
                 << " iterations, max|dx|=" << max_change_ << " at block " << location_.block
                 << " cell " << location_.local << vo_->reset() << std::endl;
    }
  } else {
    phase_ = Phase::ASSEMBLING;
  }
}


void
NonlinearSolver::CheckStarted_() const
{
  if (u_ == Teuchos::null) {
    Errors::Message msg("NonlinearSolver: Start() must be called before Step().");
    Exceptions::phreatic_throw(msg);
  }
}


std::string
NonlinearSolver::PhaseName(Phase phase)
{
  switch (phase) {
  case Phase::ASSEMBLING:
    return "assembling";
  case Phase::LINEAR_SOLVING:
    return "linear solving";
  case Phase::UPDATING:
    return "updating";
  case Phase::CONVERGENCE_CHECK:
    return "convergence check";
  case Phase::CONVERGED:
    return "converged";
  case Phase::MAX_OUTER_REACHED:
    return "max outer reached";
  default:
    return "failed";
  }
}

} // namespace PhreaticSolvers
} // namespace Phreatic
