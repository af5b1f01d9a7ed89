/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Outer (Picard) iteration of a solution group.

/*!

The outer iteration is an explicit state machine.  Each call to Step()
performs exactly one transition:

  ASSEMBLING -> LINEAR_SOLVING -> UPDATING -> CONVERGENCE_CHECK
  CONVERGENCE_CHECK -> ASSEMBLING | CONVERGED | MAX_OUTER_REACHED
  LINEAR_SOLVING -> FAILED   (the linear solver diverged)

* ASSEMBLING increments the outer counter and asks the SolverFnBase for A
  and b at the current state u.
* LINEAR_SOLVING solves A x = b starting from x = u.  Hitting the inner
  iteration cap is recorded but the iterate is used.
* UPDATING computes du = x - u through SolverFnBase::ComputeChange(), finds the
  largest |du| over active degrees of freedom (the first one in block then
  cell order wins ties), damps du, limits it by the maximum head change and
  applies it.
* CONVERGENCE_CHECK tests max|du| <= head closure and the last linear
  residual <= residual closure.

Solve() returns SOLVER_CONVERGED, SOLVER_MAX_ITERATIONS or
SOLVER_LINEAR_SOLVER_ERROR.

.. _nonlinear-solver-spec:
.. admonition:: nonlinear-solver-spec

   * `"head closure`", `"residual closure`",
     `"maximum number of outer iterations`",
     `"maximum number of inner iterations`"  See ConvergenceCriteria.hh.
     The residual closure and the inner cap replace the tolerance and the
     iteration cap of the linear solver.
   * `"under relaxation`" and its parameters, see UnderRelaxation.hh.
   * `"maximum head change`" ``[double]`` **optional** Limits every entry
     of the applied update.
   * `"verbose object`" ``[verbose-object-spec]``

*/

#ifndef PHREATIC_NONLINEAR_SOLVER_HH_
#define PHREATIC_NONLINEAR_SOLVER_HH_

#include <string>

#include "Teuchos_RCP.hpp"
#include "Teuchos_ParameterList.hpp"
#include "Epetra_BlockMap.h"
#include "Epetra_Vector.h"

#include "Key.hh"
#include "VariableRegistry.hh"
#include "VerboseObject.hh"

#include "ConvergenceCriteria.hh"
#include "IterationHistory.hh"
#include "LinearSolver.hh"
#include "SolverDefs.hh"
#include "SolverFnBase.hh"
#include "UnderRelaxation.hh"

namespace Phreatic {
namespace PhreaticSolvers {

class NonlinearSolver {
 public:
  enum class Phase {
    ASSEMBLING,
    LINEAR_SOLVING,
    UPDATING,
    CONVERGENCE_CHECK,
    CONVERGED,
    MAX_OUTER_REACHED,
    FAILED
  };

  NonlinearSolver(Teuchos::ParameterList& plist,
                  const Teuchos::RCP<LinearSolver>& linear,
                  const Teuchos::RCP<VariableRegistry>& registry,
                  const Key& origin);

  // Allocates work storage for the system of the given map.
  void Init(const Teuchos::RCP<SolverFnBase>& fn, const Epetra_BlockMap& map);

  // Resets counters and history, and starts from the state u.
  void Start(const Teuchos::RCP<Epetra_Vector>& u);

  // One transition of the state machine. Returns the new phase.
  Phase Step();

  // Start() followed by Step() until a terminal phase.
  int Solve(const Teuchos::RCP<Epetra_Vector>& u);

  bool finished() const;
  static std::string PhaseName(Phase phase);

  // access
  Phase phase() const { return phase_; }
  int num_itrs() const { return num_itrs_; }
  int num_inner_itrs() const { return inner_itrs_; }
  int total_inner_itrs() const { return total_inner_itrs_; }
  int linear_calls() const { return linear_calls_; }
  double residual() const { return residual_; }
  double max_change() const { return max_change_; }
  DofLocation max_change_location() const { return location_; }
  int returned_code() const { return returned_code_; }

  const ConvergenceCriteria& criteria() const { return criteria_; }
  const IterationHistory& history() const { return history_; }
  const LinearSolver& linear_solver() const { return *linear_; }
  const UnderRelaxation& under_relaxation() const { return relax_; }

 private:
  void Assemble_();
  void LinearSolve_();
  void Update_();
  void CheckConvergence_();

  void CheckStarted_() const;

 private:
  Teuchos::RCP<LinearSolver> linear_;
  Teuchos::RCP<VariableRegistry> registry_;
  Key origin_;
  Teuchos::RCP<VerboseObject> vo_;

  ConvergenceCriteria criteria_;
  UnderRelaxation relax_;
  double max_head_change_;

  Teuchos::RCP<SolverFnBase> fn_;
  Teuchos::RCP<Epetra_Vector> u_, x_, du_;

  Phase phase_;
  int num_itrs_, inner_itrs_, total_inner_itrs_, linear_calls_;
  int linear_code_, returned_code_;
  double residual_, max_change_, relaxation_;
  DofLocation location_;
  IterationHistory history_;
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
