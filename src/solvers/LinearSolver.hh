/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Preconditioned Krylov methods for the inner (linear) iteration.

/*!

A linear solver solves one assembled system A x = b.  On entry x holds the
initial guess, on exit the last iterate.  The returned code follows
LinearSolverDefs.hh: a positive value is the convergence criterion that was
met, LIN_SOLVER_MAX_ITERATIONS means the iteration cap was hit (the iterate
is still usable), and other negative values are failures.

A preconditioner is rebuilt from A at the beginning of every call.  If it
cannot be built (e.g. a row without a diagonal entry), the call returns
LIN_SOLVER_PRECONDITIONER_FAILED.  All work
vectors are registered in the VariableRegistry under the origin given at
construction, typically "<group>-linear".

.. _linear-solver-spec:
.. admonition:: linear-solver-spec

    * `"iterative method`" ``[string]`` **"pcg"** `"pcg`" or `"bicgstab`".
    * `"preconditioner type`" ``[string]`` **"ilu"** See Preconditioner.hh.
    * `"relaxation factor`" ``[double]`` **0.0** ILU relaxation.
    * `"error tolerance`" ``[double]`` **1.e-6** Tolerance on the residual.
    * `"maximum number of iterations`" ``[int]`` **100**
    * `"overflow tolerance`" ``[double]`` **3.e50** Residual above this
      value, or a non-finite residual, results in failure.
    * `"norm type`" ``[string]`` **"infinity norm"** or `"L2 norm`".
    * `"convergence criteria`" ``[Array(string)]``
      **"{absolute residual, make one iteration}"** Valid are
      `"relative rhs`", `"relative residual`", `"absolute residual`" and
      `"make one iteration`".  The first enabled of the first three is used.
    * `"inner head tolerance`" ``[double]`` **optional** If given, the
      maximum change of x in the last iteration must also be below it.
    * `"verbose object`" ``[verbose-object-spec]``

Example:

.. code-block:: xml

    <ParameterList name="linear solver">
      <Parameter name="iterative method" type="string" value="pcg"/>
      <Parameter name="preconditioner type" type="string" value="ilu"/>
      <Parameter name="relaxation factor" type="double" value="0.97"/>
      <Parameter name="error tolerance" type="double" value="1e-3"/>
      <Parameter name="maximum number of iterations" type="int" value="100"/>
      <ParameterList name="verbose object">
        <Parameter name="verbosity level" type="string" value="medium"/>
      </ParameterList>
    </ParameterList>

*/

#ifndef PHREATIC_LINEAR_SOLVER_HH_
#define PHREATIC_LINEAR_SOLVER_HH_

#include <string>

#include "Teuchos_RCP.hpp"
#include "Teuchos_ParameterList.hpp"
#include "Epetra_CrsMatrix.h"
#include "Epetra_Vector.h"

#include "errors.hh"
#include "Key.hh"
#include "VariableRegistry.hh"
#include "VerboseObject.hh"

#include "LinearSolverDefs.hh"
#include "Preconditioner.hh"

namespace Phreatic {
namespace PhreaticSolvers {

class LinearSolver {
 public:
  LinearSolver(const std::string& name,
               const Teuchos::RCP<VariableRegistry>& registry,
               const Key& origin);
  virtual ~LinearSolver() = default;

  void Init(Teuchos::ParameterList& plist);
  void Init()
  {
    Teuchos::ParameterList plist;
    Init(plist);
  }

  virtual int
  Solve(const Teuchos::RCP<const Epetra_CrsMatrix>& A, const Epetra_Vector& b, Epetra_Vector& x) = 0;

  // norm of b - A x in the configured norm
  double
  TrueResidual(const Epetra_CrsMatrix& A, const Epetra_Vector& b, const Epetra_Vector& x) const;

  // mutators
  void set_tolerance(double tol) { tol_ = tol; }
  void set_max_itrs(int max_itrs) { max_itrs_ = max_itrs; }
  void set_criteria(int criteria) { criteria_ = criteria; }
  void add_criteria(int criteria) { criteria_ |= criteria; }
  void set_overflow(double tol) { overflow_tol_ = tol; }
  void set_inner_head_tolerance(double tol) { inner_hclose_ = tol; }
  void set_preconditioner(const Teuchos::RCP<Preconditioner>& pc) { pc_ = pc; }

  // access
  double tolerance() const { return tol_; }
  int max_itrs() const { return max_itrs_; }
  int criteria() const { return criteria_; }
  int norm_type() const { return norm_type_; }
  double residual() const { return residual_; }
  int num_itrs() const { return num_itrs_; }
  int returned_code() const { return returned_code_; }
  const std::string& name() const { return name_; }
  const Key& origin() const { return origin_; }
  Teuchos::RCP<const Preconditioner> preconditioner() const { return pc_; }

  // to recuperate from a crash, we post-process errors here
  Errors::Message DecodeErrorCode(int ierr) const;

 protected:
  double Norm_(const Epetra_Vector& v) const;

  // Returns the criterion met, or zero. dxmax is the largest change of the
  // iterate in the last iteration.
  int CheckConvergence_(double rnorm, double fnorm, double rnorm0, double dxmax) const;

  // View of a registry work vector, allocated on first use.
  Teuchos::RCP<Epetra_Vector> WorkVector_(const Key& name, const Epetra_BlockMap& map);

  void CheckInitialized_(const Epetra_CrsMatrix& A, const Epetra_Vector& b, const Epetra_Vector& x) const;

  // Rebuilds the preconditioner from A. Returns zero on success, otherwise
  // LIN_SOLVER_PRECONDITIONER_FAILED with x unchanged.
  int UpdatePreconditioner_(const Teuchos::RCP<const Epetra_CrsMatrix>& A,
                            const Epetra_Vector& b,
                            const Epetra_Vector& x);

 protected:
  std::string name_;
  Teuchos::RCP<VariableRegistry> registry_;
  Key origin_;
  Teuchos::RCP<VerboseObject> vo_;
  Teuchos::RCP<Preconditioner> pc_;

  int max_itrs_, criteria_, norm_type_;
  double tol_, overflow_tol_, inner_hclose_;

  int num_itrs_, returned_code_;
  double residual_;
  bool initialized_;

 private:
  LinearSolver(const LinearSolver& other); // not implemented
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
