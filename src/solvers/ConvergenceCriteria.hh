/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Closure criteria and iteration caps of a solution group.

/*!

Read once from the `"nonlinear solver`" list and immutable afterwards.

* `"head closure`" ``[double]`` **1.e-4** Maximum absolute change of the
  state in an outer iteration for convergence.
* `"residual closure`" ``[double]`` **1.e-3** Maximum residual norm of the
  last linear solve for convergence.  Also the tolerance of the linear solver.
* `"maximum number of outer iterations`" ``[int]`` **500**
* `"maximum number of inner iterations`" ``[int]`` **100** Iteration cap of
  each linear solve.

*/

#ifndef PHREATIC_CONVERGENCE_CRITERIA_HH_
#define PHREATIC_CONVERGENCE_CRITERIA_HH_

#include "Teuchos_ParameterList.hpp"

namespace Phreatic {
namespace PhreaticSolvers {

class ConvergenceCriteria {
 public:
  ConvergenceCriteria() : head_close_(1e-4), residual_close_(1e-3), max_outer_(500), max_inner_(100){};
  explicit ConvergenceCriteria(Teuchos::ParameterList& plist);

  double head_close() const { return head_close_; }
  double residual_close() const { return residual_close_; }
  int max_outer() const { return max_outer_; }
  int max_inner() const { return max_inner_; }

  // both closure tests
  bool IsConverged(double max_change, double residual) const
  {
    return max_change <= head_close_ && residual <= residual_close_;
  }

 private:
  double head_close_, residual_close_;
  int max_outer_, max_inner_;
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
