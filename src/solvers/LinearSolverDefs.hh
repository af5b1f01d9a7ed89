/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

/*
  Solvers

*/

#ifndef PHREATIC_LINEAR_SOLVER_DEFS_HH_
#define PHREATIC_LINEAR_SOLVER_DEFS_HH_

namespace Phreatic {
namespace PhreaticSolvers {

// Note: these are powers of 2 to allow multiple convergence criteria, each of
// which can be turned on or off.  Convergence is met if the first enabled
// criterion in the order below is met.  The exception is ONE_ITERATION,
// which requires at least one iteration independent of the initial residual.
const int LIN_SOLVER_RELATIVE_RHS = 1; // must be power of 2
const int LIN_SOLVER_RELATIVE_RESIDUAL = 2;
const int LIN_SOLVER_ABSOLUTE_RESIDUAL = 4;
const int LIN_SOLVER_MAKE_ONE_ITERATION = 8;

const int LIN_SOLVER_NON_SPD_APPLY = -1;
const int LIN_SOLVER_NON_SPD_APPLY_INVERSE = -1;
const int LIN_SOLVER_MAX_ITERATIONS = -2;
const int LIN_SOLVER_RESIDUAL_OVERFLOW = -3;
const int LIN_SOLVER_BREAKDOWN = -4;
const int LIN_SOLVER_PRECONDITIONER_FAILED = -5;

const int LIN_SOLVER_NORM_LINF = 0;
const int LIN_SOLVER_NORM_L2 = 1;

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
