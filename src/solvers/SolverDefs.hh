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

#ifndef PHREATIC_SOLVER_DEFS_HH_
#define PHREATIC_SOLVER_DEFS_HH_

namespace Phreatic {
namespace PhreaticSolvers {

const int SOLVER_CONTINUE = 1;
const int SOLVER_CONVERGED = 0;

const int SOLVER_MAX_ITERATIONS = -1;
const int SOLVER_LINEAR_SOLVER_ERROR = -8;

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
