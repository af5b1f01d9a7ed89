/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Creates and initializes a linear solver from the parameter "iterative method".

#ifndef PHREATIC_LINEAR_SOLVER_FACTORY_HH_
#define PHREATIC_LINEAR_SOLVER_FACTORY_HH_

#include "Teuchos_RCP.hpp"
#include "Teuchos_ParameterList.hpp"

#include "Key.hh"
#include "LinearSolver.hh"
#include "VariableRegistry.hh"

namespace Phreatic {
namespace PhreaticSolvers {

class LinearSolverFactory {
 public:
  LinearSolverFactory(){};
  ~LinearSolverFactory(){};

  Teuchos::RCP<LinearSolver> Create(Teuchos::ParameterList& slist,
                                    const Teuchos::RCP<VariableRegistry>& registry,
                                    const Key& origin);
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
