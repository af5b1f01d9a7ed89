/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <string>

#include "errors.hh"

#include "LinearSolverBiCGStab.hh"
#include "LinearSolverFactory.hh"
#include "LinearSolverPCG.hh"

namespace Phreatic {
namespace PhreaticSolvers {

/* ******************************************************************
* PCG is the default method.
****************************************************************** */
Teuchos::RCP<LinearSolver>
LinearSolverFactory::Create(Teuchos::ParameterList& slist,
                            const Teuchos::RCP<VariableRegistry>& registry,
                            const Key& origin)
{
  std::string method = slist.get<std::string>("iterative method", "pcg");

  Teuchos::RCP<LinearSolver> solver;
  if (method == "pcg") {
    solver = Teuchos::rcp(new LinearSolverPCG(registry, origin));
  } else if (method == "bicgstab") {
    solver = Teuchos::rcp(new LinearSolverBiCGStab(registry, origin));
  } else {
    Errors::Message msg;
    msg << "LinearSolverFactory: method \"" << method << "\" is not supported.";
    Exceptions::phreatic_throw(msg);
  }

  solver->Init(slist);
  return solver;
}

} // namespace PhreaticSolvers
} // namespace Phreatic
