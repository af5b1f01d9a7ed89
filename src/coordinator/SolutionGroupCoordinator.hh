/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Builds the solution groups of a simulation and solves them once per time step.
/*!

The coordinator creates all models of the `"models`" list and all exchanges
of the `"exchanges`" list with their factories, then the groups of the
`"solution groups`" list in the order they are declared.  Every model must
belong to exactly one group.

.. code-block:: xml

  <ParameterList name="models">
    <ParameterList name="GWF_1">
      <Parameter name="model type" type="string" value="groundwater flow"/>
      ...
    </ParameterList>
  </ParameterList>
  <ParameterList name="exchanges"/>
  <ParameterList name="solution groups">
    <ParameterList name="SLN_1">
      <Parameter name="models" type="Array(string)" value="{GWF_1}"/>
      <ParameterList name="nonlinear solver"> ... </ParameterList>
      <ParameterList name="linear solver"> ... </ParameterList>
    </ParameterList>
  </ParameterList>

Groups are solved in declaration order.  A group solved later in a time
step sees the states, converged or not, of the groups solved before it.

*/

#ifndef PHREATIC_SOLUTION_GROUP_COORDINATOR_HH_
#define PHREATIC_SOLUTION_GROUP_COORDINATOR_HH_

#include <map>
#include <vector>

#include "Teuchos_ParameterList.hpp"
#include "Teuchos_RCP.hpp"

#include "ExchangeBase.hh"
#include "IterationHistory.hh"
#include "Key.hh"
#include "ModelBase.hh"
#include "PhreaticTypes.hh"
#include "SolutionGroup.hh"
#include "VariableRegistry.hh"
#include "VerboseObject.hh"

namespace Phreatic {

// Outcome of one group in one time step.
struct GroupResult {
  Key name;
  KeyVector block_names;
  int code = 0;
  int num_itrs = 0;
  int linear_calls = 0;
  int total_inner_itrs = 0;
  double max_change = 0.0;
  DofLocation location;
  PhreaticSolvers::IterationHistory history;

  bool converged() const;
};


struct TimestepStatus {
  bool converged = true;
  int failed_group = -1;
  Key failed_group_name;
  std::vector<GroupResult> groups;
};


class SolutionGroupCoordinator {
 public:
  SolutionGroupCoordinator(Teuchos::ParameterList& plist,
                           const Teuchos::RCP<VariableRegistry>& registry,
                           const Comm_ptr_type& comm);

  void Setup();
  void Initialize();
  void InitializeTimestep(double t, double dt);

  // Solves all groups of time step kstp of stress period kper, both 0-based.
  TimestepStatus SolveTimestep(int kper, int kstp);

  void FinalizeTimestep();
  void Teardown();

  int num_groups() const { return groups_.size(); }
  const SolutionGroup& group(int i) const { return *groups_[i]; }
  const SolutionGroup& group(const Key& name) const;

 private:
  void ReportFailure_(int kper, int kstp, const GroupResult& result) const;

 private:
  Teuchos::RCP<VariableRegistry> registry_;
  Teuchos::RCP<VerboseObject> vo_;
  std::vector<Teuchos::RCP<SolutionGroup>> groups_;
};

} // namespace Phreatic

#endif
