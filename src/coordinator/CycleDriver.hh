/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! The top level loop over stress periods and time steps.
/*!

`"cycle driver`" list:

* `"start time`" ``[double]`` **0.0**
* `"stress periods`" ``[list]`` See StressPeriodSchedule.
* `"continue on failure`" ``[bool]`` **true** When false, the run stops
  after the first time step that does not converge.  Either way the step is
  recorded and the run does not terminate normally.
* `"verbose object`" ``[verbose-object-spec]``

The remaining top level lists (`"models`", `"exchanges`",
`"solution groups`") are passed to the SolutionGroupCoordinator.

Each step advances the time, starts the step in all groups, solves the
groups, records the outcome in the RunReport and accepts the state of the
step, converged or not.  The last step of a period ends exactly at the sum
of the start time and the lengths of the periods so far.

*/

#ifndef PHREATIC_CYCLE_DRIVER_HH_
#define PHREATIC_CYCLE_DRIVER_HH_

#include "Teuchos_ParameterList.hpp"
#include "Teuchos_RCP.hpp"

#include "PhreaticTypes.hh"
#include "RunReport.hh"
#include "SolutionGroupCoordinator.hh"
#include "StressPeriodSchedule.hh"
#include "VariableRegistry.hh"
#include "VerboseObject.hh"

namespace Phreatic {

class CycleDriver {
 public:
  CycleDriver(Teuchos::ParameterList& plist,
              const Teuchos::RCP<VariableRegistry>& registry,
              const Comm_ptr_type& comm);

  // Runs the simulation and releases its storage.  Returns 0 on normal
  // termination and 1 if any time step failed.
  int Go();

  const RunReport& report() const { return report_; }
  const StressPeriodSchedule& schedule() const { return schedule_; }
  const SolutionGroupCoordinator& coordinator() const { return *coordinator_; }
  double time() const { return t_; }
  bool continue_on_failure() const { return continue_on_failure_; }

 private:
  Teuchos::RCP<VariableRegistry> registry_;
  Teuchos::RCP<VerboseObject> vo_;
  Teuchos::RCP<SolutionGroupCoordinator> coordinator_;
  StressPeriodSchedule schedule_;
  RunReport report_;

  double t0_, t_;
  bool continue_on_failure_;
};

} // namespace Phreatic

#endif
