/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! The record of a run: outer iterations of every step and end-of-run totals.

#ifndef PHREATIC_RUN_REPORT_HH_
#define PHREATIC_RUN_REPORT_HH_

#include <ostream>
#include <string>
#include <vector>

#include "SolutionGroupCoordinator.hh"
#include "VariableRegistry.hh"

namespace Phreatic {

struct StepRecord {
  int kper;
  int kstp;
  double time;
  double dt;
  TimestepStatus status;
};


class RunReport {
 public:
  RunReport() : finalized_(false){};

  void AddStep(int kper, int kstp, double time, double dt, const TimestepStatus& status);

  // Captures the registry usage while the run's storage is still live.
  void Finalize(const VariableRegistry& registry);

  int num_steps() const { return steps_.size(); }
  const StepRecord& step(int i) const { return steps_[i]; }
  int NumFailedSteps() const;
  bool NormalTermination() const { return NumFailedSteps() == 0; }

  // totals over all steps and groups
  int TotalLinearCalls() const;
  int TotalInnerIterations() const;
  int TotalOuterIterations() const;

  const RegistryReport& registry_report() const { return registry_report_; }

  void Write(std::ostream& os) const;
  void WriteStep(std::ostream& os, const StepRecord& record) const;
  std::string TerminationMessage() const;

 private:
  std::vector<StepRecord> steps_;
  bool finalized_;
  RegistryReport registry_report_;
  std::string registry_summary_;
};

} // namespace Phreatic

#endif
