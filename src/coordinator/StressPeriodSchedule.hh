/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Stress periods and the time steps within them.
/*!

`"stress periods`" holds one sublist per period, in simulation order:

* `"length`" ``[double]`` Duration of the period, positive.
* `"number of steps`" ``[int]`` **1** At least one.
* `"multiplier`" ``[double]`` **1.0** Ratio of successive step sizes, positive.

With n steps and multiplier m the first step is length (1 - m)/(1 - m^n),
or length / n for m = 1.  The last step takes whatever remains of the
period, so the steps of a period add up to its length exactly.

*/

#ifndef PHREATIC_STRESS_PERIOD_SCHEDULE_HH_
#define PHREATIC_STRESS_PERIOD_SCHEDULE_HH_

#include <vector>

#include "Teuchos_ParameterList.hpp"

namespace Phreatic {

struct StressPeriod {
  double length;
  int nsteps;
  double multiplier;
};


class StressPeriodSchedule {
 public:
  StressPeriodSchedule(){};
  explicit StressPeriodSchedule(Teuchos::ParameterList& plist);

  // validated on insertion
  void AddPeriod(double length, int nsteps, double multiplier);

  int num_periods() const { return periods_.size(); }
  const StressPeriod& period(int iper) const { return periods_[iper]; }

  std::vector<double> StepSizes(int iper) const;

  int TotalSteps() const;
  double TotalLength() const;

 private:
  std::vector<StressPeriod> periods_;
};

} // namespace Phreatic

#endif
