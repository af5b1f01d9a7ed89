/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <cmath>

#include "errors.hh"
#include "StressPeriodSchedule.hh"

namespace Phreatic {

StressPeriodSchedule::StressPeriodSchedule(Teuchos::ParameterList& plist)
{
  if (!plist.isSublist("stress periods")) {
    Errors::Message msg("StressPeriodSchedule: sublist \"stress periods\" is missing.");
    Exceptions::phreatic_throw(msg);
  }

  Teuchos::ParameterList& splist = plist.sublist("stress periods");
  for (auto it = splist.begin(); it != splist.end(); ++it) {
    const std::string& name = splist.name(it);
    if (!splist.isSublist(name)) continue;

    Teuchos::ParameterList& sp = splist.sublist(name);
    if (!sp.isParameter("length")) {
      Errors::Message msg;
      msg << "StressPeriodSchedule: period \"" << name << "\" has no \"length\".";
      Exceptions::phreatic_throw(msg);
    }
    AddPeriod(sp.get<double>("length"),
              sp.get<int>("number of steps", 1),
              sp.get<double>("multiplier", 1.0));
  }

  if (periods_.empty()) {
    Errors::Message msg("StressPeriodSchedule: no stress periods are defined.");
    Exceptions::phreatic_throw(msg);
  }
}


void
StressPeriodSchedule::AddPeriod(double length, int nsteps, double multiplier)
{
  int iper = periods_.size() + 1;
  if (!(length > 0.0)) {
    Errors::Message msg;
    msg << "StressPeriodSchedule: period " << iper << " has non-positive length " << length;
    Exceptions::phreatic_throw(msg);
  }
  if (nsteps < 1) {
    Errors::Message msg;
    msg << "StressPeriodSchedule: period " << iper << " has " << nsteps << " steps";
    Exceptions::phreatic_throw(msg);
  }
  if (!(multiplier > 0.0)) {
    Errors::Message msg;
    msg << "StressPeriodSchedule: period " << iper << " has non-positive multiplier "
        << multiplier;
    Exceptions::phreatic_throw(msg);
  }
  periods_.push_back(StressPeriod{ length, nsteps, multiplier });
}


/* ******************************************************************
* Geometric sequence of step sizes.
****************************************************************** */
std::vector<double>
StressPeriodSchedule::StepSizes(int iper) const
{
  if (iper < 0 || iper >= periods_.size()) {
    Errors::Message msg;
    msg << "StressPeriodSchedule: period index " << iper << " is out of range.";
    Exceptions::phreatic_throw(msg);
  }

  const StressPeriod& sp = periods_[iper];
  int n = sp.nsteps;
  double m = sp.multiplier;

  double dt = (m == 1.0) ? sp.length / n : sp.length * (1.0 - m) / (1.0 - std::pow(m, n));

  std::vector<double> dts(n);
  double sum(0.0);
  for (int i = 0; i < n - 1; ++i) {
    dts[i] = dt;
    sum += dt;
    dt *= m;
  }
  dts[n - 1] = sp.length - sum;
  return dts;
}


int
StressPeriodSchedule::TotalSteps() const
{
  int n(0);
  for (const auto& sp : periods_) n += sp.nsteps;
  return n;
}


double
StressPeriodSchedule::TotalLength() const
{
  double t(0.0);
  for (const auto& sp : periods_) t += sp.length;
  return t;
}

} // namespace Phreatic
