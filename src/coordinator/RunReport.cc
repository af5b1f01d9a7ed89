/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <sstream>

#include "boost/format.hpp"

#include "RunReport.hh"

namespace Phreatic {

void
RunReport::AddStep(int kper, int kstp, double time, double dt, const TimestepStatus& status)
{
  steps_.push_back(StepRecord{ kper, kstp, time, dt, status });
}


void
RunReport::Finalize(const VariableRegistry& registry)
{
  registry_report_ = registry.Report();
  std::stringstream ss;
  registry.WriteSummary(ss);
  registry_summary_ = ss.str();
  finalized_ = true;
}


int
RunReport::NumFailedSteps() const
{
  int n(0);
  for (const auto& s : steps_) {
    if (!s.status.converged) n++;
  }
  return n;
}


int
RunReport::TotalLinearCalls() const
{
  int n(0);
  for (const auto& s : steps_) {
    for (const auto& g : s.status.groups) n += g.linear_calls;
  }
  return n;
}


int
RunReport::TotalInnerIterations() const
{
  int n(0);
  for (const auto& s : steps_) {
    for (const auto& g : s.status.groups) n += g.total_inner_itrs;
  }
  return n;
}


int
RunReport::TotalOuterIterations() const
{
  int n(0);
  for (const auto& s : steps_) {
    for (const auto& g : s.status.groups) n += g.num_itrs;
  }
  return n;
}


std::string
RunReport::TerminationMessage() const
{
  int nfailed = NumFailedSteps();
  if (nfailed == 0) return "Normal termination";

  std::stringstream ss;
  ss << "Failure: " << nfailed << " time steps did not converge";
  return ss.str();
}


void
RunReport::WriteStep(std::ostream& os, const StepRecord& record) const
{
  for (const auto& g : record.status.groups) {
    os << boost::format("\n%s: stress period %d, time step %d, time %.6g, dt %.6g\n") % g.name %
            (record.kper + 1) % (record.kstp + 1) % record.time % record.dt;
    g.history.Write(os, g.block_names);

    if (g.converged()) {
      os << boost::format("%d outer iterations, %d total inner iterations\n") % g.num_itrs %
              g.total_inner_itrs;
    } else {
      os << boost::format("did not converge after %d outer iterations (code %d)\n") %
              g.num_itrs % g.code;
    }
  }
}


void
RunReport::Write(std::ostream& os) const
{
  for (const auto& s : steps_) WriteStep(os, s);

  os << "\nSummary\n";
  os << boost::format("  %-32s %10d\n") % "time steps" % num_steps();
  os << boost::format("  %-32s %10d\n") % "failed time steps" % NumFailedSteps();
  os << boost::format("  %-32s %10d\n") % "outer iterations" % TotalOuterIterations();
  os << boost::format("  %-32s %10d\n") % "linear solver calls" % TotalLinearCalls();
  os << boost::format("  %-32s %10d\n") % "inner iterations" % TotalInnerIterations();

  if (finalized_) {
    os << boost::format("  %-32s %10d\n") % "integer variables" % registry_report_.num_integer;
    os << boost::format("  %-32s %10d\n") % "real variables" % registry_report_.num_real;
    os << boost::format("  %-32s %10d\n") % "total memory (bytes)" % registry_report_.total_bytes;
    os << "\n" << registry_summary_;
  }

  os << "\n" << TerminationMessage() << std::endl;
}

} // namespace Phreatic
