/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "errors.hh"
#include "CycleDriver.hh"

namespace Phreatic {

CycleDriver::CycleDriver(Teuchos::ParameterList& plist,
                         const Teuchos::RCP<VariableRegistry>& registry,
                         const Comm_ptr_type& comm)
  : registry_(registry), schedule_(plist.sublist("cycle driver"))
{
  Teuchos::ParameterList& cd_list = plist.sublist("cycle driver");
  vo_ = Teuchos::rcp(new VerboseObject("CycleDriver", cd_list));

  t0_ = cd_list.get<double>("start time", 0.0);
  t_ = t0_;
  continue_on_failure_ = cd_list.get<bool>("continue on failure", true);

  coordinator_ = Teuchos::rcp(new SolutionGroupCoordinator(plist, registry_, comm));
}


/* ******************************************************************
* Periods, then steps, then groups, each in order.
****************************************************************** */
int
CycleDriver::Go()
{
  coordinator_->Setup();
  coordinator_->Initialize();

  t_ = t0_;
  double tstart(t0_);
  bool stop(false);

  for (int kper = 0; kper < schedule_.num_periods() && !stop; ++kper) {
    std::vector<double> dts = schedule_.StepSizes(kper);

    if (vo_->os_OK(Teuchos::VERB_MEDIUM)) {
      Teuchos::OSTab tab = vo_->getOSTab();
      *vo_->os() << "stress period " << kper + 1 << ": " << dts.size() << " steps, length "
                 << schedule_.period(kper).length << std::endl;
    }

    // time is measured from the start of the period, the last step ends it exactly
    double tend = tstart + schedule_.period(kper).length;
    double elapsed(0.0);
    for (int kstp = 0; kstp < dts.size(); ++kstp) {
      double dt = dts[kstp];
      elapsed += dt;
      t_ = (kstp + 1 == dts.size()) ? tend : tstart + elapsed;

      coordinator_->InitializeTimestep(t_, dt);
      TimestepStatus status = coordinator_->SolveTimestep(kper, kstp);
      report_.AddStep(kper, kstp, t_, dt, status);
      coordinator_->FinalizeTimestep();

      if (vo_->os_OK(Teuchos::VERB_HIGH)) {
        Teuchos::OSTab tab = vo_->getOSTab();
        *vo_->os() << "step " << kstp + 1 << " t=" << t_ << " dt=" << dt
                   << (status.converged ? " converged" : " FAILED") << std::endl;
      }

      if (!status.converged && !continue_on_failure_) {
        if (vo_->os_OK(Teuchos::VERB_LOW)) {
          Teuchos::OSTab tab = vo_->getOSTab();
          *vo_->os() << vo_->color("red") << "stopping: period " << kper + 1 << ", step "
                     << kstp + 1 << " failed in solution group \"" << status.failed_group_name
                     << "\"" << vo_->reset() << std::endl;
        }
        stop = true;
        break;
      }
    }
    tstart = tend;
  }

  report_.Finalize(*registry_);
  coordinator_->Teardown();

  return report_.NormalTermination() ? 0 : 1;
}

} // namespace Phreatic
