/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "Teuchos_Array.hpp"

#include "errors.hh"
#include "Exchange_Factory.hh"
#include "Model_Factory.hh"
#include "SolutionGroupCoordinator.hh"
#include "SolverDefs.hh"

namespace Phreatic {

bool
GroupResult::converged() const
{
  return code == PhreaticSolvers::SOLVER_CONVERGED;
}


/* ******************************************************************
* Creates models, exchanges and groups from the input.
****************************************************************** */
SolutionGroupCoordinator::SolutionGroupCoordinator(Teuchos::ParameterList& plist,
                                                   const Teuchos::RCP<VariableRegistry>& registry,
                                                   const Comm_ptr_type& comm)
  : registry_(registry)
{
  vo_ = Teuchos::rcp(new VerboseObject("Coordinator", plist));

  // models
  std::map<Key, Teuchos::RCP<ModelBase>> models;
  std::map<Key, Key> owner;
  ModelFactory model_factory;
  Teuchos::ParameterList& mlist = plist.sublist("models");
  for (auto it = mlist.begin(); it != mlist.end(); ++it) {
    const Key& name = mlist.name(it);
    if (!mlist.isSublist(name)) continue;
    models[name] = model_factory.CreateModel(name, mlist.sublist(name));
  }

  // exchanges
  std::map<Key, Teuchos::RCP<ExchangeBase>> exchanges;
  std::map<Key, Key> exchange_owner;
  ExchangeFactory exchange_factory;
  Teuchos::ParameterList& elist = plist.sublist("exchanges");
  for (auto it = elist.begin(); it != elist.end(); ++it) {
    const Key& name = elist.name(it);
    if (!elist.isSublist(name)) continue;
    exchanges[name] = exchange_factory.CreateExchange(name, elist.sublist(name));
  }

  // groups
  Teuchos::ParameterList& glist = plist.sublist("solution groups");
  for (auto it = glist.begin(); it != glist.end(); ++it) {
    const Key& gname = glist.name(it);
    if (!glist.isSublist(gname)) continue;
    Teuchos::ParameterList& gplist = glist.sublist(gname);

    auto group = Teuchos::rcp(new SolutionGroup(gname, gplist, registry_, comm));

    auto mnames = gplist.get<Teuchos::Array<std::string>>("models", Teuchos::Array<std::string>());
    for (const auto& mname : mnames) {
      if (models.find(mname) == models.end()) {
        Errors::NotFoundError msg;
        msg << "Coordinator: solution group \"" << gname << "\" refers to unknown model \""
            << mname << "\".";
        Exceptions::phreatic_throw(msg);
      }
      if (owner.find(mname) != owner.end()) {
        Errors::DuplicateNameError msg;
        msg << "Coordinator: model \"" << mname << "\" belongs to groups \"" << owner[mname]
            << "\" and \"" << gname << "\".";
        Exceptions::phreatic_throw(msg);
      }
      owner[mname] = gname;
      group->AddModel(models[mname]);
    }

    auto enames =
      gplist.get<Teuchos::Array<std::string>>("exchanges", Teuchos::Array<std::string>());
    for (const auto& ename : enames) {
      if (exchanges.find(ename) == exchanges.end()) {
        Errors::NotFoundError msg;
        msg << "Coordinator: solution group \"" << gname << "\" refers to unknown exchange \""
            << ename << "\".";
        Exceptions::phreatic_throw(msg);
      }
      if (exchange_owner.find(ename) != exchange_owner.end()) {
        Errors::DuplicateNameError msg;
        msg << "Coordinator: exchange \"" << ename << "\" belongs to groups \""
            << exchange_owner[ename] << "\" and \"" << gname << "\".";
        Exceptions::phreatic_throw(msg);
      }
      exchange_owner[ename] = gname;
      group->AddExchange(exchanges[ename]);
    }

    groups_.push_back(group);
  }

  if (groups_.empty()) {
    Errors::Message msg("Coordinator: no solution groups are defined.");
    Exceptions::phreatic_throw(msg);
  }

  for (const auto& model : models) {
    if (owner.find(model.first) == owner.end()) {
      Errors::Message msg;
      msg << "Coordinator: model \"" << model.first << "\" is not in any solution group.";
      Exceptions::phreatic_throw(msg);
    }
  }
}


void
SolutionGroupCoordinator::Setup()
{
  for (auto& group : groups_) group->Setup();
}


void
SolutionGroupCoordinator::Initialize()
{
  for (auto& group : groups_) group->Initialize();
}


void
SolutionGroupCoordinator::InitializeTimestep(double t, double dt)
{
  for (auto& group : groups_) group->InitializeTimestep(t, dt);
}


/* ******************************************************************
* Every group is solved even after a failure so that the report is
* complete; the first failure is the one reported as the step failure.
****************************************************************** */
TimestepStatus
SolutionGroupCoordinator::SolveTimestep(int kper, int kstp)
{
  TimestepStatus status;

  for (int i = 0; i < groups_.size(); ++i) {
    SolutionGroup& group = *groups_[i];
    int code = group.Solve();

    const auto& solver = group.nonlinear_solver();
    GroupResult result;
    result.name = group.name();
    result.block_names = group.block_names();
    result.code = code;
    result.num_itrs = solver.num_itrs();
    result.linear_calls = solver.linear_calls();
    result.total_inner_itrs = solver.total_inner_itrs();
    result.max_change = solver.max_change();
    result.location = solver.max_change_location();
    result.history = solver.history();

    if (!result.converged()) {
      ReportFailure_(kper, kstp, result);
      if (status.converged) {
        status.converged = false;
        status.failed_group = i;
        status.failed_group_name = result.name;
      }
    }
    status.groups.push_back(result);
  }
  return status;
}


void
SolutionGroupCoordinator::FinalizeTimestep()
{
  for (auto& group : groups_) group->FinalizeTimestep();
}


void
SolutionGroupCoordinator::Teardown()
{
  for (auto& group : groups_) group->Teardown();
}


const SolutionGroup&
SolutionGroupCoordinator::group(const Key& name) const
{
  for (const auto& group : groups_) {
    if (group->name() == name) return *group;
  }
  Errors::NotFoundError msg;
  msg << "Coordinator: no solution group \"" << name << "\".";
  Exceptions::phreatic_throw(msg);
  return *groups_[0];
}


void
SolutionGroupCoordinator::ReportFailure_(int kper, int kstp, const GroupResult& result) const
{
  if (vo_->os_OK(Teuchos::VERB_LOW)) {
    Teuchos::OSTab tab = vo_->getOSTab();
    *vo_->os() << vo_->color("red") << "period " << kper + 1 << ", step " << kstp + 1
               << ": solution group \"" << result.name << "\" did not converge (code "
               << result.code << ") after " << result.num_itrs << " outer iterations";
    if (result.location.block >= 0) {
      *vo_->os() << ", largest change " << result.max_change << " in model \""
                 << result.block_names[result.location.block] << "\" cell "
                 << result.location.local + 1;
    }
    *vo_->os() << vo_->reset() << std::endl;
  }
}

} // namespace Phreatic
