/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <sstream>
#include <string>

#include "Teuchos_Array.hpp"
#include "Teuchos_ParameterList.hpp"
#include "Teuchos_RCP.hpp"
#include "UnitTest++.h"

#include "CycleDriver.hh"
#include "errors.hh"
#include "LinearSolverDefs.hh"
#include "PhreaticComm.hh"
#include "RunReport.hh"
#include "SolutionGroupCoordinator.hh"
#include "SolverDefs.hh"
#include "VariableRegistry.hh"

#include "coordinator_test_models.hh"

// registration files
#include "flow_registration.hh"

namespace Phreatic {
namespace Testing {
RegisteredModelFactory<ScriptedModel> ScriptedModel::reg_("scripted");
RegisteredModelFactory<FollowerModel> FollowerModel::reg_("follower");
}
} // namespace Phreatic

using namespace Phreatic;

namespace {

void
AddGroup(Teuchos::ParameterList& plist,
         const std::string& name,
         const Teuchos::Array<std::string>& models,
         int max_outer)
{
  auto& glist = plist.sublist("solution groups").sublist(name);
  glist.setParameters(Testing::SolverLists(max_outer));
  glist.set<Teuchos::Array<std::string>>("models", models);
}


void
AddPeriod(Teuchos::ParameterList& plist, const std::string& name, double length, int n, double m)
{
  auto& sp = plist.sublist("cycle driver").sublist("stress periods").sublist(name);
  sp.set<double>("length", length);
  sp.set<int>("number of steps", n);
  sp.set<double>("multiplier", m);
}


Teuchos::ParameterList
BaseList()
{
  Teuchos::ParameterList plist;
  plist.sublist("verbose object").set<std::string>("verbosity level", "none");
  plist.sublist("cycle driver").sublist("verbose object").set<std::string>("verbosity level",
                                                                           "none");
  return plist;
}


// a model that never settles: every outer iteration changes it by one
Teuchos::ParameterList
RestlessModel()
{
  Teuchos::ParameterList mlist;
  mlist.set<std::string>("model type", "scripted");
  mlist.set<Teuchos::Array<double>>("changes", Teuchos::Array<double>(10, 1.0));
  return mlist;
}

} // namespace


SUITE(COORDINATOR)
{
  TEST(GROUPS_FROM_INPUT)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());
    Teuchos::ParameterList plist = BaseList();
    plist.sublist("models").set("GWF_1", Testing::RowModel(3, 1.0, 0.0, true));
    plist.sublist("models").set("GWF_2", Testing::RowModel(3, 1.0, 0.0, true));
    plist.sublist("models").set("GWF_3", Testing::RowModel(4, 1.0, 0.0, true));

    auto& xlist = plist.sublist("exchanges").sublist("EXG_1");
    xlist.set<std::string>("exchange type", "groundwater exchange");
    xlist.set<std::string>("model 1", "GWF_2");
    xlist.set<std::string>("model 2", "GWF_3");
    xlist.set<Teuchos::Array<int>>("cells 1", Teuchos::Array<int>({ 1 }));
    xlist.set<Teuchos::Array<int>>("cells 2", Teuchos::Array<int>({ 1 }));
    xlist.set<Teuchos::Array<double>>("conductances", Teuchos::Array<double>({ 1.0 }));

    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "GWF_1" }), 50);
    AddGroup(plist, "SLN_2", Teuchos::Array<std::string>({ "GWF_2", "GWF_3" }), 50);
    plist.sublist("solution groups")
      .sublist("SLN_2")
      .set<Teuchos::Array<std::string>>("exchanges", Teuchos::Array<std::string>({ "EXG_1" }));

    SolutionGroupCoordinator coordinator(plist, registry, getDefaultComm());
    CHECK_EQUAL(2, coordinator.num_groups());
    CHECK_EQUAL("SLN_1", coordinator.group(0).name());
    CHECK_EQUAL("SLN_2", coordinator.group(1).name());
    CHECK_EQUAL(2, coordinator.group("SLN_2").num_models());
    CHECK_EQUAL(1, coordinator.group("SLN_2").num_exchanges());
    CHECK_THROW(coordinator.group("SLN_3"), Errors::NotFoundError);

    coordinator.Setup();
    CHECK_EQUAL(7, coordinator.group(1).map().size());
    coordinator.Teardown();
    CHECK_EQUAL(0, registry->size());
  }

  TEST(INVALID_MEMBERSHIP)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());
    auto comm = getDefaultComm();

    Teuchos::ParameterList plist = BaseList();
    plist.sublist("models").set("GWF_1", Testing::RowModel(3, 1.0, 0.0, true));
    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "GWF_1" }), 50);
    AddGroup(plist, "SLN_2", Teuchos::Array<std::string>({ "GWF_1" }), 50);
    CHECK_THROW(SolutionGroupCoordinator c1(plist, registry, comm), Errors::DuplicateNameError);

    plist = BaseList();
    plist.sublist("models").set("GWF_1", Testing::RowModel(3, 1.0, 0.0, true));
    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "GWF_2" }), 50);
    CHECK_THROW(SolutionGroupCoordinator c2(plist, registry, comm), Errors::NotFoundError);

    plist = BaseList();
    plist.sublist("models").set("GWF_1", Testing::RowModel(3, 1.0, 0.0, true));
    plist.sublist("models").set("GWF_2", Testing::RowModel(3, 1.0, 0.0, true));
    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "GWF_1" }), 50);
    CHECK_THROW(SolutionGroupCoordinator c3(plist, registry, comm), Errors::Message);

    plist = BaseList();
    CHECK_THROW(SolutionGroupCoordinator c4(plist, registry, comm), Errors::Message);

    plist = BaseList();
    auto mlist = Testing::RowModel(3, 1.0, 0.0, true);
    mlist.set<std::string>("model type", "surface water");
    plist.sublist("models").set("GWF_1", mlist);
    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "GWF_1" }), 50);
    CHECK_THROW(SolutionGroupCoordinator c5(plist, registry, comm), Errors::Message);

    // one exchange listed by two groups
    plist = BaseList();
    plist.sublist("models").set("GWF_1", Testing::RowModel(3, 1.0, 0.0, true));
    plist.sublist("models").set("GWF_2", Testing::RowModel(3, 1.0, 0.0, true));
    auto& xlist = plist.sublist("exchanges").sublist("EXG_1");
    xlist.set<std::string>("exchange type", "groundwater exchange");
    xlist.set<std::string>("model 1", "GWF_1");
    xlist.set<std::string>("model 2", "GWF_2");
    xlist.set<Teuchos::Array<int>>("cells 1", Teuchos::Array<int>({ 1 }));
    xlist.set<Teuchos::Array<int>>("cells 2", Teuchos::Array<int>({ 1 }));
    xlist.set<Teuchos::Array<double>>("conductances", Teuchos::Array<double>({ 1.0 }));
    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "GWF_1" }), 50);
    AddGroup(plist, "SLN_2", Teuchos::Array<std::string>({ "GWF_2" }), 50);
    for (const auto& gname : { "SLN_1", "SLN_2" }) {
      plist.sublist("solution groups")
        .sublist(gname)
        .set<Teuchos::Array<std::string>>("exchanges", Teuchos::Array<std::string>({ "EXG_1" }));
    }
    CHECK_THROW(SolutionGroupCoordinator c6(plist, registry, comm), Errors::DuplicateNameError);
  }

  TEST(LATER_GROUPS_SEE_EARLIER_RESULTS)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());
    Teuchos::ParameterList plist = BaseList();

    auto& m1 = plist.sublist("models").sublist("MODEL_1");
    m1.set<std::string>("model type", "scripted");
    m1.set<double>("starting value", 1.0);
    m1.set<Teuchos::Array<double>>("changes", Teuchos::Array<double>({ 2.0, 0.5 }));

    auto& m2 = plist.sublist("models").sublist("MODEL_2");
    m2.set<std::string>("model type", "follower");
    m2.set<int>("number of cells", 2);
    m2.set<std::string>("source group", "SLN_1");

    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "MODEL_1" }), 10);
    AddGroup(plist, "SLN_2", Teuchos::Array<std::string>({ "MODEL_2" }), 10);

    SolutionGroupCoordinator coordinator(plist, registry, getDefaultComm());
    coordinator.Setup();
    coordinator.Initialize();

    const auto& follower =
      dynamic_cast<const Testing::FollowerModel&>(coordinator.group("SLN_2").model(0));

    // two steps, each moves MODEL_1 by 2.5
    for (int step = 0; step < 2; ++step) {
      int first = follower.seen().size();
      coordinator.InitializeTimestep(1.0 + step, 1.0);
      TimestepStatus status = coordinator.SolveTimestep(0, step);
      CHECK(status.converged);

      double converged = 3.5 + 2.5 * step;
      CHECK_CLOSE(converged, registry->GetReal("SLN_1", "X")[0], 1e-12);

      // every assembly of SLN_2 in this step sees the converged SLN_1
      CHECK(follower.seen().size() > first);
      for (int i = first; i < follower.seen().size(); ++i) {
        CHECK_CLOSE(converged, follower.seen()[i], 1e-12);
      }
      CHECK_CLOSE(converged, registry->GetReal("SLN_2", "X")[0], 1e-12);
      CHECK_CLOSE(converged, registry->GetReal("SLN_2", "X")[1], 1e-12);

      coordinator.FinalizeTimestep();
    }

    coordinator.Teardown();
  }

  TEST(FIRST_FAILING_GROUP_IS_REPORTED)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());
    Teuchos::ParameterList plist = BaseList();
    plist.sublist("models").set("GWF_1", Testing::RowModel(5, 10.0, 0.0, true));
    plist.sublist("models").set("GWF_2", Testing::RowModel(5, 10.0, 0.0, true));
    plist.sublist("models").set("MODEL_3", RestlessModel());
    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "GWF_1" }), 50);
    AddGroup(plist, "SLN_2", Teuchos::Array<std::string>({ "GWF_2" }), 1);
    AddGroup(plist, "SLN_3", Teuchos::Array<std::string>({ "MODEL_3" }), 3);

    SolutionGroupCoordinator coordinator(plist, registry, getDefaultComm());
    coordinator.Setup();
    coordinator.Initialize();
    coordinator.InitializeTimestep(1.0, 1.0);
    TimestepStatus status = coordinator.SolveTimestep(0, 0);

    CHECK(!status.converged);
    CHECK_EQUAL(1, status.failed_group);
    CHECK_EQUAL("SLN_2", status.failed_group_name);

    // every group is solved and reported, in order
    CHECK_EQUAL(3, status.groups.size());
    CHECK(status.groups[0].converged());
    CHECK_EQUAL(PhreaticSolvers::SOLVER_MAX_ITERATIONS, status.groups[1].code);
    CHECK_EQUAL(1, status.groups[1].num_itrs);
    CHECK_EQUAL(0, status.groups[1].location.block);
    CHECK_EQUAL(1, status.groups[1].location.local);
    CHECK_EQUAL(PhreaticSolvers::SOLVER_MAX_ITERATIONS, status.groups[2].code);
    CHECK_EQUAL(3, status.groups[2].num_itrs);
    CHECK_EQUAL(3, status.groups[2].history.size());

    coordinator.FinalizeTimestep();
    coordinator.Teardown();
    CHECK_EQUAL(0, registry->size());
  }
}


SUITE(CYCLE_DRIVER)
{
  TEST(SCENARIO_NINE_OUTER_ITERATIONS)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());
    Teuchos::ParameterList plist = BaseList();

    auto& mlist = plist.sublist("models").sublist("MODEL_1");
    mlist.set<std::string>("model type", "scripted");
    mlist.set<double>("starting value", 100.0);
    mlist.set<Teuchos::Array<double>>(
      "changes",
      Teuchos::Array<double>(
        { -33.47, 8.81, -4.26, 1.00, -0.21, 0.034, -0.0046, 0.0004, 0.0000446 }));

    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "MODEL_1" }), 500);
    AddPeriod(plist, "period 1", 10.0, 1, 1.2);

    CycleDriver driver(plist, registry, getDefaultComm());
    int ret = driver.Go();
    CHECK_EQUAL(0, ret);

    const RunReport& report = driver.report();
    CHECK_EQUAL(1, report.num_steps());
    CHECK(report.NormalTermination());
    CHECK_EQUAL(9, report.TotalLinearCalls());
    CHECK_EQUAL(9, report.TotalOuterIterations());
    CHECK_CLOSE(10.0, report.step(0).time, 1e-14);

    const auto& group = report.step(0).status.groups[0];
    CHECK_EQUAL(9, group.history.size());
    CHECK_CLOSE(-33.47, group.history[0].max_change, 1e-10);
    CHECK_CLOSE(0.0000446, group.history[8].max_change, 1e-12);

    // registry usage is captured before the storage is released
    CHECK(report.registry_report().num_real > 0);
    CHECK(report.registry_report().num_integer > 0);
    CHECK_EQUAL(0, registry->size());

    std::stringstream ss;
    report.Write(ss);
    CHECK(ss.str().find("Normal termination") != std::string::npos);
    CHECK(ss.str().find("linear solver calls") != std::string::npos);
    CHECK(ss.str().find("SLN_1") != std::string::npos);
  }

  TEST(STEPS_ADVANCE_THE_TIME)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());
    Teuchos::ParameterList plist = BaseList();
    plist.sublist("models").set("GWF_1", Testing::RowModel(4, 2.0, 1.0, true));
    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "GWF_1" }), 50);
    AddPeriod(plist, "period 1", 10.0, 1, 1.2);
    AddPeriod(plist, "period 2", 7.0, 3, 2.0);

    CycleDriver driver(plist, registry, getDefaultComm());
    CHECK_EQUAL(0, driver.Go());

    const RunReport& report = driver.report();
    CHECK_EQUAL(4, report.num_steps());
    const double times[] = { 10.0, 11.0, 13.0, 17.0 };
    for (int i = 0; i < 4; ++i) CHECK_CLOSE(times[i], report.step(i).time, 1e-12);
    CHECK_EQUAL(1, report.step(3).kper);
    CHECK_EQUAL(2, report.step(3).kstp);
    CHECK_CLOSE(4.0, report.step(3).dt, 1e-12);
    CHECK_CLOSE(17.0, driver.time(), 1e-12);
  }

  TEST(PERIODS_END_AT_THEIR_LENGTHS)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());
    Teuchos::ParameterList plist = BaseList();
    plist.sublist("cycle driver").set<double>("start time", 0.3);
    plist.sublist("models").set("GWF_1", Testing::RowModel(4, 2.0, 1.0, true));
    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "GWF_1" }), 50);
    for (int i = 0; i < 10; ++i) {
      AddPeriod(plist, "period " + std::to_string(i + 1), 0.1, 3, 1.5);
    }

    CycleDriver driver(plist, registry, getDefaultComm());
    CHECK_EQUAL(0, driver.Go());

    const RunReport& report = driver.report();
    CHECK_EQUAL(30, report.num_steps());

    // the last step of each period lands on the sum of the period lengths
    double tend(0.3);
    for (int kper = 0; kper < 10; ++kper) {
      tend += 0.1;
      const StepRecord& last = report.step(3 * kper + 2);
      CHECK_EQUAL(kper, last.kper);
      CHECK_EQUAL(2, last.kstp);
      CHECK_EQUAL(tend, last.time);
      CHECK(report.step(3 * kper).time < last.time);
    }
    CHECK_EQUAL(tend, driver.time());
  }

  TEST(ISOLATED_ACTIVE_CELL_FAILS_ITS_STEP)
  {
    // cell 3 is active but both of its neighbours are inactive, so its
    // steady row is all zero
    auto registry = Teuchos::rcp(new VariableRegistry());
    Teuchos::ParameterList plist = BaseList();
    auto mlist = Testing::RowModel(5, 10.0, 0.0, true);
    mlist.set<Teuchos::Array<int>>("ibound", Teuchos::Array<int>({ -1, 1, 0, 1, 0 }));
    plist.sublist("models").set("GWF_1", mlist);
    plist.sublist("models").set("GWF_2", Testing::RowModel(4, 2.0, 1.0, true));
    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "GWF_1" }), 50);
    AddGroup(plist, "SLN_2", Teuchos::Array<std::string>({ "GWF_2" }), 50);
    AddPeriod(plist, "period 1", 1.0, 2, 1.0);

    CycleDriver driver(plist, registry, getDefaultComm());
    CHECK_EQUAL(1, driver.Go());

    const RunReport& report = driver.report();
    CHECK_EQUAL(2, report.num_steps());
    CHECK_EQUAL(2, report.NumFailedSteps());
    for (int i = 0; i < 2; ++i) {
      const TimestepStatus& status = report.step(i).status;
      CHECK_EQUAL("SLN_1", status.failed_group_name);
      CHECK_EQUAL(PhreaticSolvers::SOLVER_LINEAR_SOLVER_ERROR, status.groups[0].code);
      CHECK_EQUAL(1, status.groups[0].num_itrs);
      CHECK_EQUAL(PhreaticSolvers::LIN_SOLVER_PRECONDITIONER_FAILED,
                  status.groups[0].history[0].linear_code);
      CHECK(status.groups[1].converged());
    }

    std::stringstream ss;
    report.Write(ss);
    CHECK(ss.str().find("Failure: 2 time steps did not converge") != std::string::npos);
    CHECK_EQUAL(0, registry->size());
  }

  TEST(CONTINUE_PAST_FAILED_STEPS)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());
    Teuchos::ParameterList plist = BaseList();
    plist.sublist("models").set("MODEL_1", RestlessModel());
    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "MODEL_1" }), 3);
    AddPeriod(plist, "period 1", 1.0, 2, 1.0);
    AddPeriod(plist, "period 2", 2.0, 1, 1.0);

    CycleDriver driver(plist, registry, getDefaultComm());
    CHECK(driver.continue_on_failure());
    CHECK_EQUAL(1, driver.Go());

    const RunReport& report = driver.report();
    CHECK_EQUAL(3, report.num_steps());
    CHECK_EQUAL(3, report.NumFailedSteps());
    CHECK_EQUAL(9, report.TotalOuterIterations());
    CHECK_EQUAL("Failure: 3 time steps did not converge", report.TerminationMessage());
    CHECK_EQUAL(0, registry->size());
  }

  TEST(STOP_AT_THE_FIRST_FAILED_STEP)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());
    Teuchos::ParameterList plist = BaseList();
    plist.sublist("cycle driver").set<bool>("continue on failure", false);
    plist.sublist("models").set("MODEL_1", RestlessModel());
    AddGroup(plist, "SLN_1", Teuchos::Array<std::string>({ "MODEL_1" }), 3);
    AddPeriod(plist, "period 1", 1.0, 2, 1.0);
    AddPeriod(plist, "period 2", 2.0, 1, 1.0);

    CycleDriver driver(plist, registry, getDefaultComm());
    CHECK_EQUAL(1, driver.Go());

    const RunReport& report = driver.report();
    CHECK_EQUAL(1, report.num_steps());
    CHECK_EQUAL("Failure: 1 time steps did not converge", report.TerminationMessage());

    std::stringstream ss;
    report.Write(ss);
    CHECK(ss.str().find("did not converge after 3 outer iterations") != std::string::npos);
    CHECK_EQUAL(0, registry->size());
  }
}
