/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <cmath>

#include "Teuchos_Array.hpp"
#include "Teuchos_ParameterList.hpp"
#include "Teuchos_RCP.hpp"
#include "UnitTest++.h"

#include "errors.hh"
#include "GroundwaterExchange.hh"
#include "GroundwaterFlowModel.hh"
#include "Key.hh"
#include "PhreaticComm.hh"
#include "SolutionGroup.hh"
#include "SolverDefs.hh"
#include "VariableRegistry.hh"

#include "coordinator_test_models.hh"

using namespace Phreatic;
using namespace Phreatic::PhreaticFlow;

SUITE(SOLUTION_GROUP)
{
  TEST(CONFINED_ROW_HAS_A_LINEAR_PROFILE)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());
    Teuchos::ParameterList mlist = Testing::RowModel(5, 10.0, 0.0, true);
    auto model = Teuchos::rcp(new GroundwaterFlowModel("GWF_1", mlist));

    Teuchos::ParameterList glist = Testing::SolverLists(50);
    SolutionGroup group("SLN_1", glist, registry, getDefaultComm());
    group.AddModel(model);
    group.Setup();

    CHECK(registry->Exists("SLN_1", "X"));
    CHECK(registry->Exists("SLN_1", "XOLD"));
    CHECK(registry->Exists("SLN_1", "IACTIVE"));
    CHECK(registry->Exists("SLN_1", "RHS"));
    CHECK(registry->Exists("SLN_1-nonlinear", "XLIN"));
    CHECK(registry->Exists("SLN_1-nonlinear", "DX"));
    CHECK(registry->Exists("GWF_1", "K"));

    group.Initialize();
    group.InitializeTimestep(1.0, 1.0);
    CHECK_EQUAL(0, registry->GetInt("SLN_1", "IACTIVE")[0]);
    CHECK_EQUAL(1, registry->GetInt("SLN_1", "IACTIVE")[2]);

    int ierr = group.Solve();
    CHECK_EQUAL(PhreaticSolvers::SOLVER_CONVERGED, ierr);
    CHECK_EQUAL(2, group.nonlinear_solver().num_itrs());
    CHECK(registry->Exists("SLN_1-linear", "R"));

    // solver storage is named after the group
    CHECK_EQUAL("SLN_1-linear", Keys::getOrigin(group.name(), "linear"));
    CHECK_EQUAL("SLN_1-nonlinear", Keys::getOrigin(group.name(), "nonlinear"));
    CHECK_THROW(Keys::getOrigin("", "linear"), Errors::Message);

    auto h = group.ModelState("GWF_1");
    CHECK_EQUAL(10.0, h[0]);
    CHECK_CLOSE(7.5, h[1], 1e-6);
    CHECK_CLOSE(5.0, h[2], 1e-6);
    CHECK_CLOSE(2.5, h[3], 1e-6);
    CHECK_EQUAL(0.0, h[4]);

    // first outer iteration: largest change in the first interior cell
    const auto& first = group.nonlinear_solver().history()[0];
    CHECK_CLOSE(7.5, first.max_change, 1e-6);
    CHECK_EQUAL(0, first.location.block);
    CHECK_EQUAL(1, first.location.local);

    group.FinalizeTimestep();
    CHECK_CLOSE(5.0, registry->GetReal("GWF_1", "HOLD")[2], 1e-6);

    group.Teardown();
    CHECK_EQUAL(0, registry->size());
  }

  TEST(EXCHANGE_JOINS_TWO_MODELS)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());

    Teuchos::ParameterList m1list = Testing::RowModel(3, 10.0, 0.0, true);
    m1list.set<Teuchos::Array<int>>("ibound", Teuchos::Array<int>({ -1, 1, 1 }));
    Teuchos::ParameterList m2list = Testing::RowModel(3, 0.0, 0.0, true);
    m2list.set<Teuchos::Array<int>>("ibound", Teuchos::Array<int>({ 1, 1, -1 }));

    // same conductance as inside the models: T = 20
    Teuchos::ParameterList xlist;
    xlist.set<std::string>("model 1", "GWF_1");
    xlist.set<std::string>("model 2", "GWF_2");
    xlist.set<Teuchos::Array<int>>("cells 1", Teuchos::Array<int>({ 2 }));
    xlist.set<Teuchos::Array<int>>("cells 2", Teuchos::Array<int>({ 0 }));
    xlist.set<Teuchos::Array<double>>("conductances", Teuchos::Array<double>({ 20.0 }));

    Teuchos::ParameterList glist = Testing::SolverLists(50);
    SolutionGroup group("SLN_1", glist, registry, getDefaultComm());
    group.AddModel(Teuchos::rcp(new GroundwaterFlowModel("GWF_1", m1list)));
    group.AddModel(Teuchos::rcp(new GroundwaterFlowModel("GWF_2", m2list)));
    group.AddExchange(Teuchos::rcp(new GroundwaterExchange("EXG_1", xlist)));
    group.Setup();

    CHECK_EQUAL(6, group.map().size());
    CHECK_EQUAL(3, group.map().offset(1));
    CHECK(registry->Exists("EXG_1", "COND"));

    group.Initialize();
    group.InitializeTimestep(1.0, 1.0);
    CHECK_EQUAL(PhreaticSolvers::SOLVER_CONVERGED, group.Solve());

    CHECK_CLOSE(-20.0, group.system().GetMatrixEntry(2, 3), 1e-12);

    auto h1 = group.ModelState("GWF_1");
    auto h2 = group.ModelState("GWF_2");
    CHECK_CLOSE(8.0, h1[1], 1e-6);
    CHECK_CLOSE(6.0, h1[2], 1e-6);
    CHECK_CLOSE(4.0, h2[0], 1e-6);
    CHECK_CLOSE(2.0, h2[1], 1e-6);

    group.Teardown();
    CHECK_EQUAL(0, registry->size());
  }

  TEST(UNCONFINED_ROW_CONSERVES_MASS)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());
    Teuchos::ParameterList mlist = Testing::RowModel(6, 15.0, 5.0, false);
    auto model = Teuchos::rcp(new GroundwaterFlowModel("GWF_1", mlist));

    Teuchos::ParameterList glist = Testing::SolverLists(50);
    SolutionGroup group("SLN_1", glist, registry, getDefaultComm());
    group.AddModel(model);
    group.Setup();
    group.Initialize();
    group.InitializeTimestep(1.0, 1.0);

    CHECK_EQUAL(PhreaticSolvers::SOLVER_CONVERGED, group.Solve());
    CHECK(group.nonlinear_solver().num_itrs() > 2);

    // the same flow crosses every face
    auto h = group.ModelState("GWF_1");
    double q0(0.0);
    for (int c = 0; c < 5; ++c) {
      CHECK(h[c] > h[c + 1]);
      double t1 = model->SaturatedThickness(c, h[c]);
      double t2 = model->SaturatedThickness(c + 1, h[c + 1]);
      double q = 2.0 * t1 * t2 / (t1 + t2) * (h[c] - h[c + 1]);
      if (c == 0) q0 = q;
      CHECK_CLOSE(q0, q, 1e-2);
    }
    group.Teardown();
  }

  TEST(MEMBERSHIP_ERRORS)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());
    Teuchos::ParameterList glist = Testing::SolverLists(50);
    Teuchos::ParameterList mlist = Testing::RowModel(3, 1.0, 0.0, true);

    SolutionGroup empty("SLN_0", glist, registry, getDefaultComm());
    CHECK_THROW(empty.Setup(), Errors::Message);
    CHECK_THROW(empty.Solve(), Errors::Message);

    SolutionGroup group("SLN_1", glist, registry, getDefaultComm());
    group.AddModel(Teuchos::rcp(new GroundwaterFlowModel("GWF_1", mlist)));
    CHECK_THROW(group.AddModel(Teuchos::rcp(new GroundwaterFlowModel("GWF_1", mlist))),
                Errors::DuplicateNameError);

    Teuchos::ParameterList xlist;
    xlist.set<std::string>("model 1", "GWF_1");
    xlist.set<std::string>("model 2", "GWF_9");
    group.AddExchange(Teuchos::rcp(new GroundwaterExchange("EXG_1", xlist)));
    CHECK_THROW(group.Setup(), Errors::NotFoundError);
  }
}
