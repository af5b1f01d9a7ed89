/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <vector>

#include "Teuchos_Array.hpp"
#include "Teuchos_ParameterList.hpp"
#include "Teuchos_RCP.hpp"
#include "UnitTest++.h"

#include "errors.hh"
#include "GroundwaterFlowModel.hh"
#include "LinearSystem.hh"
#include "Model_Factory.hh"
#include "PhreaticComm.hh"
#include "SolutionMap.hh"
#include "VariableRegistry.hh"

#include "flow_registration.hh"

using namespace Phreatic;
using namespace Phreatic::PhreaticFlow;

namespace {

Teuchos::ParameterList
RowList(int ncol)
{
  Teuchos::ParameterList plist;
  plist.set<std::string>("model type", "groundwater flow");
  plist.set<int>("number of rows", 1);
  plist.set<int>("number of columns", ncol);
  plist.set<double>("hydraulic conductivity", 1.0);
  plist.set<double>("top", 1.0);
  plist.set<double>("bottom", 0.0);
  plist.set<double>("starting head", 0.0);
  plist.set<bool>("steady state", true);
  return plist;
}

// one model, one block
struct ModelFixture {
  void Build(Teuchos::ParameterList& plist)
  {
    registry = Teuchos::rcp(new VariableRegistry());
    model = Teuchos::rcp(new GroundwaterFlowModel("GWF_1", plist));
    model->Setup(registry);

    auto m = Teuchos::rcp(new SolutionMap(getDefaultComm()));
    m->AddBlock(model->name(), model->num_dofs());
    m->Finalize();
    map = m;
    system = Teuchos::rcp(new LinearSystem(map, registry, "SLN_1"));
    model->SymbolicAssemble(0, *system);
    system->FillCompleteGraph();

    x.resize(model->num_dofs());
    model->InitialState(Teuchos::arrayViewFromVector(x));
  }

  void Assemble()
  {
    system->Zero();
    model->Assemble(Teuchos::ArrayView<const double>(x.data(), x.size()), 0, *system);
    system->FillComplete();
  }

  Teuchos::RCP<VariableRegistry> registry;
  Teuchos::RCP<GroundwaterFlowModel> model;
  Teuchos::RCP<const SolutionMap> map;
  Teuchos::RCP<LinearSystem> system;
  std::vector<double> x;
};

} // namespace


SUITE(GROUNDWATER_FLOW_MODEL)
{
  TEST_FIXTURE(ModelFixture, CELL_ARRAYS_IN_REGISTRY)
  {
    Teuchos::ParameterList plist = RowList(3);
    plist.set<int>("number of rows", 2);
    plist.set<Teuchos::Array<double>>("starting head",
                                      Teuchos::Array<double>({ 1., 2., 3., 4., 5., 6. }));
    Build(plist);

    CHECK_EQUAL(6, model->num_dofs());
    CHECK_EQUAL(4, model->CellIndex(1, 1));
    for (const char* name : { "K", "TOP", "BOT", "SS", "SY", "RECH", "WELL", "HOLD", "IBOUND" }) {
      CHECK(registry->Exists("GWF_1", name));
      CHECK_EQUAL(6, registry->GetVariable("GWF_1", name).extent());
    }
    CHECK_EQUAL(4.0, x[3]);
    CHECK_EQUAL(1, registry->GetInt("GWF_1", "IBOUND")[5]);
  }

  TEST_FIXTURE(ModelFixture, CONSTANT_HEADS_MOVE_TO_THE_RHS)
  {
    Teuchos::ParameterList plist = RowList(3);
    plist.set<Teuchos::Array<int>>("ibound", Teuchos::Array<int>({ -1, 1, -1 }));
    plist.set<Teuchos::Array<double>>("starting head", Teuchos::Array<double>({ 10., 5., 0. }));
    Build(plist);
    Assemble();

    // unit conductances
    CHECK_CLOSE(2.0, system->GetMatrixEntry(1, 1), 1e-14);
    CHECK_EQUAL(0.0, system->GetMatrixEntry(1, 0));
    CHECK_EQUAL(0.0, system->GetMatrixEntry(0, 1));
    CHECK_CLOSE(10.0, (*system->rhs())[1], 1e-14);

    // identity rows
    CHECK_EQUAL(1.0, system->GetMatrixEntry(0, 0));
    CHECK_EQUAL(10.0, (*system->rhs())[0]);
    CHECK_EQUAL(1.0, system->GetMatrixEntry(2, 2));
    CHECK_EQUAL(0.0, (*system->rhs())[2]);

    CHECK(!model->IsActive(0));
    CHECK(model->IsActive(1));
  }

  TEST_FIXTURE(ModelFixture, SYMMETRIC_HARMONIC_CONDUCTANCES)
  {
    Teuchos::ParameterList plist = RowList(2);
    plist.set<int>("number of rows", 2);
    plist.set<double>("cell width", 2.0);
    plist.set<double>("cell height", 4.0);
    plist.set<Teuchos::Array<double>>("hydraulic conductivity",
                                      Teuchos::Array<double>({ 1., 3., 1., 1. }));
    Build(plist);
    Assemble();

    // along the row: 2 * 1 * 3 / 4 * (4 / 2)
    CHECK_CLOSE(-3.0, system->GetMatrixEntry(0, 1), 1e-14);
    CHECK_CLOSE(-3.0, system->GetMatrixEntry(1, 0), 1e-14);
    // along the column: 1 * (2 / 4)
    CHECK_CLOSE(-0.5, system->GetMatrixEntry(0, 2), 1e-14);
    CHECK_CLOSE(-0.5, system->GetMatrixEntry(2, 0), 1e-14);
    CHECK_CLOSE(3.5, system->GetMatrixEntry(0, 0), 1e-14);
    CHECK_EQUAL(0.0, system->GetMatrixEntry(0, 3));
  }

  TEST_FIXTURE(ModelFixture, STORAGE_RECHARGE_AND_WELLS)
  {
    Teuchos::ParameterList plist = RowList(1);
    plist.set<bool>("steady state", false);
    plist.set<double>("cell width", 10.0);
    plist.set<double>("cell height", 10.0);
    plist.set<double>("top", 10.0);
    plist.set<double>("specific storage", 1.0e-4);
    plist.set<double>("recharge", 0.01);
    plist.set<double>("starting head", 4.0);
    plist.set<Teuchos::Array<int>>("well cells", Teuchos::Array<int>({ 0, 0 }));
    plist.set<Teuchos::Array<double>>("well rates", Teuchos::Array<double>({ -0.5, -0.25 }));
    Build(plist);

    model->InitializeTimestep(2.0, 2.0);
    Assemble();

    // storage coefficient 1e-4 * 10 * 100 over dt = 2
    CHECK_CLOSE(0.05, system->GetMatrixEntry(0, 0), 1e-14);
    CHECK_CLOSE(0.05 * 4.0 + 1.0 - 0.75, (*system->rhs())[0], 1e-14);
  }

  TEST_FIXTURE(ModelFixture, UNCONFINED_THICKNESS_IS_LIMITED)
  {
    Teuchos::ParameterList plist = RowList(1);
    plist.set<bool>("confined", false);
    plist.set<double>("top", 10.0);
    Build(plist);

    CHECK_CLOSE(4.0, model->SaturatedThickness(0, 4.0), 1e-14);
    CHECK_CLOSE(10.0, model->SaturatedThickness(0, 12.0), 1e-14);
    CHECK_CLOSE(0.1, model->SaturatedThickness(0, -3.0), 1e-14);
  }

  TEST_FIXTURE(ModelFixture, INACTIVE_CELLS_ARE_DECOUPLED)
  {
    Teuchos::ParameterList plist = RowList(4);
    plist.set<Teuchos::Array<int>>("ibound", Teuchos::Array<int>({ 1, 1, 0, -1 }));
    Build(plist);
    Assemble();

    CHECK_CLOSE(1.0, system->GetMatrixEntry(1, 1), 1e-14);
    CHECK_EQUAL(0.0, system->GetMatrixEntry(1, 2));
    CHECK_EQUAL(0.0, system->GetMatrixEntry(2, 1));
    CHECK_EQUAL(1.0, system->GetMatrixEntry(2, 2));
    CHECK_EQUAL(6, system->num_nonzeros());
    CHECK(!model->IsActive(2));
  }

  TEST_FIXTURE(ModelFixture, FINALIZE_SAVES_THE_HEAD)
  {
    Teuchos::ParameterList plist = RowList(2);
    Build(plist);
    std::vector<double> h = { 3.0, 4.0 };
    model->FinalizeTimestep(Teuchos::ArrayView<const double>(h.data(), 2));
    CHECK_EQUAL(4.0, registry->GetReal("GWF_1", "HOLD")[1]);
  }

  TEST(FACTORY_CREATES_REGISTERED_MODEL)
  {
    Teuchos::ParameterList plist = RowList(4);
    ModelFactory factory;
    auto model = factory.CreateModel("GWF_7", plist);
    CHECK_EQUAL("GWF_7", model->name());
    CHECK_EQUAL(4, model->num_dofs());

    plist.set<std::string>("model type", "surface water");
    CHECK_THROW(factory.CreateModel("GWF_8", plist), Errors::Message);
  }

  TEST(BAD_CONFIGURATION)
  {
    auto registry = Teuchos::rcp(new VariableRegistry());

    Teuchos::ParameterList plist = RowList(3);
    plist.remove("number of rows");
    CHECK_THROW(GroundwaterFlowModel("A", plist), Errors::Message);

    plist = RowList(3);
    plist.set<Teuchos::Array<double>>("top", Teuchos::Array<double>({ 1., 1. }));
    GroundwaterFlowModel b("B", plist);
    CHECK_THROW(b.Setup(registry), Errors::InvalidShapeError);

    plist = RowList(3);
    plist.set<double>("top", -1.0);
    GroundwaterFlowModel c("C", plist);
    CHECK_THROW(c.Setup(registry), Errors::Message);

    plist = RowList(3);
    plist.remove("hydraulic conductivity");
    GroundwaterFlowModel d("D", plist);
    CHECK_THROW(d.Setup(registry), Errors::Message);
  }
}
