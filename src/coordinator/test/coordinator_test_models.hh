/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

// Models and input lists shared by the coordinator tests.

#ifndef PHREATIC_COORDINATOR_TEST_MODELS_HH_
#define PHREATIC_COORDINATOR_TEST_MODELS_HH_

#include <algorithm>
#include <string>
#include <vector>

#include "Teuchos_Array.hpp"
#include "Teuchos_ParameterList.hpp"

#include "ModelBase.hh"
#include "Model_Factory.hh"

namespace Phreatic {
namespace Testing {

// One unknown per cell with A = I and b = x + delta_k, so the k-th outer
// iteration of every time step changes each cell by delta_k.
class ScriptedModel : public ModelBase {
 public:
  ScriptedModel(const Key& name, Teuchos::ParameterList& plist)
    : name_(name), calls_(0), total_calls_(0)
  {
    ncells_ = plist.get<int>("number of cells", 1);
    auto deltas = plist.get<Teuchos::Array<double>>("changes", Teuchos::Array<double>());
    deltas_.assign(deltas.begin(), deltas.end());
    x0_ = plist.get<double>("starting value", 0.0);
  }

  const Key& name() const override { return name_; }
  int num_dofs() const override { return ncells_; }

  void Setup(const Teuchos::RCP<VariableRegistry>& registry) override
  {
    registry->Allocate(name_, "CALLS", VariableKind::INTEGER, 1);
  }

  void InitialState(Teuchos::ArrayView<double> x) override
  {
    std::fill(x.begin(), x.end(), x0_);
  }

  void InitializeTimestep(double t, double dt) override { calls_ = 0; }

  void Assemble(Teuchos::ArrayView<const double> x, int block, LinearSystem& system) override
  {
    double d = (calls_ < deltas_.size()) ? deltas_[calls_] : 0.0;
    for (int c = 0; c < ncells_; ++c) {
      system.AddToMatrix(block, c, c, 1.0);
      system.AddToRhs(block, c, x[c] + d);
    }
    calls_++;
    total_calls_++;
  }

  void FinalizeTimestep(Teuchos::ArrayView<const double> x) override {}

  int total_calls() const { return total_calls_; }

 private:
  Key name_;
  int ncells_;
  std::vector<double> deltas_;
  double x0_;
  int calls_, total_calls_;

  static RegisteredModelFactory<ScriptedModel> reg_;
};


// Every cell takes the first value of the state of another solution group,
// read from the registry when the model is assembled.
class FollowerModel : public ModelBase {
 public:
  FollowerModel(const Key& name, Teuchos::ParameterList& plist) : name_(name)
  {
    ncells_ = plist.get<int>("number of cells", 1);
    source_ = plist.get<std::string>("source group");
  }

  const Key& name() const override { return name_; }
  int num_dofs() const override { return ncells_; }

  void Setup(const Teuchos::RCP<VariableRegistry>& registry) override { registry_ = registry; }

  void InitialState(Teuchos::ArrayView<double> x) override { std::fill(x.begin(), x.end(), 0.0); }
  void InitializeTimestep(double t, double dt) override {}

  void Assemble(Teuchos::ArrayView<const double> x, int block, LinearSystem& system) override
  {
    const VariableRegistry& reg = *registry_;
    double value = reg.GetReal(source_, "X")[0];
    seen_.push_back(value);
    for (int c = 0; c < ncells_; ++c) {
      system.AddToMatrix(block, c, c, 1.0);
      system.AddToRhs(block, c, value);
    }
  }

  void FinalizeTimestep(Teuchos::ArrayView<const double> x) override {}

  const std::vector<double>& seen() const { return seen_; }

 private:
  Key name_, source_;
  int ncells_;
  Teuchos::RCP<VariableRegistry> registry_;
  std::vector<double> seen_;

  static RegisteredModelFactory<FollowerModel> reg_;
};


inline Teuchos::ParameterList
SolverLists(int max_outer)
{
  Teuchos::ParameterList plist;
  auto& nl = plist.sublist("nonlinear solver");
  nl.set<double>("head closure", 1e-4);
  nl.set<double>("residual closure", 1e-3);
  nl.set<int>("maximum number of outer iterations", max_outer);
  nl.set<int>("maximum number of inner iterations", 100);
  nl.sublist("verbose object").set<std::string>("verbosity level", "none");

  auto& lin = plist.sublist("linear solver");
  lin.set<std::string>("iterative method", "pcg");
  lin.sublist("verbose object").set<std::string>("verbosity level", "none");

  plist.sublist("verbose object").set<std::string>("verbosity level", "none");
  return plist;
}


// 1 x n row of unit cells held at hleft and hright at the two ends
inline Teuchos::ParameterList
RowModel(int n, double hleft, double hright, bool confined)
{
  Teuchos::ParameterList plist;
  plist.set<std::string>("model type", "groundwater flow");
  plist.set<int>("number of rows", 1);
  plist.set<int>("number of columns", n);
  plist.set<bool>("confined", confined);
  plist.set<bool>("steady state", true);
  plist.set<double>("hydraulic conductivity", 1.0);
  plist.set<double>("top", 20.0);
  plist.set<double>("bottom", 0.0);

  Teuchos::Array<int> ibound(n, 1);
  ibound[0] = -1;
  ibound[n - 1] = -1;
  plist.set<Teuchos::Array<int>>("ibound", ibound);

  Teuchos::Array<double> h(n, hright);
  h[0] = hleft;
  plist.set<Teuchos::Array<double>>("starting head", h);
  return plist;
}

} // namespace Testing
} // namespace Phreatic

#endif
