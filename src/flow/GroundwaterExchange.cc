/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <algorithm>

#include "Teuchos_Array.hpp"

#include "errors.hh"
#include "GroundwaterExchange.hh"

namespace Phreatic {
namespace PhreaticFlow {

GroundwaterExchange::GroundwaterExchange(const Key& name, Teuchos::ParameterList& plist)
  : name_(name), plist_(plist), nexg_(0)
{
  if (!plist_.isParameter("model 1") || !plist_.isParameter("model 2")) {
    Errors::Message msg;
    msg << "GroundwaterExchange \"" << name_ << "\": parameters \"model 1\" and \"model 2\" are required.";
    Exceptions::phreatic_throw(msg);
  }
  model1_ = plist_.get<std::string>("model 1");
  model2_ = plist_.get<std::string>("model 2");
  if (model1_ == model2_) {
    Errors::Message msg;
    msg << "GroundwaterExchange \"" << name_ << "\": model \"" << model1_
        << "\" cannot be exchanged with itself.";
    Exceptions::phreatic_throw(msg);
  }
}


/* ******************************************************************
* Validates the connections against the grids of both models.
****************************************************************** */
void
GroundwaterExchange::Setup(const Teuchos::RCP<VariableRegistry>& registry)
{
  registry_ = registry;

  auto cells1 = plist_.get<Teuchos::Array<int>>("cells 1", Teuchos::Array<int>());
  auto cells2 = plist_.get<Teuchos::Array<int>>("cells 2", Teuchos::Array<int>());
  auto cond = plist_.get<Teuchos::Array<double>>("conductances", Teuchos::Array<double>());
  if (cells1.size() != cells2.size() || cells1.size() != cond.size()) {
    Errors::InvalidShapeError msg;
    msg << "GroundwaterExchange \"" << name_
        << "\": \"cells 1\", \"cells 2\" and \"conductances\" differ in length.";
    Exceptions::phreatic_throw(msg);
  }
  nexg_ = cells1.size();
  if (nexg_ == 0) {
    Errors::InvalidShapeError msg;
    msg << "GroundwaterExchange \"" << name_ << "\" has no connections.";
    Exceptions::phreatic_throw(msg);
  }

  int n1 = registry_->GetInt(model1_, "IBOUND").size();
  int n2 = registry_->GetInt(model2_, "IBOUND").size();
  for (int i = 0; i < nexg_; ++i) {
    if (cells1[i] < 0 || cells1[i] >= n1 || cells2[i] < 0 || cells2[i] >= n2) {
      Errors::Message msg;
      msg << "GroundwaterExchange \"" << name_ << "\": connection " << i + 1
          << " refers to a cell outside its model.";
      Exceptions::phreatic_throw(msg);
    }
    if (cond[i] < 0.0) {
      Errors::Message msg;
      msg << "GroundwaterExchange \"" << name_ << "\": connection " << i + 1
          << " has a negative conductance.";
      Exceptions::phreatic_throw(msg);
    }
  }

  registry_->Allocate(name_, "CELLM1", VariableKind::INTEGER, nexg_);
  registry_->Allocate(name_, "CELLM2", VariableKind::INTEGER, nexg_);
  registry_->Allocate(name_, "COND", VariableKind::REAL, nexg_);
  auto c1 = registry_->GetInt(name_, "CELLM1");
  auto c2 = registry_->GetInt(name_, "CELLM2");
  auto cc = registry_->GetReal(name_, "COND");
  std::copy(cells1.begin(), cells1.end(), c1.begin());
  std::copy(cells2.begin(), cells2.end(), c2.begin());
  std::copy(cond.begin(), cond.end(), cc.begin());
}


/* ******************************************************************
* The entries Assemble() adds: diagonals of active cells, off-diagonals
* of connections between two active cells.
****************************************************************** */
void
GroundwaterExchange::SymbolicAssemble(LinearSystem& system, const SolutionMap& map)
{
  const VariableRegistry& reg = *registry_;
  auto ib1 = reg.GetInt(model1_, "IBOUND");
  auto ib2 = reg.GetInt(model2_, "IBOUND");
  auto cells1 = reg.GetInt(name_, "CELLM1");
  auto cells2 = reg.GetInt(name_, "CELLM2");

  int b1 = map.BlockIndex(model1_);
  int b2 = map.BlockIndex(model2_);

  for (int i = 0; i < nexg_; ++i) {
    int n = cells1[i], m = cells2[i];
    if (ib1[n] == 0 || ib2[m] == 0) continue;

    int g1 = map.GlobalIndex(b1, n);
    int g2 = map.GlobalIndex(b2, m);

    if (ib1[n] > 0) system.AddToGraph(g1, g1);
    if (ib2[m] > 0) system.AddToGraph(g2, g2);
    if (ib1[n] > 0 && ib2[m] > 0) {
      system.AddToGraph(g1, g2);
      system.AddToGraph(g2, g1);
    }
  }
}


/* ******************************************************************
* x is the state of the whole group.
****************************************************************** */
void
GroundwaterExchange::Assemble(Teuchos::ArrayView<const double> x,
                              LinearSystem& system,
                              const SolutionMap& map)
{
  const VariableRegistry& reg = *registry_;
  auto ib1 = reg.GetInt(model1_, "IBOUND");
  auto ib2 = reg.GetInt(model2_, "IBOUND");
  auto cells1 = reg.GetInt(name_, "CELLM1");
  auto cells2 = reg.GetInt(name_, "CELLM2");
  auto cond = reg.GetReal(name_, "COND");

  int b1 = map.BlockIndex(model1_);
  int b2 = map.BlockIndex(model2_);

  for (int i = 0; i < nexg_; ++i) {
    int n = cells1[i], m = cells2[i];
    if (ib1[n] == 0 || ib2[m] == 0) continue;

    int g1 = map.GlobalIndex(b1, n);
    int g2 = map.GlobalIndex(b2, m);
    double c = cond[i];

    if (ib1[n] > 0 && ib2[m] > 0) {
      system.AddToMatrix(g1, g1, c);
      system.AddToMatrix(g1, g2, -c);
      system.AddToMatrix(g2, g2, c);
      system.AddToMatrix(g2, g1, -c);
    } else if (ib1[n] > 0) {
      system.AddToMatrix(g1, g1, c);
      system.AddToRhs(g1, c * x[g2]);
    } else if (ib2[m] > 0) {
      system.AddToMatrix(g2, g2, c);
      system.AddToRhs(g2, c * x[g1]);
    }
  }
}

} // namespace PhreaticFlow
} // namespace Phreatic
