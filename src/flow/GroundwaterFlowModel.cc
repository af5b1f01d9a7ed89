/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <algorithm>
#include <string>

#include "Teuchos_Array.hpp"

#include "errors.hh"
#include "GroundwaterFlowModel.hh"

namespace Phreatic {
namespace PhreaticFlow {

// thinnest saturated thickness of an unconfined cell, as a fraction of top - bottom
const double kMinSaturatedFraction = 0.01;

/* ******************************************************************
* Only parameters are read here; storage is created in Setup().
****************************************************************** */
GroundwaterFlowModel::GroundwaterFlowModel(const Key& name, Teuchos::ParameterList& plist)
  : name_(name), plist_(plist), t_(0.0), dt_(0.0)
{
  if (!plist_.isParameter("number of rows") || !plist_.isParameter("number of columns")) {
    Errors::Message msg;
    msg << "GroundwaterFlowModel \"" << name_
        << "\": parameters \"number of rows\" and \"number of columns\" are required.";
    Exceptions::phreatic_throw(msg);
  }
  nrow_ = plist_.get<int>("number of rows");
  ncol_ = plist_.get<int>("number of columns");
  if (nrow_ < 1 || ncol_ < 1) {
    Errors::InvalidShapeError msg;
    msg << "GroundwaterFlowModel \"" << name_ << "\": grid " << nrow_ << " x " << ncol_
        << " is empty.";
    Exceptions::phreatic_throw(msg);
  }

  delr_ = plist_.get<double>("cell width", 1.0);
  delc_ = plist_.get<double>("cell height", 1.0);
  if (delr_ <= 0.0 || delc_ <= 0.0) {
    Errors::Message msg;
    msg << "GroundwaterFlowModel \"" << name_ << "\": cell sizes must be positive.";
    Exceptions::phreatic_throw(msg);
  }

  confined_ = plist_.get<bool>("confined", true);
  steady_ = plist_.get<bool>("steady state", false);
}


/* ******************************************************************
* Cell arrays are registered under the model name.
****************************************************************** */
void
GroundwaterFlowModel::Setup(const Teuchos::RCP<VariableRegistry>& registry)
{
  registry_ = registry;
  int n = num_dofs();

  FillCellArray_("hydraulic conductivity", "K", true, 0.0);
  FillCellArray_("top", "TOP", true, 0.0);
  FillCellArray_("bottom", "BOT", true, 0.0);
  FillCellArray_("specific storage", "SS", false, 0.0);
  FillCellArray_("specific yield", "SY", false, 0.0);
  FillCellArray_("recharge", "RECH", false, 0.0);
  FillCellArray_("starting head", "HOLD", true, 0.0);

  auto top = registry_->GetReal(name_, "TOP");
  auto bot = registry_->GetReal(name_, "BOT");
  for (int c = 0; c < n; ++c) {
    if (top[c] <= bot[c]) {
      Errors::Message msg;
      msg << "GroundwaterFlowModel \"" << name_ << "\": top is not above bottom in cell "
          << c + 1 << ".";
      Exceptions::phreatic_throw(msg);
    }
  }

  // boundary type
  registry_->Allocate(name_, "IBOUND", VariableKind::INTEGER, n);
  auto ibound = registry_->GetInt(name_, "IBOUND");
  if (plist_.isType<Teuchos::Array<int>>("ibound")) {
    auto values = plist_.get<Teuchos::Array<int>>("ibound");
    if (values.size() != n) {
      Errors::InvalidShapeError msg;
      msg << "GroundwaterFlowModel \"" << name_ << "\": \"ibound\" has " << values.size()
          << " entries, expected " << n << ".";
      Exceptions::phreatic_throw(msg);
    }
    std::copy(values.begin(), values.end(), ibound.begin());
  } else {
    std::fill(ibound.begin(), ibound.end(), plist_.get<int>("ibound", 1));
  }

  // wells
  registry_->Allocate(name_, "WELL", VariableKind::REAL, n);
  auto well = registry_->GetReal(name_, "WELL");
  auto cells = plist_.get<Teuchos::Array<int>>("well cells", Teuchos::Array<int>());
  auto rates = plist_.get<Teuchos::Array<double>>("well rates", Teuchos::Array<double>());
  if (cells.size() != rates.size()) {
    Errors::InvalidShapeError msg;
    msg << "GroundwaterFlowModel \"" << name_
        << "\": \"well cells\" and \"well rates\" differ in length.";
    Exceptions::phreatic_throw(msg);
  }
  for (int i = 0; i < cells.size(); ++i) {
    if (cells[i] < 0 || cells[i] >= n) {
      Errors::Message msg;
      msg << "GroundwaterFlowModel \"" << name_ << "\": well cell " << cells[i]
          << " is outside the grid.";
      Exceptions::phreatic_throw(msg);
    }
    well[cells[i]] += rates[i];
  }
}


/* ******************************************************************
* A cell array from a uniform value or one value per cell.
****************************************************************** */
void
GroundwaterFlowModel::FillCellArray_(const std::string& pname,
                                     const Key& vname,
                                     bool required,
                                     double dflt)
{
  int n = num_dofs();
  registry_->Allocate(name_, vname, VariableKind::REAL, n);
  auto values = registry_->GetReal(name_, vname);

  if (plist_.isType<Teuchos::Array<double>>(pname)) {
    auto array = plist_.get<Teuchos::Array<double>>(pname);
    if (array.size() != n) {
      Errors::InvalidShapeError msg;
      msg << "GroundwaterFlowModel \"" << name_ << "\": \"" << pname << "\" has "
          << array.size() << " entries, expected " << n << ".";
      Exceptions::phreatic_throw(msg);
    }
    std::copy(array.begin(), array.end(), values.begin());
  } else if (plist_.isType<double>(pname)) {
    std::fill(values.begin(), values.end(), plist_.get<double>(pname));
  } else if (!required) {
    std::fill(values.begin(), values.end(), dflt);
  } else {
    Errors::Message msg;
    msg << "GroundwaterFlowModel \"" << name_ << "\": parameter \"" << pname
        << "\" is missing or is not a double or an Array(double).";
    Exceptions::phreatic_throw(msg);
  }
}


void
GroundwaterFlowModel::InitialState(Teuchos::ArrayView<double> x)
{
  auto hold = registry_->GetReal(name_, "HOLD");
  std::copy(hold.begin(), hold.end(), x.begin());
}


void
GroundwaterFlowModel::InitializeTimestep(double t, double dt)
{
  t_ = t;
  dt_ = dt;
}


bool
GroundwaterFlowModel::IsActive(int cell) const
{
  return registry_->GetInt(name_, "IBOUND")[cell] > 0;
}


double
GroundwaterFlowModel::SaturatedThickness(int cell, double h) const
{
  const VariableRegistry& reg = *registry_;
  double top = reg.GetReal(name_, "TOP")[cell];
  double bot = reg.GetReal(name_, "BOT")[cell];
  double thick = top - bot;
  if (confined_) return thick;
  return std::min(thick, std::max(h - bot, kMinSaturatedFraction * thick));
}


double
GroundwaterFlowModel::Conductance_(int c1, int c2, double h1, double h2, double w, double l) const
{
  const VariableRegistry& reg = *registry_;
  auto K = reg.GetReal(name_, "K");
  double t1 = K[c1] * SaturatedThickness(c1, h1);
  double t2 = K[c2] * SaturatedThickness(c2, h2);
  if (t1 + t2 <= 0.0) return 0.0;
  return 2.0 * t1 * t2 / (t1 + t2) * w / l;
}


void
GroundwaterFlowModel::AddConnection_(int block,
                                     int c1,
                                     int c2,
                                     double cond,
                                     Teuchos::ArrayView<const double> x,
                                     Teuchos::ArrayView<const int> ibound,
                                     LinearSystem& system) const
{
  if (ibound[c1] == 0 || ibound[c2] == 0) return;

  if (ibound[c1] > 0 && ibound[c2] > 0) {
    system.AddToMatrix(block, c1, c1, cond);
    system.AddToMatrix(block, c1, c2, -cond);
    system.AddToMatrix(block, c2, c2, cond);
    system.AddToMatrix(block, c2, c1, -cond);
  } else if (ibound[c1] > 0) {
    system.AddToMatrix(block, c1, c1, cond);
    system.AddToRhs(block, c1, cond * x[c2]);
  } else if (ibound[c2] > 0) {
    system.AddToMatrix(block, c2, c2, cond);
    system.AddToRhs(block, c2, cond * x[c1]);
  }
}


/* ******************************************************************
* Every cell has a diagonal entry, connections between two active
* cells are the only off-diagonal entries.
****************************************************************** */
void
GroundwaterFlowModel::SymbolicAssemble(int block, LinearSystem& system)
{
  const VariableRegistry& reg = *registry_;
  auto ibound = reg.GetInt(name_, "IBOUND");

  for (int c = 0; c < nrow_ * ncol_; ++c) system.AddToGraph(block, c, c);

  for (int row = 0; row < nrow_; ++row) {
    for (int col = 0; col < ncol_; ++col) {
      int c = CellIndex(row, col);
      int nbrs[2] = { col + 1 < ncol_ ? CellIndex(row, col + 1) : -1,
                      row + 1 < nrow_ ? CellIndex(row + 1, col) : -1 };
      for (int n : nbrs) {
        if (n < 0 || ibound[c] <= 0 || ibound[n] <= 0) continue;
        system.AddToGraph(block, c, n);
        system.AddToGraph(block, n, c);
      }
    }
  }
}


/* ******************************************************************
* Adds the equations of all cells at the head x.
****************************************************************** */
void
GroundwaterFlowModel::Assemble(Teuchos::ArrayView<const double> x, int block, LinearSystem& system)
{
  const VariableRegistry& reg = *registry_;
  auto ibound = reg.GetInt(name_, "IBOUND");
  auto hold = reg.GetReal(name_, "HOLD");
  auto top = reg.GetReal(name_, "TOP");
  auto bot = reg.GetReal(name_, "BOT");
  auto ss = reg.GetReal(name_, "SS");
  auto sy = reg.GetReal(name_, "SY");
  auto rech = reg.GetReal(name_, "RECH");
  auto well = reg.GetReal(name_, "WELL");

  double area = delr_ * delc_;

  for (int row = 0; row < nrow_; ++row) {
    for (int col = 0; col < ncol_; ++col) {
      int c = CellIndex(row, col);

      if (ibound[c] <= 0) {
        system.AddToMatrix(block, c, c, 1.0);
        system.AddToRhs(block, c, x[c]);
        continue;
      }

      // storage
      if (!steady_ && dt_ > 0.0) {
        double sc = confined_ ? ss[c] * (top[c] - bot[c]) * area : sy[c] * area;
        system.AddToMatrix(block, c, c, sc / dt_);
        system.AddToRhs(block, c, sc / dt_ * hold[c]);
      }

      system.AddToRhs(block, c, rech[c] * area + well[c]);
    }
  }

  // each internal face once: east and south neighbours
  for (int row = 0; row < nrow_; ++row) {
    for (int col = 0; col < ncol_; ++col) {
      int c = CellIndex(row, col);
      if (col + 1 < ncol_) {
        int e = CellIndex(row, col + 1);
        double cond = Conductance_(c, e, x[c], x[e], delc_, delr_);
        AddConnection_(block, c, e, cond, x, ibound, system);
      }
      if (row + 1 < nrow_) {
        int s = CellIndex(row + 1, col);
        double cond = Conductance_(c, s, x[c], x[s], delr_, delc_);
        AddConnection_(block, c, s, cond, x, ibound, system);
      }
    }
  }
}


void
GroundwaterFlowModel::FinalizeTimestep(Teuchos::ArrayView<const double> x)
{
  auto hold = registry_->GetReal(name_, "HOLD");
  std::copy(x.begin(), x.end(), hold.begin());
}

} // namespace PhreaticFlow
} // namespace Phreatic
