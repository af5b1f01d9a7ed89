/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! A single-layer structured-grid groundwater flow model.
/*!

The model discretizes

  S dh/dt = div(T grad h) + R + Q

on an `"number of rows`" by `"number of columns`" grid of cells with cell
centred finite volumes.  Cell (row, col) has the local index
row * ncol + col.  Conductances between neighbours use the harmonic mean of
the transmissivities T = K * b.  For a confined model the saturated
thickness b is top - bottom.  For an unconfined model b = h - bottom,
evaluated at the current outer iterate (Picard linearization) and limited
to the range [0.01 (top - bottom), top - bottom].

Cell values below are either a single number applied to all cells or an
array with one entry per cell.

* `"model type`" ``[string]`` **"groundwater flow"**
* `"number of rows`" ``[int]``
* `"number of columns`" ``[int]``
* `"cell width`" ``[double]`` **1.0** Cell size along a row.
* `"cell height`" ``[double]`` **1.0** Cell size along a column.
* `"confined`" ``[bool]`` **true**
* `"steady state`" ``[bool]`` **false** No storage term when true.
* `"hydraulic conductivity`" ``[double]`` or ``[Array(double)]``
* `"top`" ``[double]`` or ``[Array(double)]``
* `"bottom`" ``[double]`` or ``[Array(double)]``
* `"specific storage`" ``[double]`` or ``[Array(double)]`` **0.0**
* `"specific yield`" ``[double]`` or ``[Array(double)]`` **0.0**
* `"recharge`" ``[double]`` or ``[Array(double)]`` **0.0** Rate per unit area.
* `"starting head`" ``[double]`` or ``[Array(double)]``
* `"ibound`" ``[int]`` or ``[Array(int)]`` **1** 1 for active cells, 0 for
  inactive cells, -1 for constant-head cells held at their starting head.
* `"well cells`" ``[Array(int)]`` **{}** and `"well rates`" ``[Array(double)]``
  **{}** Volumetric rates, positive into the aquifer.

Constant-head and inactive cells get an identity row; the constant-head
values are moved to the right-hand side of their active neighbours so that
the matrix stays symmetric.

The cell arrays K, TOP, BOT, SS, SY, RECH, WELL, HOLD and IBOUND are
registered under the model name.

*/

#ifndef PHREATIC_FLOW_GROUNDWATER_FLOW_MODEL_HH_
#define PHREATIC_FLOW_GROUNDWATER_FLOW_MODEL_HH_

#include "Teuchos_ParameterList.hpp"
#include "Teuchos_RCP.hpp"

#include "Key.hh"
#include "ModelBase.hh"
#include "Model_Factory.hh"
#include "VariableRegistry.hh"

namespace Phreatic {
namespace PhreaticFlow {

class GroundwaterFlowModel : public ModelBase {
 public:
  GroundwaterFlowModel(const Key& name, Teuchos::ParameterList& plist);

  const Key& name() const override { return name_; }
  int num_dofs() const override { return nrow_ * ncol_; }

  void Setup(const Teuchos::RCP<VariableRegistry>& registry) override;
  void InitialState(Teuchos::ArrayView<double> x) override;
  void InitializeTimestep(double t, double dt) override;
  void SymbolicAssemble(int block, LinearSystem& system) override;
  void Assemble(Teuchos::ArrayView<const double> x, int block, LinearSystem& system) override;
  void FinalizeTimestep(Teuchos::ArrayView<const double> x) override;
  bool IsActive(int cell) const override;

  // grid
  int nrow() const { return nrow_; }
  int ncol() const { return ncol_; }
  int CellIndex(int row, int col) const { return row * ncol_ + col; }
  bool confined() const { return confined_; }

  // saturated thickness of a cell at head h
  double SaturatedThickness(int cell, double h) const;

 private:
  // conductance between the cells c1 and c2, connected across a face of
  // length w at distance l
  double Conductance_(int c1, int c2, double h1, double h2, double w, double l) const;
  void AddConnection_(int block,
                      int c1,
                      int c2,
                      double cond,
                      Teuchos::ArrayView<const double> x,
                      Teuchos::ArrayView<const int> ibound,
                      LinearSystem& system) const;

  void FillCellArray_(const std::string& pname, const Key& vname, bool required, double dflt);

 private:
  Key name_;
  Teuchos::ParameterList plist_;
  Teuchos::RCP<VariableRegistry> registry_;

  int nrow_, ncol_;
  double delr_, delc_;
  bool confined_, steady_;
  double t_, dt_;

  static RegisteredModelFactory<GroundwaterFlowModel> reg_;
};

} // namespace PhreaticFlow
} // namespace Phreatic

#endif
