/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Conductance connections between the cells of two groundwater flow models.
/*!

Connection i joins cell `"cells 1`"[i] of `"model 1`" with cell
`"cells 2`"[i] of `"model 2`" through the conductance `"conductances`"[i].
Connections touching an inactive cell are ignored; a connection to a
constant-head cell moves the constant head to the right-hand side of the
active cell.

* `"exchange type`" ``[string]`` **"groundwater exchange"**
* `"model 1`" ``[string]``
* `"model 2`" ``[string]``
* `"cells 1`" ``[Array(int)]`` 0-based local cell indices in model 1.
* `"cells 2`" ``[Array(int)]`` 0-based local cell indices in model 2.
* `"conductances`" ``[Array(double)]``

The connection arrays CELLM1, CELLM2 and COND are registered under the
exchange name.  Both models must have registered IBOUND before Setup().

*/

#ifndef PHREATIC_FLOW_GROUNDWATER_EXCHANGE_HH_
#define PHREATIC_FLOW_GROUNDWATER_EXCHANGE_HH_

#include "Teuchos_ParameterList.hpp"
#include "Teuchos_RCP.hpp"

#include "ExchangeBase.hh"
#include "Exchange_Factory.hh"
#include "Key.hh"

namespace Phreatic {
namespace PhreaticFlow {

class GroundwaterExchange : public ExchangeBase {
 public:
  GroundwaterExchange(const Key& name, Teuchos::ParameterList& plist);

  const Key& name() const override { return name_; }
  const Key& model1() const override { return model1_; }
  const Key& model2() const override { return model2_; }

  void Setup(const Teuchos::RCP<VariableRegistry>& registry) override;
  void SymbolicAssemble(LinearSystem& system, const SolutionMap& map) override;
  void
  Assemble(Teuchos::ArrayView<const double> x, LinearSystem& system, const SolutionMap& map) override;

  int num_connections() const { return nexg_; }

 private:
  Key name_, model1_, model2_;
  Teuchos::ParameterList plist_;
  Teuchos::RCP<VariableRegistry> registry_;
  int nexg_;

  static RegisteredExchangeFactory<GroundwaterExchange> reg_;
};

} // namespace PhreaticFlow
} // namespace Phreatic

#endif
