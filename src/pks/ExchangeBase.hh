/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! The interface for an exchange, a coupling between two models of one solution group.
/*!

An exchange adds the off-diagonal terms between the blocks of its two
models, and the matching diagonal and right-hand-side terms, to the system
of the solution group.  The state x is the whole group vector; the solution
map locates the blocks of the two models.

Exchanges are registered like models (see Exchange_Factory.hh) and are
constructed with

  Exchange(const Key& name, Teuchos::ParameterList& plist);

*/

#ifndef PHREATIC_EXCHANGE_BASE_HH_
#define PHREATIC_EXCHANGE_BASE_HH_

#include "Teuchos_ArrayView.hpp"
#include "Teuchos_RCP.hpp"

#include "Key.hh"
#include "LinearSystem.hh"
#include "SolutionMap.hh"
#include "VariableRegistry.hh"

namespace Phreatic {

class ExchangeBase {
 public:
  virtual ~ExchangeBase() = default;

  virtual const Key& name() const = 0;
  virtual const Key& model1() const = 0;
  virtual const Key& model2() const = 0;

  // Called after both models are set up.
  virtual void Setup(const Teuchos::RCP<VariableRegistry>& registry) = 0;

  // Inserts every entry Assemble() may add into the graph of the system.
  virtual void SymbolicAssemble(LinearSystem& system, const SolutionMap& map) = 0;

  virtual void
  Assemble(Teuchos::ArrayView<const double> x, LinearSystem& system, const SolutionMap& map) = 0;
};

} // namespace Phreatic

#endif
