/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! The interface for a model, one block of degrees of freedom of a solution group.
/*!

A model owns the discretization of one set of equations.  The solver core
sees it only through this interface: it is asked for its initial state, for
its contribution to the matrix and right-hand side at a given state, and how
an update changes that state.

All vectors passed to a model are views of the model's block of the group
vectors, indexed by cell.

*/

/*
Developer's note:

Models deriving from this class must implement the constructor

  Model(const Key& name, Teuchos::ParameterList& plist);

and add a private static member of type RegisteredModelFactory (see
Model_Factory.hh) to register themselves with the model factory.
*/

#ifndef PHREATIC_MODEL_BASE_HH_
#define PHREATIC_MODEL_BASE_HH_

#include "Teuchos_ArrayView.hpp"
#include "Teuchos_RCP.hpp"

#include "Key.hh"
#include "LinearSystem.hh"
#include "VariableRegistry.hh"

namespace Phreatic {

class ModelBase {
 public:
  virtual ~ModelBase() = default;

  virtual const Key& name() const = 0;
  virtual int num_dofs() const = 0;

  // Registers the model arrays under the origin name().
  virtual void Setup(const Teuchos::RCP<VariableRegistry>& registry) = 0;

  virtual void InitialState(Teuchos::ArrayView<double> x) = 0;

  // start of a time step of size dt ending at time t
  virtual void InitializeTimestep(double t, double dt) = 0;

  // Inserts every entry Assemble() may add into the graph of the system.
  // The default is the diagonal.
  virtual void SymbolicAssemble(int block, LinearSystem& system)
  {
    for (int i = 0; i < num_dofs(); ++i) system.AddToGraph(block, i, i);
  }

  // Adds the diagonal block of the model at the state x to the system.
  virtual void Assemble(Teuchos::ArrayView<const double> x, int block, LinearSystem& system) = 0;

  virtual void ApplyUpdate(Teuchos::ArrayView<double> x, Teuchos::ArrayView<const double> dx)
  {
    for (int i = 0; i < x.size(); ++i) x[i] += dx[i];
  }

  virtual void ComputeChange(Teuchos::ArrayView<const double> x_old,
                             Teuchos::ArrayView<const double> x_new,
                             Teuchos::ArrayView<double> change)
  {
    for (int i = 0; i < change.size(); ++i) change[i] = x_new[i] - x_old[i];
  }

  // The state of the converged time step is accepted.
  virtual void FinalizeTimestep(Teuchos::ArrayView<const double> x) = 0;

  virtual bool IsActive(int cell) const { return true; }
};

} // namespace Phreatic

#endif
