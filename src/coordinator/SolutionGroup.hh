/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! A set of models and exchanges solved together as one system.
/*!

Each member model owns a contiguous block of the group's degrees of freedom,
in the order the models are added.  One outer iteration assembles the
diagonal blocks of all models and the couplings of all exchanges into one
linear system.

* `"models`" ``[Array(string)]`` Member models, in block order.
* `"exchanges`" ``[Array(string)]`` **{}** Exchanges between member models.
* `"nonlinear solver`" ``[list]`` See NonlinearSolver.
* `"linear solver`" ``[list]`` See LinearSolverFactory.
* `"verbose object`" ``[verbose-object-spec]``

The group registers X (current state), XOLD (state at the start of the
time step) and IACTIVE under its name, the right-hand side under its name
as well, the outer-iteration storage under "<name>-nonlinear" and the
linear solver storage under "<name>-linear".

*/

#ifndef PHREATIC_SOLUTION_GROUP_HH_
#define PHREATIC_SOLUTION_GROUP_HH_

#include <vector>

#include "Teuchos_ParameterList.hpp"
#include "Teuchos_RCP.hpp"
#include "Epetra_Vector.h"

#include "ExchangeBase.hh"
#include "Key.hh"
#include "LinearSystem.hh"
#include "ModelBase.hh"
#include "NonlinearSolver.hh"
#include "PhreaticTypes.hh"
#include "SolutionMap.hh"
#include "SolverFnBase.hh"
#include "VariableRegistry.hh"
#include "VerboseObject.hh"

namespace Phreatic {

class SolutionGroup : public PhreaticSolvers::SolverFnBase {
 public:
  SolutionGroup(const Key& name,
                Teuchos::ParameterList& plist,
                const Teuchos::RCP<VariableRegistry>& registry,
                const Comm_ptr_type& comm);

  // membership, before Setup()
  void AddModel(const Teuchos::RCP<ModelBase>& model);
  void AddExchange(const Teuchos::RCP<ExchangeBase>& exchange);

  // Sets up the models, then the group storage and solvers, then the exchanges.
  void Setup();

  // initial state of all models into X
  void Initialize();

  void InitializeTimestep(double t, double dt);
  int Solve();
  void FinalizeTimestep();

  // Releases everything the group and its members registered.
  void Teardown();

  // SolverFnBase
  void Assemble(const Epetra_Vector& u) override;
  Teuchos::RCP<const Epetra_CrsMatrix> Matrix() const override { return system_->matrix_ptr(); }
  Teuchos::RCP<const Epetra_Vector> Rhs() const override;
  void ComputeChange(const Epetra_Vector& u, const Epetra_Vector& x, Epetra_Vector& du) override;
  void ApplyUpdate(Epetra_Vector& u, const Epetra_Vector& du) override;
  bool IsActive(int gid) const override;
  DofLocation Location(int gid) const override { return map_->Location(gid); }

  // access
  const Key& name() const { return name_; }
  int num_models() const { return models_.size(); }
  const ModelBase& model(int i) const { return *models_[i]; }
  int num_exchanges() const { return exchanges_.size(); }
  const SolutionMap& map() const { return *map_; }
  KeyVector block_names() const;
  const LinearSystem& system() const { return *system_; }
  const PhreaticSolvers::NonlinearSolver& nonlinear_solver() const { return *nonlinear_; }

  Teuchos::ArrayView<const double> state() const;
  Teuchos::ArrayView<const double> ModelState(const Key& model) const;

 private:
  Teuchos::RCP<Epetra_Vector> ViewOf_(const Key& name);
  void UpdateActive_();
  void CheckSetup_(const char* fname) const;

 private:
  Key name_;
  Teuchos::ParameterList plist_;
  Teuchos::RCP<VariableRegistry> registry_;
  Comm_ptr_type comm_;
  Teuchos::RCP<VerboseObject> vo_;

  std::vector<Teuchos::RCP<ModelBase>> models_;
  std::vector<Teuchos::RCP<ExchangeBase>> exchanges_;

  Teuchos::RCP<SolutionMap> map_;
  Teuchos::RCP<LinearSystem> system_;
  Teuchos::RCP<PhreaticSolvers::LinearSolver> linear_;
  Teuchos::RCP<PhreaticSolvers::NonlinearSolver> nonlinear_;

  Teuchos::RCP<Epetra_Vector> x_;
  bool setup_;
};

} // namespace Phreatic

#endif
