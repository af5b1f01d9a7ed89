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
#include "LinearSolverFactory.hh"
#include "SolutionGroup.hh"

namespace Phreatic {

SolutionGroup::SolutionGroup(const Key& name,
                             Teuchos::ParameterList& plist,
                             const Teuchos::RCP<VariableRegistry>& registry,
                             const Comm_ptr_type& comm)
  : name_(name), plist_(plist), registry_(registry), comm_(comm), setup_(false)
{
  vo_ = Teuchos::rcp(new VerboseObject("SolutionGroup:" + name_, plist_));
}


void
SolutionGroup::AddModel(const Teuchos::RCP<ModelBase>& model)
{
  if (setup_) {
    Errors::Message msg;
    msg << "SolutionGroup \"" << name_ << "\": model \"" << model->name()
        << "\" added after Setup().";
    Exceptions::phreatic_throw(msg);
  }
  for (const auto& m : models_) {
    if (m->name() == model->name()) {
      Errors::DuplicateNameError msg;
      msg << "SolutionGroup \"" << name_ << "\": model \"" << model->name()
          << "\" is added twice.";
      Exceptions::phreatic_throw(msg);
    }
  }
  models_.push_back(model);
}


void
SolutionGroup::AddExchange(const Teuchos::RCP<ExchangeBase>& exchange)
{
  if (setup_) {
    Errors::Message msg;
    msg << "SolutionGroup \"" << name_ << "\": exchange \"" << exchange->name()
        << "\" added after Setup().";
    Exceptions::phreatic_throw(msg);
  }
  exchanges_.push_back(exchange);
}


/* ******************************************************************
* Models first, since the exchanges read their arrays. The graph of
* the system is built once, from the stencils of models and exchanges.
****************************************************************** */
void
SolutionGroup::Setup()
{
  if (models_.empty()) {
    Errors::Message msg;
    msg << "SolutionGroup \"" << name_ << "\" has no models.";
    Exceptions::phreatic_throw(msg);
  }

  map_ = Teuchos::rcp(new SolutionMap(comm_));
  for (const auto& model : models_) {
    model->Setup(registry_);
    map_->AddBlock(model->name(), model->num_dofs());
  }
  map_->Finalize();

  int n = map_->size();
  registry_->Allocate(name_, "X", VariableKind::REAL, n);
  registry_->Allocate(name_, "XOLD", VariableKind::REAL, n);
  registry_->Allocate(name_, "IACTIVE", VariableKind::INTEGER, n);
  x_ = ViewOf_("X");

  system_ = Teuchos::rcp(new LinearSystem(map_, registry_, name_));

  PhreaticSolvers::LinearSolverFactory factory;
  linear_ = factory.Create(
    plist_.sublist("linear solver"), registry_, Keys::getOrigin(name_, "linear"));
  nonlinear_ = Teuchos::rcp(new PhreaticSolvers::NonlinearSolver(
    plist_.sublist("nonlinear solver"), linear_, registry_, Keys::getOrigin(name_, "nonlinear")));
  nonlinear_->Init(Teuchos::rcpFromRef(*this), map_->Map());

  for (const auto& exchange : exchanges_) {
    const KeyVector names = block_names();
    for (const Key& m : { exchange->model1(), exchange->model2() }) {
      if (std::find(names.begin(), names.end(), m) == names.end()) {
        Errors::NotFoundError msg;
        msg << "SolutionGroup \"" << name_ << "\": exchange \"" << exchange->name()
            << "\" couples model \"" << m << "\" which is not a member.";
        Exceptions::phreatic_throw(msg);
      }
    }
    exchange->Setup(registry_);
  }

  // graph of the joint system
  for (int i = 0; i < models_.size(); ++i) models_[i]->SymbolicAssemble(i, *system_);
  for (const auto& exchange : exchanges_) exchange->SymbolicAssemble(*system_, *map_);
  system_->FillCompleteGraph();

  setup_ = true;

  if (vo_->os_OK(Teuchos::VERB_MEDIUM)) {
    Teuchos::OSTab tab = vo_->getOSTab();
    *vo_->os() << "models: " << models_.size() << ", exchanges: " << exchanges_.size()
               << ", unknowns: " << n << ", linear solver: \"" << linear_->name() << "\""
               << std::endl;
  }
}


void
SolutionGroup::Initialize()
{
  CheckSetup_("Initialize");

  auto x = registry_->GetReal(name_, "X");
  for (int i = 0; i < models_.size(); ++i) {
    models_[i]->InitialState(x.view(map_->offset(i), map_->block_size(i)));
  }

  auto xold = registry_->GetReal(name_, "XOLD");
  std::copy(x.begin(), x.end(), xold.begin());
  UpdateActive_();
}


void
SolutionGroup::InitializeTimestep(double t, double dt)
{
  CheckSetup_("InitializeTimestep");

  auto x = registry_->GetReal(name_, "X");
  auto xold = registry_->GetReal(name_, "XOLD");
  std::copy(x.begin(), x.end(), xold.begin());

  for (const auto& model : models_) model->InitializeTimestep(t, dt);
  UpdateActive_();
}


int
SolutionGroup::Solve()
{
  CheckSetup_("Solve");
  return nonlinear_->Solve(x_);
}


void
SolutionGroup::FinalizeTimestep()
{
  CheckSetup_("FinalizeTimestep");

  const VariableRegistry& reg = *registry_;
  auto x = reg.GetReal(name_, "X");
  for (int i = 0; i < models_.size(); ++i) {
    models_[i]->FinalizeTimestep(x.view(map_->offset(i), map_->block_size(i)));
  }
}


/* ******************************************************************
* Drops the solvers before releasing the storage they view.
****************************************************************** */
void
SolutionGroup::Teardown()
{
  if (!setup_) return;

  nonlinear_ = Teuchos::null;
  linear_ = Teuchos::null;
  system_ = Teuchos::null;
  x_ = Teuchos::null;

  int nvars = registry_->ReleaseOrigin(name_);
  nvars += registry_->ReleaseOrigin(Keys::getOrigin(name_, "linear"));
  nvars += registry_->ReleaseOrigin(Keys::getOrigin(name_, "nonlinear"));
  for (const auto& exchange : exchanges_) nvars += registry_->ReleaseOrigin(exchange->name());
  for (const auto& model : models_) nvars += registry_->ReleaseOrigin(model->name());

  setup_ = false;

  if (vo_->os_OK(Teuchos::VERB_HIGH)) {
    Teuchos::OSTab tab = vo_->getOSTab();
    *vo_->os() << "released " << nvars << " variables" << std::endl;
  }
}


/* ******************************************************************
* SolverFnBase: the system at the state u.
****************************************************************** */
void
SolutionGroup::Assemble(const Epetra_Vector& u)
{
  system_->Zero();

  Teuchos::ArrayView<const double> uv(u.Values(), u.MyLength());
  for (int i = 0; i < models_.size(); ++i) {
    models_[i]->Assemble(uv.view(map_->offset(i), map_->block_size(i)), i, *system_);
  }
  for (const auto& exchange : exchanges_) exchange->Assemble(uv, *system_, *map_);

  system_->FillComplete();
}


Teuchos::RCP<const Epetra_Vector>
SolutionGroup::Rhs() const
{
  return system_->rhs();
}


void
SolutionGroup::ComputeChange(const Epetra_Vector& u, const Epetra_Vector& x, Epetra_Vector& du)
{
  int n = map_->size();
  Teuchos::ArrayView<const double> uv(u.Values(), n);
  Teuchos::ArrayView<const double> xv(x.Values(), n);
  Teuchos::ArrayView<double> duv(du.Values(), n);

  for (int i = 0; i < models_.size(); ++i) {
    int off = map_->offset(i), size = map_->block_size(i);
    models_[i]->ComputeChange(uv.view(off, size), xv.view(off, size), duv.view(off, size));
  }
}


void
SolutionGroup::ApplyUpdate(Epetra_Vector& u, const Epetra_Vector& du)
{
  int n = map_->size();
  Teuchos::ArrayView<double> uv(u.Values(), n);
  Teuchos::ArrayView<const double> duv(du.Values(), n);

  for (int i = 0; i < models_.size(); ++i) {
    int off = map_->offset(i), size = map_->block_size(i);
    models_[i]->ApplyUpdate(uv.view(off, size), duv.view(off, size));
  }
}


bool
SolutionGroup::IsActive(int gid) const
{
  const VariableRegistry& reg = *registry_;
  return reg.GetInt(name_, "IACTIVE")[gid] > 0;
}


/* ******************************************************************
* Access
****************************************************************** */
KeyVector
SolutionGroup::block_names() const
{
  KeyVector names;
  for (const auto& model : models_) names.push_back(model->name());
  return names;
}


Teuchos::ArrayView<const double>
SolutionGroup::state() const
{
  CheckSetup_("state");
  const VariableRegistry& reg = *registry_;
  return reg.GetReal(name_, "X");
}


Teuchos::ArrayView<const double>
SolutionGroup::ModelState(const Key& model) const
{
  int i = map_->BlockIndex(model);
  return state().view(map_->offset(i), map_->block_size(i));
}


Teuchos::RCP<Epetra_Vector>
SolutionGroup::ViewOf_(const Key& name)
{
  auto v = registry_->GetReal(name_, name);
  return Teuchos::rcp(new Epetra_Vector(View, map_->Map(), v.getRawPtr()));
}


void
SolutionGroup::UpdateActive_()
{
  auto active = registry_->GetInt(name_, "IACTIVE");
  for (int i = 0; i < models_.size(); ++i) {
    int off = map_->offset(i);
    for (int c = 0; c < map_->block_size(i); ++c) {
      active[off + c] = models_[i]->IsActive(c) ? 1 : 0;
    }
  }
}


void
SolutionGroup::CheckSetup_(const char* fname) const
{
  if (!setup_) {
    Errors::Message msg;
    msg << "SolutionGroup \"" << name_ << "\": " << fname << "() called before Setup().";
    Exceptions::phreatic_throw(msg);
  }
}

} // namespace Phreatic
