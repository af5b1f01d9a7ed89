/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "errors.hh"
#include "LinearSystem.hh"

namespace Phreatic {

LinearSystem::LinearSystem(const Teuchos::RCP<const SolutionMap>& map,
                           const Teuchos::RCP<VariableRegistry>& registry,
                           const Key& origin)
  : map_(map), registry_(registry), graph_changed_(false), structure_changed_(false)
{
  int n = map_->size();
  rhs_handle_ = registry_->Allocate(origin, "RHS", VariableKind::REAL, n);
}


void
LinearSystem::CheckIndex_(int gid) const
{
  if (gid < 0 || gid >= map_->size()) {
    Errors::Message msg;
    msg << "LinearSystem: index " << gid << " is outside of the system of size " << map_->size();
    Exceptions::phreatic_throw(msg);
  }
}


/* ******************************************************************
* Symbolic phase. The first insertion after a completed graph starts
* a new graph.
****************************************************************** */
void
LinearSystem::AddToGraph(int row, int col)
{
  CheckIndex_(row);
  CheckIndex_(col);
  if (graph_ == Teuchos::null || graph_->Filled()) {
    graph_ = Teuchos::rcp(new Epetra_CrsGraph(Copy, map_->Map(), 5, false));
  }

  int ierr = graph_->InsertGlobalIndices(row, 1, &col);
  if (ierr < 0) {
    Errors::Message msg;
    msg << "LinearSystem: InsertGlobalIndices failed in row " << row << " with code " << ierr;
    Exceptions::phreatic_throw(msg);
  }
}


void
LinearSystem::FillCompleteGraph()
{
  if (graph_ == Teuchos::null || graph_->Filled()) {
    graph_ = Teuchos::rcp(new Epetra_CrsGraph(Copy, map_->Map(), 1, false));
  }
  graph_->FillComplete();

  A_ = Teuchos::rcp(new Epetra_CrsMatrix(Copy, *graph_));
  A_->FillComplete();
  graph_changed_ = true;
}


/* ******************************************************************
* Numeric phase.
****************************************************************** */
void
LinearSystem::Zero()
{
  if (A_ != Teuchos::null) A_->PutScalar(0.0);
  auto b = registry_->GetReal(rhs_handle_);
  for (int i = 0; i < b.size(); ++i) b[i] = 0.0;
}


void
LinearSystem::AddToMatrix(int row, int col, double value)
{
  CheckIndex_(row);
  CheckIndex_(col);
  if (A_ == Teuchos::null) {
    Errors::Message msg("LinearSystem: AddToMatrix() called before FillCompleteGraph().");
    Exceptions::phreatic_throw(msg);
  }

  int ierr = A_->SumIntoGlobalValues(row, 1, &value, &col);
  if (ierr != 0) {
    Errors::Message msg;
    msg << "LinearSystem: entry (" << row << ", " << col << ") is not in the graph.";
    Exceptions::phreatic_throw(msg);
  }
}


void
LinearSystem::AddToRhs(int row, double value)
{
  CheckIndex_(row);
  registry_->GetReal(rhs_handle_)[row] += value;
}


void
LinearSystem::FillComplete()
{
  matrix();
  structure_changed_ = graph_changed_;
  graph_changed_ = false;
}


const Epetra_CrsMatrix&
LinearSystem::matrix() const
{
  if (A_ == Teuchos::null) {
    Errors::Message msg("LinearSystem: matrix requested before FillCompleteGraph().");
    Exceptions::phreatic_throw(msg);
  }
  return *A_;
}


Teuchos::RCP<const Epetra_CrsMatrix>
LinearSystem::matrix_ptr() const
{
  matrix();
  return A_;
}


Teuchos::RCP<Epetra_Vector>
LinearSystem::rhs()
{
  auto b = registry_->GetReal(rhs_handle_);
  return Teuchos::rcp(new Epetra_Vector(View, map_->Map(), b.getRawPtr()));
}


Teuchos::RCP<const Epetra_Vector>
LinearSystem::rhs() const
{
  auto b = Teuchos::rcp_const_cast<const VariableRegistry>(registry_)->GetReal(rhs_handle_);
  return Teuchos::rcp(
    new Epetra_Vector(View, map_->Map(), const_cast<double*>(b.getRawPtr())));
}


double
LinearSystem::GetMatrixEntry(int row, int col) const
{
  CheckIndex_(row);
  const Epetra_CrsMatrix& A = matrix();

  int n;
  double* values;
  int* indices;
  A.ExtractMyRowView(A.RowMap().LID(row), n, values, indices);
  for (int k = 0; k < n; ++k) {
    if (A.GCID(indices[k]) == col) return values[k];
  }
  return 0.0;
}


int
LinearSystem::num_nonzeros() const
{
  return (A_ == Teuchos::null) ? 0 : A_->NumMyNonzeros();
}

} // namespace Phreatic
