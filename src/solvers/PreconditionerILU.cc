/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "Ifpack.h"
#include "Epetra_Vector.h"

#include "errors.hh"
#include "PreconditionerILU.hh"

namespace Phreatic {
namespace PhreaticSolvers {

/* ******************************************************************
* Available parameter: "relaxation factor" [double] in [0, 1], default 0.
****************************************************************** */
void
PreconditionerILU::Init(const std::string& name, const Teuchos::ParameterList& list)
{
  omega_ = 0.0;
  if (list.isParameter("relaxation factor")) omega_ = list.get<double>("relaxation factor");
  if (omega_ < 0.0 || omega_ > 1.0) {
    Errors::Message msg;
    msg << "PreconditionerILU: \"relaxation factor\" " << omega_ << " is outside of [0, 1].";
    Exceptions::phreatic_throw(msg);
  }

  list_ = Teuchos::ParameterList("ilu parameters");
  list_.set<double>("fact: relax value", omega_);
  list_.set<int>("fact: level-of-fill", 0);
  list_.set<double>("fact: absolute threshold", 0.0);
  list_.set<double>("fact: relative threshold", 1.0);

  Destroy();
}


/* ******************************************************************
* Rebuild the preconditioner using the given matrix A.  According to
* Ifpack documentation, the error code is 0 on success.
****************************************************************** */
void
PreconditionerILU::Update(const Teuchos::RCP<const Epetra_CrsMatrix>& A)
{
  returned_code_ = CheckDiagonal_(*A);
  if (returned_code_ != 0) {
    Destroy();
    return;
  }

  if (IfpILU_ == Teuchos::null || A.get() != last_matrix_.get() ||
      A->NumMyNonzeros() != last_nnz_) {
    Ifpack factory;

    // Ifpack takes a non-const matrix but does not modify it
    auto A_nc = Teuchos::rcp_const_cast<Epetra_CrsMatrix>(A);
    IfpILU_ = Teuchos::rcp(factory.Create("ILU", &*A_nc, 0));

    IfpILU_->SetParameters(list_);
    returned_code_ = IfpILU_->Initialize();
    if (returned_code_ != 0) {
      Destroy();
      return;
    }

    last_matrix_ = A;
    last_nnz_ = A->NumMyNonzeros();
    num_symbolic_++;
  }

  returned_code_ = IfpILU_->Compute();
  if (returned_code_ != 0) Destroy();
}


void
PreconditionerILU::Destroy()
{
  IfpILU_ = Teuchos::null;
  last_matrix_ = Teuchos::null;
  last_nnz_ = -1;
}


/* ******************************************************************
* Every row needs a nonzero diagonal entry.
****************************************************************** */
int
PreconditionerILU::CheckDiagonal_(const Epetra_CrsMatrix& A) const
{
  Epetra_Vector diag(A.RowMap());
  int ierr = A.ExtractDiagonalCopy(diag);
  if (ierr != 0) return -1;

  for (int i = 0; i < diag.MyLength(); ++i) {
    if (diag[i] == 0.0) return -2;
  }
  return 0;
}


/* ******************************************************************
* hv = (LU)^{-1} v
****************************************************************** */
int
PreconditionerILU::ApplyInverse(const Epetra_Vector& v, Epetra_Vector& hv) const
{
  if (IfpILU_ == Teuchos::null) {
    Errors::Message msg("PreconditionerILU: ApplyInverse() called without a valid factorization.");
    Exceptions::phreatic_throw(msg);
  }
  returned_code_ = IfpILU_->ApplyInverse(v, hv);
  return returned_code_;
}

} // namespace PhreaticSolvers
} // namespace Phreatic
