/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Incomplete LU factorization with zero fill-in and optional relaxation.

/*!

Selected with `"preconditioner type`"=`"ilu`".  The factorization is
Ifpack's ILU on the sparsity pattern of the matrix (level of fill 0).  Fill
that would be created outside of the pattern is dropped, or, with a positive
`"relaxation factor`" omega, added to the diagonal of the same row scaled
by omega (MILU).  Omega is passed to Ifpack as `"fact: relax value`".

The symbolic part (Ifpack's Initialize) is kept between calls to Update()
as long as the matrix object and its number of nonzeros are unchanged; only
the numeric part (Compute) is redone.

A row without a nonzero diagonal entry cannot be factored.  Update() then
sets a negative returned_code() instead of building the factors.

*/

#ifndef PHREATIC_PRECONDITIONER_ILU_HH_
#define PHREATIC_PRECONDITIONER_ILU_HH_

#include "Ifpack_Preconditioner.h"

#include "Teuchos_RCP.hpp"
#include "Teuchos_ParameterList.hpp"

#include "Preconditioner.hh"

namespace Phreatic {
namespace PhreaticSolvers {

class PreconditionerILU : public Preconditioner {
 public:
  PreconditionerILU() : omega_(0.0), returned_code_(0), num_symbolic_(0){};

  void Init(const std::string& name, const Teuchos::ParameterList& list) override;
  void Update(const Teuchos::RCP<const Epetra_CrsMatrix>& A) override;
  void Destroy() override;

  int ApplyInverse(const Epetra_Vector& v, Epetra_Vector& hv) const override;

  int returned_code() const override { return returned_code_; }
  std::string name() const override { return "ilu"; }

  // statistics
  double relaxation() const { return omega_; }
  int num_symbolic_factorizations() const { return num_symbolic_; }

 private:
  int CheckDiagonal_(const Epetra_CrsMatrix& A) const;

 private:
  Teuchos::ParameterList list_;
  Teuchos::RCP<Ifpack_Preconditioner> IfpILU_;
  double omega_;
  mutable int returned_code_;

  Teuchos::RCP<const Epetra_CrsMatrix> last_matrix_;
  int last_nnz_ = -1;
  int num_symbolic_;
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
