/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Diagonal preconditioner.

/*!

Simply applies the pointwise inverse of the diagonal of the matrix as an
extremely cheap preconditioner.  Selected with
`"preconditioner type`"=`"diagonal`".  No parameters are required.
A zero diagonal entry results in a negative returned_code().

*/

#ifndef PHREATIC_PRECONDITIONER_DIAGONAL_HH_
#define PHREATIC_PRECONDITIONER_DIAGONAL_HH_

#include "dbc.hh"
#include "Preconditioner.hh"

namespace Phreatic {
namespace PhreaticSolvers {

class PreconditionerDiagonal : public Preconditioner {
 public:
  PreconditionerDiagonal() : returned_code_(0){};

  void Init(const std::string& name, const Teuchos::ParameterList& list) override {};

  void Update(const Teuchos::RCP<const Epetra_CrsMatrix>& A) override
  {
    diagonal_ = Teuchos::rcp(new Epetra_Vector(A->RowMap()));
    A->ExtractDiagonalCopy(*diagonal_);

    // a zero diagonal entry cannot be inverted
    for (int i = 0; i < diagonal_->MyLength(); ++i) {
      if ((*diagonal_)[i] == 0.0) {
        returned_code_ = -2;
        return;
      }
    }
    returned_code_ = diagonal_->Reciprocal(*diagonal_);
  }

  void Destroy() override { diagonal_ = Teuchos::null; }

  int ApplyInverse(const Epetra_Vector& v, Epetra_Vector& hv) const override
  {
    PHREATIC_ASSERT(diagonal_.get()); // Update called
    returned_code_ = hv.Multiply(1.0, v, *diagonal_, 0.0);
    return returned_code_;
  }

  int returned_code() const override { return returned_code_; }
  std::string name() const override { return "diagonal"; }

 private:
  Teuchos::RCP<Epetra_Vector> diagonal_;
  mutable int returned_code_;
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
