/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Identity as a preconditioner.

/*!

Simply copies the input vector to the output.  Selected with
`"preconditioner type`"=`"identity`".  No parameters are required.

*/

#ifndef PHREATIC_PRECONDITIONER_IDENTITY_HH_
#define PHREATIC_PRECONDITIONER_IDENTITY_HH_

#include "Preconditioner.hh"

namespace Phreatic {
namespace PhreaticSolvers {

class PreconditionerIdentity : public Preconditioner {
 public:
  PreconditionerIdentity(){};

  void Init(const std::string& name, const Teuchos::ParameterList& list) override {};
  void Update(const Teuchos::RCP<const Epetra_CrsMatrix>& A) override {};
  void Destroy() override {};

  int ApplyInverse(const Epetra_Vector& v, Epetra_Vector& hv) const override
  {
    hv.Update(1.0, v, 0.0);
    return 0;
  }

  int returned_code() const override { return 0; }
  std::string name() const override { return "identity"; }
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
