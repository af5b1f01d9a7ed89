/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! A base class for assembled preconditioners.

/*!

The linear solvers support three preconditioners, selected with the
parameter `"preconditioner type`" of the `"linear solver`" list.

* `"preconditioner type`" ``[string]`` **"ilu"** One of `"ilu`",
  `"diagonal`" or `"identity`".

* `"relaxation factor`" ``[double]`` **0.0** Used by `"ilu`" only.  Fill
  dropped by the zero fill-in factorization is added to the diagonal scaled
  by this factor: 0 gives ILU(0), 1 gives modified ILU(0).

.. code-block:: xml

  <ParameterList name="linear solver">
    <Parameter name="preconditioner type" type="string" value="ilu"/>
    <Parameter name="relaxation factor" type="double" value="0.97"/>
  </ParameterList>

*/

#ifndef PHREATIC_PRECONDITIONER_HH_
#define PHREATIC_PRECONDITIONER_HH_

#include <string>

#include "Teuchos_RCP.hpp"
#include "Teuchos_ParameterList.hpp"
#include "Epetra_CrsMatrix.h"
#include "Epetra_Vector.h"

namespace Phreatic {
namespace PhreaticSolvers {

class Preconditioner {
 public:
  virtual ~Preconditioner() = default;

  virtual void Init(const std::string& name, const Teuchos::ParameterList& list) = 0;

  // Rebuilds the preconditioner for a new matrix.
  virtual void Update(const Teuchos::RCP<const Epetra_CrsMatrix>& A) = 0;
  virtual void Destroy() = 0;

  virtual int ApplyInverse(const Epetra_Vector& v, Epetra_Vector& hv) const = 0;

  virtual int returned_code() const = 0;
  virtual std::string name() const = 0;
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
