/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Creates a preconditioner from the parameter "preconditioner type".

#ifndef PHREATIC_PRECONDITIONER_FACTORY_HH_
#define PHREATIC_PRECONDITIONER_FACTORY_HH_

#include "Teuchos_RCP.hpp"
#include "Teuchos_ParameterList.hpp"

#include "Preconditioner.hh"

namespace Phreatic {
namespace PhreaticSolvers {

class PreconditionerFactory {
 public:
  PreconditionerFactory(){};
  ~PreconditionerFactory(){};

  Teuchos::RCP<Preconditioner> Create(const Teuchos::ParameterList& slist);
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
