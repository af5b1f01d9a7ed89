/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <string>

#include "errors.hh"

#include "PreconditionerDiagonal.hh"
#include "PreconditionerFactory.hh"
#include "PreconditionerIdentity.hh"
#include "PreconditionerILU.hh"

namespace Phreatic {
namespace PhreaticSolvers {

/* ******************************************************************
* Initialization of the preconditioner. ILU is the default.
****************************************************************** */
Teuchos::RCP<Preconditioner>
PreconditionerFactory::Create(const Teuchos::ParameterList& slist)
{
  std::string type("ilu");
  if (slist.isParameter("preconditioner type"))
    type = slist.get<std::string>("preconditioner type");

  Teuchos::RCP<Preconditioner> prec;
  if (type == "ilu") {
    prec = Teuchos::rcp(new PreconditionerILU());
  } else if (type == "diagonal") {
    prec = Teuchos::rcp(new PreconditionerDiagonal());
  } else if (type == "identity") {
    prec = Teuchos::rcp(new PreconditionerIdentity());
  } else {
    Errors::Message msg;
    msg << "PreconditionerFactory: wrong value \"" << type
        << "\" of parameter \"preconditioner type\"";
    Exceptions::phreatic_throw(msg);
  }

  prec->Init(type, slist);
  return prec;
}

} // namespace PhreaticSolvers
} // namespace Phreatic
