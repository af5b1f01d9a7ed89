/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Communicator helpers.
/*!

  All solves are serial, so the default communicator is an
  Epetra_SerialComm.

*/

#pragma once

#include "Teuchos_RCP.hpp"
#include "Epetra_SerialComm.h"

#include "PhreaticTypes.hh"

namespace Phreatic {

inline Comm_ptr_type
getDefaultComm()
{
  return Teuchos::rcp(new Epetra_SerialComm());
}

} // namespace Phreatic
