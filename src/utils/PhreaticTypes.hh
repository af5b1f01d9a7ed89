/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Typedefs to make forward declarations and interfaces a bit easier.

#ifndef PHREATIC_TYPES_HH_
#define PHREATIC_TYPES_HH_

#include "Teuchos_RCP.hpp"

#include "Epetra_Comm.h"
#include "Epetra_Map.h"

namespace Phreatic {

typedef Epetra_Comm Comm_type;
typedef Teuchos::RCP<const Comm_type> Comm_ptr_type;

using Map_type = Epetra_Map;
using Map_ptr_type = Teuchos::RCP<const Map_type>;

} // namespace Phreatic

#endif
