/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

// Runs the top-level simulation.

/*!

Phreatic's top-level main accepts an XML list with the elements:

* `"cycle driver`" ``[cycle-driver-spec]`` See CycleDriver.
* `"models`" ``[model-typed-spec-list]`` One list per model.
* `"exchanges`" ``[exchange-typed-spec-list]`` One list per exchange.
* `"solution groups`" ``[solution-group-spec-list]`` See SolutionGroup.
* `"verbose object`" ``[verbose-object-spec]`` Default verbosity.

*/

#pragma once

#include <ostream>

#include "Teuchos_ParameterList.hpp"

#include "PhreaticTypes.hh"

namespace Phreatic {

struct SimulationDriver {
  // Returns 0 on normal termination.  The run report goes to os.
  int Run(const Comm_ptr_type& comm, Teuchos::ParameterList& plist, std::ostream& os);
};

} // namespace Phreatic
