/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <iostream>

#include "Teuchos_RCP.hpp"
#include "Teuchos_XMLParameterListHelpers.hpp"

#include "CycleDriver.hh"
#include "VariableRegistry.hh"
#include "VerboseObject.hh"

#include "simulation_driver.hh"

namespace Phreatic {

int
SimulationDriver::Run(const Comm_ptr_type& comm, Teuchos::ParameterList& plist, std::ostream& os)
{
  VerboseObject vo("Simulation Driver", plist);
  Teuchos::OSTab tab = vo.getOSTab();

  if (vo.os_OK(Teuchos::VERB_HIGH)) {
    *vo.os() << "======================> dumping parameter list <======================"
             << std::endl;
    Teuchos::writeParameterListToXmlOStream(plist, *vo.os());
    *vo.os() << "======================> done dumping parameter list. <================"
             << std::endl;
  }

  // one registry per run
  auto registry = Teuchos::rcp(new VariableRegistry());

  CycleDriver driver(plist, registry, comm);
  int ret = driver.Go();

  driver.report().Write(os);
  return ret;
}

} // namespace Phreatic
