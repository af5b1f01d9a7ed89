/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

// Self-registering factory objects of the groundwater flow models and
// exchanges.  Include this file once per executable.

#include "GroundwaterExchange_reg.hh"
#include "GroundwaterFlowModel_reg.hh"
