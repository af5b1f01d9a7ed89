/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "GroundwaterFlowModel.hh"

namespace Phreatic {
namespace PhreaticFlow {

RegisteredModelFactory<GroundwaterFlowModel> GroundwaterFlowModel::reg_("groundwater flow");

} // namespace PhreaticFlow
} // namespace Phreatic
