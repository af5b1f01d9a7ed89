/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <string>

#include "boost/format.hpp"

#include "IterationHistory.hh"

namespace Phreatic {
namespace PhreaticSolvers {

void
IterationHistory::Write(std::ostream& os, const KeyVector& block_names) const
{
  os << boost::format("%6s %6s %8s %14s %-20s %12s\n") % "OUTER" % "INNER" % "TOTAL" %
          "MAX CHANGE" % "LOCATION" % "RESIDUAL";

  for (const auto& rec : records_) {
    std::string location("-");
    if (rec.location.block >= 0) {
      std::string block = (rec.location.block < block_names.size()) ?
                            block_names[rec.location.block] :
                            std::to_string(rec.location.block + 1);
      location = block + " " + std::to_string(rec.location.local + 1);
    }

    os << boost::format("%6d %6d %8d %14.6e %-20s %12.4e\n") % rec.outer_itr % rec.inner_itr %
            rec.total_inner_itr % rec.max_change % location % rec.residual;
  }
}

} // namespace PhreaticSolvers
} // namespace Phreatic
