/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "errors.hh"
#include "ConvergenceCriteria.hh"

namespace Phreatic {
namespace PhreaticSolvers {

ConvergenceCriteria::ConvergenceCriteria(Teuchos::ParameterList& plist)
{
  head_close_ = plist.get<double>("head closure", 1e-4);
  residual_close_ = plist.get<double>("residual closure", 1e-3);
  max_outer_ = plist.get<int>("maximum number of outer iterations", 500);
  max_inner_ = plist.get<int>("maximum number of inner iterations", 100);

  if (head_close_ <= 0.0 || residual_close_ <= 0.0) {
    Errors::Message msg;
    msg << "ConvergenceCriteria: closure tolerances must be positive, got head closure "
        << head_close_ << " and residual closure " << residual_close_;
    Exceptions::phreatic_throw(msg);
  }
  if (max_outer_ < 1 || max_inner_ < 1) {
    Errors::Message msg;
    msg << "ConvergenceCriteria: iteration caps must be at least 1, got " << max_outer_ << " and "
        << max_inner_;
    Exceptions::phreatic_throw(msg);
  }
}

} // namespace PhreaticSolvers
} // namespace Phreatic
