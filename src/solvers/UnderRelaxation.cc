/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <algorithm>
#include <cmath>

#include "errors.hh"
#include "UnderRelaxation.hh"

namespace Phreatic {
namespace PhreaticSolvers {

UnderRelaxation::UnderRelaxation(Teuchos::ParameterList& plist,
                                 const Teuchos::RCP<VariableRegistry>& registry,
                                 const Key& origin)
  : registry_(registry), origin_(origin), bigold_(0.0), relaxold_(1.0)
{
  std::string name = plist.get<std::string>("under relaxation", "none");
  if (name == "none") {
    method_ = UnderRelaxationMethod::NONE;
  } else if (name == "simple") {
    method_ = UnderRelaxationMethod::SIMPLE;
  } else if (name == "cooley") {
    method_ = UnderRelaxationMethod::COOLEY;
  } else if (name == "dbd") {
    method_ = UnderRelaxationMethod::DBD;
  } else {
    Errors::Message msg;
    msg << "UnderRelaxation: method \"" << name << "\" is not recognized.";
    Exceptions::phreatic_throw(msg);
  }

  gamma_ = plist.get<double>("under relaxation gamma", 0.2);
  theta_ = plist.get<double>("under relaxation theta", 0.7);
  kappa_ = plist.get<double>("under relaxation kappa", 0.1);
  momentum_ = plist.get<double>("under relaxation momentum", 0.001);

  if (gamma_ <= 0.0 || gamma_ > 1.0 || theta_ <= 0.0 || theta_ > 1.0 || kappa_ < 0.0 ||
      momentum_ < 0.0) {
    Errors::Message msg("UnderRelaxation: gamma and theta must be in (0, 1], kappa and momentum "
                        "must be non-negative.");
    Exceptions::phreatic_throw(msg);
  }
}


void
UnderRelaxation::Setup(int ndofs)
{
  if (method_ != UnderRelaxationMethod::DBD) return;

  for (const auto& name : { "WSAVE", "HCHOLD", "DEOLD" }) {
    registry_->Allocate(origin_, name, VariableKind::REAL, ndofs);
  }
}


void
UnderRelaxation::Reset()
{
  bigold_ = 0.0;
  relaxold_ = 1.0;
}


double
UnderRelaxation::Apply(int outer, double big, Epetra_Vector& du)
{
  double relax(1.0);

  switch (method_) {
  case UnderRelaxationMethod::NONE:
    break;

  case UnderRelaxationMethod::SIMPLE:
    relax = gamma_;
    du.Scale(relax);
    break;

  case UnderRelaxationMethod::COOLEY:
    if (outer > 1 && bigold_ * relaxold_ != 0.0) {
      double s = big / (bigold_ * relaxold_);
      if (s < -1.0) {
        relax = 0.5 / std::abs(s);
      } else {
        relax = (3.0 + s) / (3.0 + std::abs(s));
      }
    }
    relaxold_ = relax;
    bigold_ = big;
    if (relax < 1.0) du.Scale(relax);
    break;

  case UnderRelaxationMethod::DBD:
    relax = ApplyDBD_(outer, du);
    break;
  }

  return relax;
}


/* ******************************************************************
* Delta-bar-delta, one weight per degree of freedom.
****************************************************************** */
double
UnderRelaxation::ApplyDBD_(int outer, Epetra_Vector& du)
{
  auto wsave = registry_->GetReal(origin_, "WSAVE");
  auto hchold = registry_->GetReal(origin_, "HCHOLD");
  auto deold = registry_->GetReal(origin_, "DEOLD");

  if (wsave.size() != du.MyLength()) {
    Errors::Message msg("UnderRelaxation: Setup() was called with a different size.");
    Exceptions::phreatic_throw(msg);
  }

  double wmin(1.0);
  for (int i = 0; i < du.MyLength(); ++i) {
    double delta = du[i];

    if (outer == 1) {
      wsave[i] = 1.0;
      deold[i] = 0.0;
    }

    double ww = wsave[i];
    if (deold[i] * delta < 0.0) {
      ww = theta_ * ww;
    } else {
      ww = ww + kappa_;
    }
    ww = std::min(ww, 1.0);
    wsave[i] = ww;

    if (outer == 1) {
      hchold[i] = delta;
    } else {
      hchold[i] = (1.0 - gamma_) * delta + gamma_ * hchold[i];
    }
    deold[i] = delta;

    double dx = ww * delta;
    if (outer > 4) dx += momentum_ * hchold[i];
    du[i] = dx;

    wmin = std::min(wmin, ww);
  }
  return wmin;
}


std::string
UnderRelaxation::method_name() const
{
  switch (method_) {
  case UnderRelaxationMethod::SIMPLE:
    return "simple";
  case UnderRelaxationMethod::COOLEY:
    return "cooley";
  case UnderRelaxationMethod::DBD:
    return "dbd";
  default:
    return "none";
  }
}

} // namespace PhreaticSolvers
} // namespace Phreatic
