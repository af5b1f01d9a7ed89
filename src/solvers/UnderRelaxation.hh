/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Damping of the outer-iteration update.

/*!

* `"under relaxation`" ``[string]`` **"none"** One of:

  - `"none`" The full update is applied.
  - `"simple`" The update is scaled by the fixed factor gamma.
  - `"cooley`" Cooley's adaptive factor.  With s the ratio of the signed
    largest change of this iteration to the damped largest change of the
    previous one, the factor is 0.5/|s| if s < -1 and (3 + s)/(3 + |s|)
    otherwise.  The first iteration of a time step is not damped.
  - `"dbd`" Delta-bar-delta.  Each degree of freedom keeps a weight that is
    multiplied by theta when its change flips sign and increased by kappa
    (up to 1) otherwise.  An exponential average of past changes with
    weight gamma is added with the momentum factor after the fourth
    iteration.

* `"under relaxation gamma`" ``[double]`` **0.2**
* `"under relaxation theta`" ``[double]`` **0.7**
* `"under relaxation kappa`" ``[double]`` **0.1**
* `"under relaxation momentum`" ``[double]`` **0.001**

The per-degree-of-freedom arrays of `"dbd`" (WSAVE, HCHOLD, DEOLD) are
registered under the owner's origin.

*/

#ifndef PHREATIC_UNDER_RELAXATION_HH_
#define PHREATIC_UNDER_RELAXATION_HH_

#include <string>

#include "Teuchos_RCP.hpp"
#include "Teuchos_ParameterList.hpp"
#include "Epetra_Vector.h"

#include "Key.hh"
#include "VariableRegistry.hh"

namespace Phreatic {
namespace PhreaticSolvers {

enum class UnderRelaxationMethod { NONE, SIMPLE, COOLEY, DBD };

class UnderRelaxation {
 public:
  UnderRelaxation(Teuchos::ParameterList& plist,
                  const Teuchos::RCP<VariableRegistry>& registry,
                  const Key& origin);

  // allocates the per-dof arrays
  void Setup(int ndofs);

  // beginning of a time step
  void Reset();

  // Damps du in place.  outer counts from 1 in each time step and big is
  // the signed entry of du with the largest magnitude.  Returns the factor
  // applied, or for "dbd" the smallest weight.
  double Apply(int outer, double big, Epetra_Vector& du);

  UnderRelaxationMethod method() const { return method_; }
  std::string method_name() const;

 private:
  double ApplyDBD_(int outer, Epetra_Vector& du);

 private:
  UnderRelaxationMethod method_;
  double gamma_, theta_, kappa_, momentum_;

  Teuchos::RCP<VariableRegistry> registry_;
  Key origin_;

  // cooley
  double bigold_, relaxold_;
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
