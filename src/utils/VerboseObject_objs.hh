/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

// Definitions of the VerboseObject statics. Include in exactly one
// translation unit of every executable.

#include "VerboseObject.hh"

// The default global verbosity level.
Teuchos::EVerbosityLevel Phreatic::VerboseObject::global_default_level = Teuchos::VERB_MEDIUM;

// Show or hide line prefixes
bool Phreatic::VerboseObject::global_hide_line_prefix = false;

// Size of the left column of names.
unsigned int Phreatic::VerboseObject::global_line_prefix_size = 18;
