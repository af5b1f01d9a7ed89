/* -*-  mode: c++; indent-tabs-mode: nil -*- */
/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Keys are just strings.
/*
  Keys name registered variables and the components that own them.

  An ORIGIN names the owning component, e.g. a model "GWF_1" or a solution
  group "SLN_1".  Sub-components append their own name with the origin
  delimiter, e.g. the linear solver of group "SLN_1" owns "SLN_1-linear".

  A variable is identified by the pair (ORIGIN, NAME); the fully qualified
  form ORIGIN/NAME is used only for printing.

  Currently the following characters are reserved, and should not be used in
  names:

  * '-' is used between an owner and a sub-component, e.g. "SLN_1-linear"
  * '/' is used in fully qualified variable names, e.g. "GWF_1/K"
*/

#pragma once

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace Phreatic {

typedef std::string Key;
typedef std::set<Key> KeySet;
typedef std::vector<Key> KeyVector;
typedef std::pair<Key, Key> KeyPair;

namespace Keys {

static const char origin_delimiter = '-';
static const char name_delimiter = '/';

//
// Utility functions
// -----------------------------------------------------------------------------
bool in(const Key& key, const char& c);

Key merge(const Key& domain, const Key& name, const char& delimiter);

Key replace_all(Key key, const std::string& find_s, const std::string& replace_s);

// shorten a key for output, see abbreviations list in Key.cc
Key abbreviate(Key name, int max_len);

//
// Working with origins and variable names
// -----------------------------------------------------------------------------
// is this a valid origin or variable name?
bool validKey(const Key& key);

// ORIGIN-SUBCOMPONENT
Key getOrigin(const Key& owner, const Key& subcomponent);

// ORIGIN/NAME, for printing
Key getFullName(const Key& origin, const Key& name);

} // namespace Keys
} // namespace Phreatic
