/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "errors.hh"
#include "Key.hh"

namespace Phreatic {
namespace Keys {

// note, this is a vector and not a map to keep the order as provided here
static std::vector<std::pair<std::string, std::string>> abbreviations = {
  { "solution", "sln" },
  { "groundwater", "gw" },
  { "exchange", "exg" },
  { "linear", "lin" },
  { "nonlinear", "nl" },
};

//
// Utility functions
// -----------------------------------------------------------------------------
bool
in(const Key& key, const char& c)
{
  return key.find(c) != std::string::npos;
}

Key
merge(const Key& domain, const Key& name, const char& delimiter)
{
  return domain + delimiter + name;
}

Key
replace_all(Key key, const std::string& find_s, const std::string& replace_s)
{
  std::size_t index = 0;
  while (true) {
    index = key.find(find_s, index);
    if (index == std::string::npos) break;

    key.replace(index, find_s.size(), replace_s);

    // Advance index forward so the next iteration doesn't pick it up as well.
    // This avoids problems with e.g. abc --> abcabc
    index += replace_s.size();
  }
  return key;
}

Key
abbreviate(Key name, int max_len)
{
  for (const auto& abbvs : abbreviations) {
    name = replace_all(name, abbvs.first, abbvs.second);
    if (max_len > 0 && name.size() < max_len) break;
  }
  return name;
}

//
// Working with origins and variable names
// -----------------------------------------------------------------------------
bool
validKey(const Key& key)
{
  if (key.empty()) return false;
  if (in(key, name_delimiter)) return false;
  return true;
}

Key
getOrigin(const Key& owner, const Key& subcomponent)
{
  if (owner.empty()) {
    Errors::Message msg("Cannot Keys::getOrigin() with empty owner name.");
    Exceptions::phreatic_throw(msg);
  }
  if (subcomponent.empty()) return owner;
  return merge(owner, subcomponent, origin_delimiter);
}

Key
getFullName(const Key& origin, const Key& name)
{
  return merge(origin, name, name_delimiter);
}

} // namespace Keys
} // namespace Phreatic
