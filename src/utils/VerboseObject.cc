/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <ctime>
#include <iomanip>

#include "Teuchos_StandardParameterEntryValidators.hpp"
#include "Teuchos_VerboseObjectParameterListHelpers.hpp"

#include "Key.hh"
#include "VerboseObject.hh"

namespace Phreatic {

/* ******************************************************************
* Create with the given verbosity.
****************************************************************** */
VerboseObject::VerboseObject(const std::string& name, const std::string& verbosity)
{
  setDefaultVerbLevel(global_default_level);
  set_name(name);

  auto validator = Teuchos::verbosityLevelParameterEntryValidator("verbosity level");
  auto ilevel = validator->getIntegralValue(verbosity);
  setVerbLevel(ilevel);

  getOStream()->setShowLinePrefix(!global_hide_line_prefix);
}


/* ******************************************************************
* Read verbosity from a parameter list
****************************************************************** */
VerboseObject::VerboseObject(const std::string& name, Teuchos::ParameterList plist)
{
  setDefaultVerbLevel(global_default_level);

  // -- Set up the VerboseObject header.
  std::string headername(name);
  if (plist.sublist("verbose object").isParameter("name")) {
    headername = plist.sublist("verbose object").get<std::string>("name");
  }
  set_name(headername);

  // -- Show the line prefix
  bool no_pre =
    plist.sublist("verbose object").get<bool>("hide line prefix", global_hide_line_prefix);

  // Override from ParameterList.
  Teuchos::ParameterList plist_out;
  if (plist.sublist("verbose object").isParameter("verbosity level")) {
    plist_out.sublist("VerboseObject")
      .set("Verbosity Level", plist.sublist("verbose object").get<std::string>("verbosity level"));
  }

  if (plist.sublist("verbose object").isParameter("output filename")) {
    plist_out.sublist("VerboseObject")
      .set("Output File", plist.sublist("verbose object").get<std::string>("output filename"));
  }

  Teuchos::readVerboseObjectSublist(&plist_out, this);

  getOStream()->setShowLinePrefix(!no_pre);
}


void
VerboseObject::set_name(std::string name, int width)
{
  if (width < 0) width = global_line_prefix_size;

  if (name.size() > width) name = Keys::abbreviate(name, width);

  // hard cut/pad to size
  if (name.size() > width) {
    name.erase(width);
  } else if (name.size() < width) {
    name.append(width - name.size(), ' ');
  }
  setLinePrefix(name);
}


std::string
VerboseObject::color(const std::string& name) const
{
  std::string output("");
  if (name == "red") {
    output = std::string("\033[1;31m");
  } else if (name == "green") {
    output = std::string("\033[1;32m");
  } else if (name == "yellow") {
    output = std::string("\033[1;33m");
  } else if (name == "good") {
    output = color("green");
  } else if (name == "bad") {
    output = color("red");
  }
  return output;
}


std::string
VerboseObject::reset() const
{
  return std::string("\033[0m");
}


std::string
VerboseObject::clock() const
{
  int tmp = std::clock() / CLOCKS_PER_SEC;
  int s = tmp % 60;
  tmp /= 60;

  int m = tmp % 60;
  tmp /= 60;

  int h = tmp % 100;

  std::stringstream ss;
  ss << "[" << std::setfill('0') << std::setw(2) << h << ":" << std::setw(2) << m << ":"
     << std::setw(2) << s << "]";

  return ss.str();
}


void
VerboseObject::WriteWarning(Teuchos::EVerbosityLevel verbosity,
                            const std::stringstream& data) const
{
  WriteWarning(verbosity, data.str());
}


void
VerboseObject::WriteWarning(Teuchos::EVerbosityLevel verbosity, const std::string& data) const
{
  if (includesVerbLevel(verbosity)) {
    Teuchos::OSTab tab = getOSTab();
    *os() << color("yellow") << data << reset();
  }
}

} // namespace Phreatic
