/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

/*!

This allows control of log-file verbosity for the solvers, the coordinator
and the models.

.. _verbose-object-spec:
.. admonition:: verbose-object-spec

   * `"verbosity level`" ``[string]`` **optional** valid options are:

     - `"none`"
     - `"low`"
     - `"medium`"
     - `"high`"
     - `"extreme`"

     The default is set by the global verbosity spec, which can be set on the
     command line, and defaults to `"medium`".

   * `"name`" ``[string]`` **optional** Replaces the header of each line.

   * `"hide line prefix`" ``[bool]`` **false** Suppresses the header.

   * `"output filename`" ``[string]`` **optional** Redirect this output to a
     specific file rather than writing to screen.

In general, the levels are as follows:

   - `"none`" No log output at all
   - `"low`" Stress periods, time steps, and the final run summary.
   - `"medium`" In addition to the above, the outer iteration summary of
     each solution group and the result of each linear solve.
   - `"high`" In addition to the above, the worst-offending degree of freedom
     and under-relaxation factors of every outer iteration.
   - `"extreme`" Every inner iteration and every state-machine transition.

Example:

.. code-block:: xml

  <ParameterList name="verbose object">
    <Parameter name="verbosity level" type="string" value="medium"/>
    <Parameter name="name" type="string" value="my header"/>
    <Parameter name="hide line prefix" type="bool" value="false"/>
  </ParameterList>

*/

/*

Developer notes:

Usage:

  class MyClass {
   public:
    MyClass(Teuchos::ParameterList& plist) {
      vo_ = Teuchos::rcp(new VerboseObject("my_class", plist));
      Teuchos::OSTab tab = vo_->getOSTab();

      if (vo_->os_OK(Teuchos::VERB_MEDIUM)) {
        *vo_->os() << "my string to print" << std::endl;
      }
    }

   protected:
    Teuchos::RCP<VerboseObject> vo_;
  }

*/

#ifndef PHREATIC_VERBOSE_OBJECT_HH_
#define PHREATIC_VERBOSE_OBJECT_HH_

#include <sstream>
#include <string>

#include "Teuchos_ParameterList.hpp"
#include "Teuchos_VerboseObject.hpp"

namespace Phreatic {

class VerboseObject : public Teuchos::VerboseObject<VerboseObject> {
 public:
  VerboseObject(const std::string& name, const std::string& verbosity);
  VerboseObject(const std::string& name, Teuchos::ParameterList plist);

  // Is verbosity included and is there a stream?
  inline bool os_OK(Teuchos::EVerbosityLevel verbosity) const;

  // is the verbosity included?
  inline bool includesVerbLevel(Teuchos::EVerbosityLevel verbosity) const;

  // Get the stream (errors if !os_OK()).
  inline Teuchos::RCP<Teuchos::FancyOStream> os() const;

  // Simple one-line wrapper
  inline void Write(Teuchos::EVerbosityLevel verbosity, const std::string& data) const;
  void WriteWarning(Teuchos::EVerbosityLevel verbosity, const std::stringstream& data) const;
  void WriteWarning(Teuchos::EVerbosityLevel verbosity, const std::string& data) const;

 public:
  // The default global verbosity level.
  static Teuchos::EVerbosityLevel global_default_level;

  // Show or hide line prefixes
  static bool global_hide_line_prefix;

  // Size of the left column of names.
  static unsigned int global_line_prefix_size;

  // Color output for developers
  std::string color(const std::string& name) const;
  std::string reset() const;
  std::string clock() const;

  // width parameter provides width of the header
  void set_name(std::string name, int width = -1);
};


bool
VerboseObject::os_OK(Teuchos::EVerbosityLevel verbosity) const
{
  return getOStream().get() && includesVerbLevel(verbosity);
};

bool
VerboseObject::includesVerbLevel(Teuchos::EVerbosityLevel verbosity) const
{
  return Teuchos::includesVerbLevel(getVerbLevel(), verbosity, true);
}

Teuchos::RCP<Teuchos::FancyOStream>
VerboseObject::os() const
{
  return getOStream();
};

void
VerboseObject::Write(Teuchos::EVerbosityLevel verbosity, const std::string& data) const
{
  if (includesVerbLevel(verbosity)) {
    Teuchos::OSTab tab = getOSTab();
    *os() << data;
  }
}

} // namespace Phreatic

#endif
