/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "errors.hh"
#include "Model_Factory.hh"

namespace Phreatic {

ModelFactory::map_type* ModelFactory::map_;


Teuchos::RCP<ModelBase>
ModelFactory::CreateModel(const Key& name, Teuchos::ParameterList& plist)
{
  if (!plist.isParameter("model type")) {
    Errors::Message msg;
    msg << "ModelFactory: model \"" << name << "\" has no parameter \"model type\".";
    Exceptions::phreatic_throw(msg);
  }
  std::string type = plist.get<std::string>("model type");

  auto iter = GetMap()->find(type);
  if (iter == GetMap()->end()) {
    Errors::Message msg;
    msg << "ModelFactory: model \"" << name << "\" requests unknown type \"" << type
        << "\". Valid types:";
    for (const auto& entry : *GetMap()) msg << " \"" << entry.first << "\"";
    Exceptions::phreatic_throw(msg);
  }
  return Teuchos::rcp(iter->second(name, plist));
}

} // namespace Phreatic
