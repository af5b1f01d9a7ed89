/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "errors.hh"
#include "Exchange_Factory.hh"

namespace Phreatic {

ExchangeFactory::map_type* ExchangeFactory::map_;


Teuchos::RCP<ExchangeBase>
ExchangeFactory::CreateExchange(const Key& name, Teuchos::ParameterList& plist)
{
  if (!plist.isParameter("exchange type")) {
    Errors::Message msg;
    msg << "ExchangeFactory: exchange \"" << name << "\" has no parameter \"exchange type\".";
    Exceptions::phreatic_throw(msg);
  }
  std::string type = plist.get<std::string>("exchange type");

  auto iter = GetMap()->find(type);
  if (iter == GetMap()->end()) {
    Errors::Message msg;
    msg << "ExchangeFactory: exchange \"" << name << "\" requests unknown type \"" << type << "\".";
    Exceptions::phreatic_throw(msg);
  }
  return Teuchos::rcp(iter->second(name, plist));
}

} // namespace Phreatic
