/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Exchange factory for creating exchanges from the "exchanges" list of the input.
/*
  Developer notes:

  Same self-registration scheme as Model_Factory.hh, with
  RegisteredExchangeFactory and the parameter "exchange type".
*/

#ifndef PHREATIC_EXCHANGE_FACTORY_HH_
#define PHREATIC_EXCHANGE_FACTORY_HH_

#include <map>
#include <string>

#include "Teuchos_RCP.hpp"
#include "Teuchos_ParameterList.hpp"

#include "ExchangeBase.hh"
#include "Key.hh"

namespace Phreatic {

class ExchangeFactory {
 public:
  Teuchos::RCP<ExchangeBase> CreateExchange(const Key& name, Teuchos::ParameterList& plist);

  typedef std::map<std::string, ExchangeBase* (*)(const Key&, Teuchos::ParameterList&)> map_type;

 protected:
  static map_type* GetMap()
  {
    if (!map_) map_ = new map_type;
    return map_;
  }

 private:
  static map_type* map_;
};


template <typename T>
ExchangeBase*
CreateExchangeT(const Key& name, Teuchos::ParameterList& plist)
{
  return new T(name, plist);
}


template <typename T>
class RegisteredExchangeFactory : public ExchangeFactory {
 public:
  RegisteredExchangeFactory(const std::string& s)
  {
    GetMap()->insert(std::pair<std::string, ExchangeBase* (*)(const Key&, Teuchos::ParameterList&)>(
      s, &CreateExchangeT<T>));
  }
};

} // namespace Phreatic

#endif
