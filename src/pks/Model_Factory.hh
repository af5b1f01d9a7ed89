/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Model factory for creating models from the "models" list of the input.
/*
  Developer notes:

  Factory for self-registering models.

  Usage:

  Add a private, static member of type RegisteredModelFactory to the class
  declaration, and a special _reg.hh file that instantiates the static
  registry.  The _reg.hh file is included once, in the executable or test
  that needs the model, so that the linker keeps the registration.

  Example:

  // my_model.hh
  #include "ModelBase.hh"
  #include "Model_Factory.hh"
  class MyModel : public Phreatic::ModelBase {
    ...
   private:
    static Phreatic::RegisteredModelFactory<MyModel> reg_;
  };

  // my_model_reg.hh
  #include "my_model.hh"
  Phreatic::RegisteredModelFactory<MyModel> MyModel::reg_("my model type");
*/

#ifndef PHREATIC_MODEL_FACTORY_HH_
#define PHREATIC_MODEL_FACTORY_HH_

#include <map>
#include <string>

#include "Teuchos_RCP.hpp"
#include "Teuchos_ParameterList.hpp"

#include "Key.hh"
#include "ModelBase.hh"

namespace Phreatic {

class ModelFactory {
 public:
  // Creates the model of type plist."model type".
  Teuchos::RCP<ModelBase> CreateModel(const Key& name, Teuchos::ParameterList& plist);

  typedef std::map<std::string, ModelBase* (*)(const Key&, Teuchos::ParameterList&)> map_type;

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
ModelBase*
CreateModelT(const Key& name, Teuchos::ParameterList& plist)
{
  return new T(name, plist);
}


template <typename T>
class RegisteredModelFactory : public ModelFactory {
 public:
  RegisteredModelFactory(const std::string& s)
  {
    GetMap()->insert(
      std::pair<std::string, ModelBase* (*)(const Key&, Teuchos::ParameterList&)>(s, &CreateModelT<T>));
  }
};

} // namespace Phreatic

#endif
