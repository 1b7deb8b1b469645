/***
 * Name: pyhost::bindings::ModuleBuilder
 * Purpose: Assemble a Python module from native functions and native types.
 * Inputs: Module name (or an existing module), functions, types
 * Outputs: The finished module, importable by name
 * Theory of Operation:
 *   Function entries accumulate in a method table and are registered in one
 *   PyModule_AddFunctions call by Finalize(), which also publishes the module
 *   in sys.modules. Types are attached as they are finalized, through the
 *   TypeBuilder returned by AddType<T>().
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include <memory>
#include <string>
#include <utility>

#include "pyhost/bindings/function_wrapper.h"
#include "pyhost/bindings/storage.h"
#include "pyhost/bindings/type_builder.h"
#include "pyhost/object/typed_python_object.h"

namespace pyhost::bindings {

class ModuleBuilder {
 public:
  explicit ModuleBuilder(const std::string& name, const std::string& doc = {});
  explicit ModuleBuilder(TypedPythonObject<shape::Module> module);

  ModuleBuilder& AddFunction(std::string name, PyCFunction function, std::string doc = {});

  template <auto Fn>
  ModuleBuilder& DefFunction(std::string name, std::string doc = {}) {
    return AddFunction(std::move(name), WrapFailing<Fn>, std::move(doc));
  }

  template <auto Fn>
  ModuleBuilder& DefPlainFunction(std::string name, std::string doc = {}) {
    return AddFunction(std::move(name), WrapPlain<Fn>, std::move(doc));
  }

  // The returned builder's Finalize() also sets module.<name> to the type.
  template <class T>
  TypeBuilder<T> AddType(std::string name, std::string doc = {}) {
    std::string qualified = module_.Name() + "." + name;
    return TypeBuilder<T>(std::move(qualified), std::move(doc), module_, std::move(name));
  }

  const TypedPythonObject<shape::Module>& Module() const noexcept { return module_; }

  TypedPythonObject<shape::Module> Finalize();

 private:
  TypedPythonObject<shape::Module> module_;
  std::shared_ptr<detail::MethodTable> methods_;
  bool finalized_{false};
};

}  // namespace pyhost::bindings
