/***
 * Name: pyhost::bindings::ModuleBuilder (impl)
 * Purpose: Create modules and register their function tables.
 */
#include "pyhost/bindings/module_builder.h"

#include <memory>
#include <string>
#include <utility>

#include "pyhost/exceptions/internal_error.h"
#include "pyhost/metrics/metrics.h"
#include "pyhost/object/checked.h"
#include "pyhost/runtime/interpreter.h"
#include "pyhost/support/debug_log.h"

namespace pyhost::bindings {

static TypedPythonObject<shape::Module> new_module(const std::string& name, const std::string& doc) {
  runtime::Interpreter::Require();
  PythonObject module = pyhost::detail::Checked(PyModule_New(name.c_str()), "PyModule_New");
  if (!doc.empty()) { pyhost::detail::CheckStatus(PyModule_SetDocString(module.Get(), doc.c_str()), "PyModule_SetDocString"); }
  return TypedPythonObject<shape::Module>::Unchecked(std::move(module));
}

ModuleBuilder::ModuleBuilder(const std::string& name, const std::string& doc)
    : module_(new_module(name, doc)), methods_(std::make_shared<detail::MethodTable>()) {}

ModuleBuilder::ModuleBuilder(TypedPythonObject<shape::Module> module)
    : module_(std::move(module)), methods_(std::make_shared<detail::MethodTable>()) {}

ModuleBuilder& ModuleBuilder::AddFunction(std::string name, PyCFunction function, std::string doc) {
  if (finalized_) { throw exceptions::InternalError("function '" + name + "' added after module was finalized"); }
  methods_->Add(std::move(name), function, METH_VARARGS, std::move(doc));
  return *this;
}

TypedPythonObject<shape::Module> ModuleBuilder::Finalize() {
  if (finalized_) { throw exceptions::InternalError("module '" + module_.Name() + "' finalized twice"); }
  runtime::Interpreter& interpreter = runtime::Interpreter::Require();
  PyMethodDef* table = methods_->Finish();
  pyhost::detail::CheckStatus(PyModule_AddFunctions(module_.Get(), table), "PyModule_AddFunctions");
  interpreter.KeepAlive(methods_);

  const std::string name = module_.Name();
  PyObject* modules = PyImport_GetModuleDict();  // borrowed
  pyhost::detail::CheckStatus(PyDict_SetItemString(modules, name.c_str(), module_.Get()), "sys.modules");

  finalized_ = true;
  metrics::Metrics::Increment(metrics::Metrics::Counter::FunctionsRegistered, methods_->Size());
  PYHOST_DEBUG_LOG("module %s registered with %zu functions", name.c_str(), methods_->Size());
  return module_;
}

}  // namespace pyhost::bindings
