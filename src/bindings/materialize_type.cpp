/***
 * Name: pyhost::bindings::detail::MaterializeType / ShortTypeName
 * Purpose: Turn a completed PyType_Spec into a live type object.
 * Inputs:
 *   - storage: spec, slots and strings the type points into
 *   - module/attrName: optional module attribute to publish the type under
 * Outputs: The new type object; PythonError when CPython rejects the spec
 * Theory of Operation: Before 3.12 the type's tp_name points into the spec's
 *   name string, so the storage is handed to the interpreter's keep-alive list
 *   as soon as the type exists.
 */
#include "pyhost/bindings/type_builder.h"

#include <cstring>
#include <memory>
#include <string>

#include "pyhost/metrics/metrics.h"
#include "pyhost/object/checked.h"
#include "pyhost/runtime/interpreter.h"
#include "pyhost/support/debug_log.h"

namespace pyhost::bindings::detail {

const char* ShortTypeName(PyTypeObject* type) noexcept {
  const char* dot = std::strrchr(type->tp_name, '.');
  return dot != nullptr ? dot + 1 : type->tp_name;
}

TypedPythonObject<shape::Type> MaterializeType(const std::shared_ptr<TypeStorage>& storage,
                                               TypedPythonObject<shape::Module>* module,
                                               const std::string& attrName) {
  runtime::Interpreter& interpreter = runtime::Interpreter::Require();
  PythonObject created = pyhost::detail::Checked(PyType_FromSpec(&storage->spec), "PyType_FromSpec");
  interpreter.KeepAlive(storage);
  auto type = TypedPythonObject<shape::Type>::Unchecked(std::move(created));
  if (module != nullptr) { module->AddObject(attrName, type.Object()); }
  metrics::Metrics::Increment(metrics::Metrics::Counter::TypesCreated);
  PYHOST_DEBUG_LOG("type %s created (basicsize %d, %zu methods)", storage->name.c_str(), storage->spec.basicsize,
                   storage->methods.Size());
  return type;
}

}  // namespace pyhost::bindings::detail
