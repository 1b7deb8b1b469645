/***
 * Name: pyhost::python::ImportModule / Builtins
 * Purpose: Import a module by its dotted name.
 * Inputs:
 *   - name: dotted module name
 * Outputs: The module object; PythonError (ModuleNotFoundError text) on failure
 */
#include "pyhost/python.h"

#include <string>
#include <string_view>

#include "pyhost/object/checked.h"
#include "pyhost/runtime/interpreter.h"
#include "pyhost/support/debug_log.h"

namespace pyhost::python {

TypedPythonObject<shape::Module> ImportModule(std::string_view name) {
  runtime::Interpreter::Require();
  const std::string moduleName(name);
  PYHOST_DEBUG_LOG("import %s", moduleName.c_str());
  return TypedPythonObject<shape::Module>::Unchecked(
      detail::Checked(PyImport_ImportModule(moduleName.c_str()), "PyImport_ImportModule"));
}

TypedPythonObject<shape::Module> Builtins() { return ImportModule("builtins"); }

}  // namespace pyhost::python
