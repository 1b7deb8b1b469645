/***
 * Name: pyhost::python::AddToPath
 * Purpose: Make a directory's modules importable.
 * Inputs:
 *   - directory: appended to sys.path unless already present
 * Outputs: None; PythonError when sys.path cannot be updated
 */
#include "pyhost/python.h"

#include <string_view>

#include "pyhost/exceptions/internal_error.h"
#include "pyhost/runtime/interpreter.h"
#include "pyhost/support/debug_log.h"

namespace pyhost::python {

void AddToPath(std::string_view directory) {
  runtime::Interpreter::Require();
  PyObject* sysPath = PySys_GetObject("path");  // borrowed
  if (sysPath == nullptr) { throw exceptions::InternalError("sys.path is missing"); }
  PythonObject path = PythonObject::FromBorrowed(sysPath);
  const PythonObject entry(directory);
  if (path.Contains(entry)) { return; }
  path.CallMethod("append", entry);
  PYHOST_DEBUG_LOG("sys.path += %s", entry.ToString().c_str());
}

}  // namespace pyhost::python
