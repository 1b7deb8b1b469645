/***
 * Name: pyhost::detail::Checked / CheckStatus / ThrowPendingError
 * Purpose: Shared failure handling for CPython entry points.
 * Inputs:
 *   - result / rc: raw C API return value
 *   - context: entry point name used when no Python error is pending
 * Outputs: Owned handle or status; throws on failure
 */
#include "pyhost/object/checked.h"

#include <string>

#include "pyhost/bridge/error_bridge.h"
#include "pyhost/exceptions/internal_error.h"

namespace pyhost::detail {

void ThrowPendingError(const char* context) {
  if (PyErr_Occurred() != nullptr) { throw bridge::UnsafeGetError(); }
  throw exceptions::InternalError(std::string(context) + " failed without setting a Python error");
}

PythonObject Checked(PyObject* result, const char* context) {
  if (result == nullptr) { ThrowPendingError(context); }
  return PythonObject::FromOwned(result);
}

int CheckStatus(int rc, const char* context) {
  if (rc < 0) { ThrowPendingError(context); }
  return rc;
}

}  // namespace pyhost::detail
