/***
 * Name: pyhost::bridge::SetError
 * Purpose: Raise a Python exception of the given class with a message.
 * Inputs:
 *   - message: exception text
 *   - type: Python exception class (default: Exception)
 * Outputs: Python error indicator set
 */
#include "pyhost/bridge/error_bridge.h"

#include <string>

namespace pyhost::bridge {

void SetError(const std::string& message, PyObject* type) noexcept {
  PyErr_SetString(type, message.c_str());
}

}  // namespace pyhost::bridge
