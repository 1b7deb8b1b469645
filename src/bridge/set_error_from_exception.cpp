/***
 * Name: pyhost::bridge::SetErrorFromException
 * Purpose: Translate a native exception into the Python error indicator.
 * Inputs:
 *   - error: exception caught at a native call boundary
 * Outputs: Python error indicator set from error.what()
 * Theory of Operation: Boundary errors raised by pyhost itself map onto the
 *   class CPython uses for the same condition; all else becomes Exception.
 */
#include "pyhost/bridge/error_bridge.h"

#include <exception>

#include "pyhost/exceptions/arity_error.h"
#include "pyhost/exceptions/type_mismatch_error.h"

namespace pyhost::bridge {

void SetErrorFromException(const std::exception& error) noexcept {
  PyObject* type = PyExc_Exception;
  if (dynamic_cast<const exceptions::ArityError*>(&error) != nullptr ||
      dynamic_cast<const exceptions::TypeMismatchError*>(&error) != nullptr) {
    type = PyExc_TypeError;
  }
  PyErr_SetString(type, error.what());
}

}  // namespace pyhost::bridge
