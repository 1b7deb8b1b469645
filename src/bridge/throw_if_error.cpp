/***
 * Name: pyhost::bridge::ThrowIfError
 * Purpose: Surface a pending Python error as a host exception.
 * Inputs: Python error indicator
 * Outputs: Throws exceptions::PythonError when an error is pending
 * Theory of Operation: Checks the flag, then defers to UnsafeGetError.
 */
#include "pyhost/bridge/error_bridge.h"

namespace pyhost::bridge {

void ThrowIfError() {
  if (PyErr_Occurred() == nullptr) { return; }
  throw UnsafeGetError();
}

}  // namespace pyhost::bridge
