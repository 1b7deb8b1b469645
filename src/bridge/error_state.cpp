/***
 * Name: pyhost::bridge::ErrorOccurred / ClearError
 * Purpose: Query and discard the Python error indicator.
 */
#include "pyhost/bridge/error_bridge.h"

namespace pyhost::bridge {

bool ErrorOccurred() noexcept { return PyErr_Occurred() != nullptr; }

void ClearError() noexcept { PyErr_Clear(); }

}  // namespace pyhost::bridge
