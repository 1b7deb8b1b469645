/***
 * Name: pyhost::detail (C API result checks)
 * Purpose: Turn C API failure returns into host exceptions in one place.
 * Inputs: Raw results of CPython entry points
 * Outputs: Owned PythonObject handles, or thrown PythonError / InternalError
 * Theory of Operation:
 *   A null (or negative) result with the error indicator set is bridged into
 *   PythonError. A failure result with no error set is an internal invariant
 *   violation and throws InternalError naming the entry point.
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include "pyhost/object/python_object.h"

namespace pyhost::detail {

// Adopt a new reference; throws when `result` is null.
PythonObject Checked(PyObject* result, const char* context);

// Throws when `rc` is negative; returns it otherwise.
int CheckStatus(int rc, const char* context);

}  // namespace pyhost::detail
