/***
 * Name: pyhost::bridge (exception bridge)
 * Purpose: Move errors across the interpreter boundary in both directions.
 * Inputs:
 *   - CPython's thread-local error indicator (foreign -> host)
 *   - std::exception instances thrown by native code (host -> foreign)
 * Outputs:
 *   - exceptions::PythonError carrying str() of the Python exception
 *   - a set Python error indicator
 * Theory of Operation:
 *   This is the only component that reads-and-clears the error indicator.
 *   Only the message text crosses; the Python exception class does not.
 *   Every function here requires the GIL.
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include <exception>
#include <string>

#include "pyhost/exceptions/python_error.h"

namespace pyhost::bridge {

bool ErrorOccurred() noexcept;

void ClearError() noexcept;

// Fetch, clear and throw the pending error as PythonError; no-op when none is set.
void ThrowIfError();

// Precondition (asserted): an error is pending. Fetches and clears it.
exceptions::PythonError UnsafeGetError();

void SetError(const std::string& message, PyObject* type = PyExc_Exception) noexcept;

// Maps boundary errors (arity, type mismatch) to TypeError, everything else to Exception.
void SetErrorFromException(const std::exception& error) noexcept;

}  // namespace pyhost::bridge
