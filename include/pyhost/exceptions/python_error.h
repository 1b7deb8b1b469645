/***
 * Name: pyhost::exceptions::PythonError
 * Purpose: Host-side form of an exception raised inside the embedded interpreter.
 * Inputs: The str() rendering of the Python exception
 * Outputs: Exception object
 * Theory of Operation: Only the message text crosses the boundary; the Python
 *   exception class is not preserved. Produced by pyhost::bridge.
 */
#pragma once

#include <string>
#include <utility>

#include "pyhost/exceptions/pyhost_exception.h"

namespace pyhost {
namespace exceptions {

class PythonError : public PyhostException {
 public:
  explicit PythonError(std::string msg) noexcept : PyhostException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyhost
