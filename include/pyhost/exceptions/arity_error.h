/***
 * Name: pyhost::exceptions::ArityError
 * Purpose: Exception for argument-count mismatches detected at the native call boundary.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyhostException.
 */
#pragma once

#include <string>
#include <utility>

#include "pyhost/exceptions/pyhost_exception.h"

namespace pyhost {
namespace exceptions {

class ArityError : public PyhostException {
 public:
  explicit ArityError(std::string msg) noexcept : PyhostException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyhost
