/***
 * Name: pyhost::exceptions::InternalError
 * Purpose: Exception for broken invariants inside pyhost itself (not the embedded program).
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

class InternalError : public PyhostException {
 public:
  explicit InternalError(std::string msg) noexcept : PyhostException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyhost
