/***
 * Name: pyhost::exceptions::TypeMismatchError
 * Purpose: Exception for a foreign object whose type is not the native type a wrapper expected.
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

class TypeMismatchError : public PyhostException {
 public:
  explicit TypeMismatchError(std::string msg) noexcept : PyhostException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyhost
