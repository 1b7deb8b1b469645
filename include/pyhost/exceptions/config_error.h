/***
 * Name: pyhost::exceptions::ConfigError
 * Purpose: Exception for interpreter configuration and initialization failures.
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

class ConfigError : public PyhostException {
 public:
  explicit ConfigError(std::string msg) noexcept : PyhostException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyhost
