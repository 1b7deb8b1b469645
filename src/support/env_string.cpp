/***
 * Name: pyhost::support::EnvString
 * Purpose: Read a string setting from the environment.
 * Inputs:
 *   - name: environment variable name
 * Outputs: Value, or nullopt when unset or empty
 */
#include "pyhost/support/env.h"

#include <cstdlib>
#include <optional>
#include <string>

namespace pyhost::support {

std::optional<std::string> EnvString(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') { return std::nullopt; }
  return std::string(value);
}

}  // namespace pyhost::support
