/***
 * Name: pyhost::support::EnvFlag
 * Purpose: Read a boolean setting from the environment.
 * Inputs:
 *   - name: environment variable name
 * Outputs: true when set to a true value
 */
#include "pyhost/support/env.h"

#include <cstdlib>

namespace pyhost::support {

bool EnvFlag(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr) { return false; }
  return IsTrueValue(value);
}

}  // namespace pyhost::support
