/***
 * Name: pyhost::support (env)
 * Purpose: Read pyhost settings from the process environment.
 * Inputs: Environment variable names
 * Outputs: Parsed flag and string values
 * Theory of Operation: Thin wrappers over std::getenv; booleans accept
 *   "1", "true" and "yes" case-insensitively, everything else is false.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace pyhost {
namespace support {

/*** IsTrueValue: Interpret a setting string as a boolean flag. */
bool IsTrueValue(std::string_view value);

/*** EnvFlag: True when the variable is set to a true value. */
bool EnvFlag(const char* name);

/*** EnvString: Value of the variable, or nullopt when unset or empty. */
std::optional<std::string> EnvString(const char* name);

}  // namespace support
}  // namespace pyhost
