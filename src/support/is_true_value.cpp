/***
 * Name: pyhost::support::IsTrueValue
 * Purpose: Interpret an environment setting as a boolean.
 * Inputs:
 *   - value: raw setting text
 * Outputs: true for "1", "true" or "yes" (any case)
 * Theory of Operation: Case-insensitive comparison against a fixed set.
 */
#include "pyhost/support/env.h"

#include <cctype>
#include <cstddef>
#include <string_view>

namespace pyhost::support {

static bool equals_ci(const std::string_view lhs, const std::string_view rhs) {
  if (lhs.size() != rhs.size()) { return false; }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const unsigned char lhsCh = static_cast<unsigned char>(lhs[i]);
    const unsigned char rhsCh = static_cast<unsigned char>(rhs[i]);
    if (std::tolower(lhsCh) != std::tolower(rhsCh)) { return false; }
  }
  return true;
}

bool IsTrueValue(std::string_view value) {
  if (value == "1") { return true; }
  return equals_ci(value, "true") || equals_ci(value, "yes");
}

}  // namespace pyhost::support
