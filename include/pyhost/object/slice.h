/***
 * Name: pyhost::Slice
 * Purpose: Host-side description of a Python slice (start:stop:step).
 * Inputs: Optional bounds; an absent bound becomes None
 * Outputs: Value consumed by PythonObject::GetItem/SetItem/DelItem
 * Theory of Operation: Built only through the named factories so a braced
 *   list of integers is never mistaken for a slice during overload resolution.
 */
#pragma once

#include <cstdint>
#include <optional>

namespace pyhost {

struct Slice {
  std::optional<std::int64_t> start{};
  std::optional<std::int64_t> stop{};
  std::optional<std::int64_t> step{};

  Slice() = default;

  // [:]
  static Slice All() { return Slice(); }

  // [start:stop:step]
  static Slice Range(std::optional<std::int64_t> start, std::optional<std::int64_t> stop,
                     std::optional<std::int64_t> step = std::nullopt) {
    Slice out;
    out.start = start;
    out.stop = stop;
    out.step = step;
    return out;
  }
};

}  // namespace pyhost
