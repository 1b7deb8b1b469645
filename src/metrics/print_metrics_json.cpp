/***
 * Name: pyhost::metrics::PrintMetricsJson
 * Purpose: Print counters in JSON for consumption by tools.
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Counter names are fixed identifiers and need no escaping.
 */
#include "pyhost/metrics/metrics.h"

#include <cstddef>
#include <ostream>

namespace pyhost::metrics {

auto Metrics::PrintMetricsJson(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "{\n  \"counters\": {";
  for (std::size_t i = 0; i < kCounterCount; ++i) {
    out << (i != 0U ? ",\n    \"" : "\n    \"") << CounterName(static_cast<Counter>(i))
        << "\": " << reg.counters[i];
  }
  out << "\n  }\n}";
}

}  // namespace pyhost::metrics
