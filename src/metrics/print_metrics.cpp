/***
 * Name: pyhost::metrics::PrintMetrics
 * Purpose: Pretty-print collected boundary counters.
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: One line per counter in declaration order.
 */
#include "pyhost/metrics/metrics.h"

#include <cstddef>
#include <ostream>

namespace pyhost::metrics {

auto Metrics::PrintMetrics(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "== pyhost metrics ==\n";
  for (std::size_t i = 0; i < kCounterCount; ++i) {
    out << "  " << CounterName(static_cast<Counter>(i)) << ": " << reg.counters[i] << "\n";
  }
}

}  // namespace pyhost::metrics
