/***
 * Name: pyhost::metrics::Metrics::CounterName
 * Purpose: Stable dotted name for a counter, used in text and JSON output.
 */
#include "pyhost/metrics/metrics.h"

namespace pyhost::metrics {

const char* Metrics::CounterName(Counter counter) {
  switch (counter) {
    case Counter::DispatchCalls: return "dispatch.calls";
    case Counter::DispatchMethods: return "dispatch.methods";
    case Counter::BridgedErrors: return "bridge.errors";
    case Counter::TypesCreated: return "types.created";
    case Counter::FunctionsRegistered: return "functions.registered";
  }
  return "unknown";
}

}  // namespace pyhost::metrics
