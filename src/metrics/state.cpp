/***
 * Name: pyhost::metrics::Metrics::reg_
 * Purpose: Define the static metrics registry storage.
 * Inputs: N/A
 * Outputs: Singleton-style storage for counters across the library.
 * Theory of Operation: One definition for the class-declared static member.
 */
#include "pyhost/metrics/metrics.h"

namespace pyhost {
namespace metrics {

Metrics::Registry Metrics::reg_{};

}  // namespace metrics
}  // namespace pyhost
