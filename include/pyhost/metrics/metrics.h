/***
 * Name: pyhost::metrics::Metrics
 * Purpose: Static registry of counters describing traffic across the
 *   interpreter boundary.
 * Inputs: Counter identifiers and deltas recorded by the dispatcher, the
 *   exception bridge and the builders.
 * Outputs: Text and JSON summaries for the embedding application.
 * Theory of Operation: All instances share a static Registry and enabled flag.
 *   Recording sites run with the GIL held, which serializes updates.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>

namespace pyhost {

namespace metrics {

class Metrics {
 public:
  enum class Counter : std::size_t {
    DispatchCalls,
    DispatchMethods,
    BridgedErrors,
    TypesCreated,
    FunctionsRegistered,
  };
  static constexpr std::size_t kCounterCount = 5;

  struct Registry {
    bool enabled{false};
    std::array<std::uint64_t, kCounterCount> counters{};
  };

  static void Enable(bool on) { reg_.enabled = on; }
  static Registry& GetRegistry() { return reg_; }
  static void Reset() { reg_.counters.fill(0); }
  static void Increment(Counter counter, std::uint64_t delta = 1) {
    if (reg_.enabled) reg_.counters[static_cast<std::size_t>(counter)] += delta;
  }
  static std::uint64_t Value(Counter counter) { return reg_.counters[static_cast<std::size_t>(counter)]; }

  static const char* CounterName(Counter counter);

  static void PrintMetrics(const Registry& reg, std::ostream& out);
  static void PrintMetricsJson(const Registry& reg, std::ostream& out);

 protected:
  Metrics() = default;

 private:
  static Registry reg_;
};

}  // namespace metrics
}  // namespace pyhost
