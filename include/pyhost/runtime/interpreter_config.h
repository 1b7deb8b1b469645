/***
 * Name: pyhost::runtime::InterpreterConfig
 * Purpose: Settings applied when the embedded interpreter is first started.
 * Inputs: Explicit values or the PYHOST_* environment
 * Outputs: A value consumed once by Interpreter
 * Theory of Operation: Plain aggregate; FromEnvironment fills it from
 *   PYHOST_PROGRAM_NAME, PYHOST_PYTHONHOME, PYHOST_PATH (':'-separated),
 *   PYHOST_SIGNALS, PYHOST_DEBUG and PYHOST_METRICS.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pyhost::runtime {

struct InterpreterConfig {
  std::string programName{"pyhost"};
  std::optional<std::string> pythonHome{};
  std::vector<std::string> extraPaths{};  // appended to sys.path after start-up
  bool installSignalHandlers{false};
  bool debug{false};
  bool metrics{false};

  static InterpreterConfig FromEnvironment();
};

}  // namespace pyhost::runtime
