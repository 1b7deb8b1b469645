/***
 * Name: pyhost::runtime::InterpreterConfig::FromEnvironment
 * Purpose: Build interpreter settings from PYHOST_* environment variables.
 * Inputs: Process environment
 * Outputs: InterpreterConfig with defaults for unset variables
 * Theory of Operation: PYHOST_PATH is split on ':' and empty segments are
 *   dropped; boolean variables go through support::EnvFlag.
 */
#include "pyhost/runtime/interpreter_config.h"

#include <cstddef>
#include <string>

#include "pyhost/support/env.h"

namespace pyhost::runtime {

static void split_paths(const std::string& joined, std::vector<std::string>& out) {
  std::size_t begin = 0;
  while (begin <= joined.size()) {
    const std::size_t end = joined.find(':', begin);
    const std::size_t stop = end == std::string::npos ? joined.size() : end;
    if (stop > begin) { out.emplace_back(joined.substr(begin, stop - begin)); }
    if (end == std::string::npos) { break; }
    begin = end + 1;
  }
}

InterpreterConfig InterpreterConfig::FromEnvironment() {
  InterpreterConfig config;
  if (auto name = support::EnvString("PYHOST_PROGRAM_NAME")) { config.programName = *name; }
  config.pythonHome = support::EnvString("PYHOST_PYTHONHOME");
  if (auto paths = support::EnvString("PYHOST_PATH")) { split_paths(*paths, config.extraPaths); }
  config.installSignalHandlers = support::EnvFlag("PYHOST_SIGNALS");
  config.debug = support::EnvFlag("PYHOST_DEBUG");
  config.metrics = support::EnvFlag("PYHOST_METRICS");
  return config;
}

}  // namespace pyhost::runtime
