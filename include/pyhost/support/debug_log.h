/***
 * Name: pyhost::support (debug log)
 * Purpose: Opt-in diagnostic tracing to stderr.
 * Inputs: printf-style format and arguments
 * Outputs: One "[pyhost] ..." line per call when tracing is enabled
 * Theory of Operation: The enabled flag starts from PYHOST_DEBUG and can be
 *   overridden by InterpreterConfig::debug. Disabled tracing costs one load.
 */
#pragma once

#include <cstdio>

namespace pyhost {
namespace support {

bool DebugEnabled() noexcept;

void SetDebugEnabled(bool enabled) noexcept;

}  // namespace support
}  // namespace pyhost

#define PYHOST_DEBUG_LOG(...)                 \
  do {                                        \
    if (::pyhost::support::DebugEnabled()) {  \
      std::fprintf(stderr, "[pyhost] ");      \
      std::fprintf(stderr, __VA_ARGS__);      \
      std::fputc('\n', stderr);               \
    }                                         \
  } while (0)
