/***
 * Name: pyhost::support (debug log state)
 * Purpose: Hold the process-wide tracing flag.
 * Theory of Operation: Initialized from PYHOST_DEBUG at static-init time;
 *   atomic because destructors may trace from any thread.
 */
#include "pyhost/support/debug_log.h"

#include <atomic>

#include "pyhost/support/env.h"

namespace pyhost::support {

static std::atomic<bool> g_debug{EnvFlag("PYHOST_DEBUG")}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

bool DebugEnabled() noexcept { return g_debug.load(std::memory_order_relaxed); }

void SetDebugEnabled(bool enabled) noexcept { g_debug.store(enabled, std::memory_order_relaxed); }

}  // namespace pyhost::support
