/***
 * Name: pyhost::runtime::Interpreter (impl)
 * Purpose: Start, borrow and finalize the embedded CPython interpreter.
 */
#include "pyhost/runtime/interpreter.h"

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "pyhost/bridge/error_bridge.h"
#include "pyhost/exceptions/config_error.h"
#include "pyhost/metrics/metrics.h"
#include "pyhost/support/debug_log.h"

namespace pyhost::runtime {

static std::mutex g_config_mu; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::optional<InterpreterConfig> g_pending; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static bool g_created = false; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::atomic<bool> g_finalized{false}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

static InterpreterConfig take_pending_config() {
  const std::lock_guard<std::mutex> lock(g_config_mu);
  g_created = true;
  if (g_pending) { return std::move(*g_pending); }
  return InterpreterConfig::FromEnvironment();
}

void Interpreter::Configure(InterpreterConfig config) {
  const std::lock_guard<std::mutex> lock(g_config_mu);
  if (g_created) {
    throw exceptions::ConfigError("interpreter already started; Configure() must precede first use");
  }
  g_pending = std::move(config);
}

Interpreter& Interpreter::Get() {
  static Interpreter instance(take_pending_config());
  return instance;
}

Interpreter& Interpreter::Require() {
  Interpreter& interp = Get();
  if (!interp.Initialized()) {
    throw exceptions::ConfigError("python interpreter failed to start: " + interp.InitError());
  }
  return interp;
}

bool Interpreter::IsAlive() noexcept {
  return !g_finalized.load(std::memory_order_acquire) && Py_IsInitialized() != 0;
}

Interpreter::Interpreter(InterpreterConfig config) : config_(std::move(config)) {
  if (config_.debug) { support::SetDebugEnabled(true); }
  if (config_.metrics) { metrics::Metrics::Enable(true); }
  start();
}

void Interpreter::start() {
  if (Py_IsInitialized() != 0) {
    owns_ = false;
    PYHOST_DEBUG_LOG("borrowing running interpreter %s", Py_GetVersion());
    return;
  }
  PyConfig pyConfig;
  PyConfig_InitPythonConfig(&pyConfig);
  pyConfig.install_signal_handlers = config_.installSignalHandlers ? 1 : 0;
  PyStatus status = PyConfig_SetBytesString(&pyConfig, &pyConfig.program_name, config_.programName.c_str());
  if (!PyStatus_Exception(status) && config_.pythonHome) {
    status = PyConfig_SetBytesString(&pyConfig, &pyConfig.home, config_.pythonHome->c_str());
  }
  if (!PyStatus_Exception(status)) {
    status = Py_InitializeFromConfig(&pyConfig);
  }
  PyConfig_Clear(&pyConfig);
  if (PyStatus_Exception(status)) {
    initError_ = status.err_msg != nullptr ? status.err_msg : "unknown initialization failure";
    if (status.func != nullptr) { initError_ = std::string(status.func) + ": " + initError_; }
    PYHOST_DEBUG_LOG("interpreter start failed: %s", initError_.c_str());
    return;
  }
  owns_ = true;
  PYHOST_DEBUG_LOG("started interpreter %s", Py_GetVersion());
  extendSysPath();
}

void Interpreter::extendSysPath() {
  if (config_.extraPaths.empty()) { return; }
  PyObject* sysPath = PySys_GetObject("path"); // borrowed
  if (sysPath == nullptr || PyList_Check(sysPath) == 0) {
    initError_ = "sys.path is missing or not a list";
    return;
  }
  for (const auto& dir : config_.extraPaths) {
    PyObject* entry = PyUnicode_FromStringAndSize(dir.data(), static_cast<Py_ssize_t>(dir.size()));
    const int rc = entry == nullptr ? -1 : PyList_Append(sysPath, entry);
    Py_XDECREF(entry);
    if (rc != 0) {
      initError_ = "cannot extend sys.path with '" + dir + "': " + bridge::UnsafeGetError().what();
      return;
    }
    PYHOST_DEBUG_LOG("sys.path += %s", dir.c_str());
  }
}

std::string Interpreter::Version() const { return Py_GetVersion(); }

void Interpreter::KeepAlive(std::shared_ptr<void> storage) {
  const std::lock_guard<std::mutex> lock(keepAliveMu_);
  keepAlive_.push_back(std::move(storage));
}

Interpreter::~Interpreter() {
  if (config_.metrics) {
    metrics::Metrics::PrintMetrics(metrics::Metrics::GetRegistry(), std::cerr);
  }
  if (owns_ && Py_IsInitialized() != 0) {
    // Finalization consumes the lock; it is never released afterwards.
    PyGILState_Ensure();
    g_finalized.store(true, std::memory_order_release);
    if (Py_FinalizeEx() < 0) {
      PYHOST_DEBUG_LOG("Py_FinalizeEx could not flush buffered data");
    }
    PYHOST_DEBUG_LOG("interpreter finalized");
  }
  const std::lock_guard<std::mutex> lock(keepAliveMu_);
  keepAlive_.clear();
}

}  // namespace pyhost::runtime
