/***
 * Name: pyhost::runtime::Interpreter
 * Purpose: Process-wide handle owning the embedded CPython lifecycle.
 * Inputs: An optional InterpreterConfig supplied before first use
 * Outputs: A lazily-initialized singleton every pyhost component borrows
 * Theory of Operation:
 *   - Get() constructs the handle on first call (function-local static, so
 *     initialization is idempotent and thread-safe) and starts CPython
 *     through PyConfig unless the process already runs an interpreter, in
 *     which case the handle only borrows it.
 *   - A failed start is kept as the handle's init error; Require() turns it
 *     into ConfigError for every caller.
 *   - Destruction at process exit finalizes an owned interpreter, then frees
 *     the keep-alive storage (type specs and method tables CPython points at).
 *   - After finalization IsAlive() is false and reference destructors skip
 *     the runtime entirely.
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "pyhost/runtime/interpreter_config.h"

namespace pyhost::runtime {

class Interpreter {
 public:
  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;
  ~Interpreter();

  // Install settings for the first start; throws ConfigError once the handle exists.
  static void Configure(InterpreterConfig config);

  static Interpreter& Get();

  // Get(), then throw ConfigError if the interpreter failed to start.
  static Interpreter& Require();

  static bool IsAlive() noexcept;

  bool Initialized() const noexcept { return initError_.empty(); }
  const std::string& InitError() const noexcept { return initError_; }
  bool OwnsInterpreter() const noexcept { return owns_; }
  const InterpreterConfig& Config() const noexcept { return config_; }

  std::string Version() const;

  // Keep storage alive until after the interpreter is finalized.
  void KeepAlive(std::shared_ptr<void> storage);

 private:
  explicit Interpreter(InterpreterConfig config);

  void start();
  void extendSysPath();

  InterpreterConfig config_;
  std::string initError_{};
  bool owns_{false};
  std::mutex keepAliveMu_{};
  std::vector<std::shared_ptr<void>> keepAlive_{};
};

}  // namespace pyhost::runtime
