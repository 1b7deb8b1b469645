/***
 * Name: pyhost::runtime::ScopedGil / ScopedGilRelease
 * Purpose: RAII guards for the interpreter lock.
 * Theory of Operation:
 *   - ScopedGil wraps PyGILState_Ensure/Release; it nests and works from
 *     threads CPython has never seen.
 *   - ScopedGilRelease detaches the current thread state so other threads
 *     can take the lock, and reattaches on scope exit.
 *   Release happens in the destructor, so every exit path (including
 *   exceptions) gives the lock back.
 */
#pragma once

#include "pyhost/runtime/python_api.h"

namespace pyhost::runtime {

class ScopedGil {
 public:
  ScopedGil() noexcept : state_(PyGILState_Ensure()) {}
  ~ScopedGil() { PyGILState_Release(state_); }
  ScopedGil(const ScopedGil&) = delete;
  ScopedGil& operator=(const ScopedGil&) = delete;

 private:
  PyGILState_STATE state_;
};

class ScopedGilRelease {
 public:
  ScopedGilRelease() noexcept : saved_(PyEval_SaveThread()) {}
  ~ScopedGilRelease() { PyEval_RestoreThread(saved_); }
  ScopedGilRelease(const ScopedGilRelease&) = delete;
  ScopedGilRelease& operator=(const ScopedGilRelease&) = delete;

 private:
  PyThreadState* saved_;
};

}  // namespace pyhost::runtime
