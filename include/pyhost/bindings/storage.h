/***
 * Name: pyhost::bindings::detail::MethodTable / TypeStorage
 * Purpose: Memory CPython keeps pointers into after registration.
 * Theory of Operation:
 *   PyMethodDef entries and PyType_Spec hold raw char pointers, so the
 *   strings behind them live in containers that never relocate elements
 *   (std::deque). Both structures are handed to Interpreter::KeepAlive once
 *   registered and are freed only after finalization.
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace pyhost::bindings::detail {

class MethodTable {
 public:
  void Add(std::string name, PyCFunction function, int flags, std::string doc);

  // Appends the sentinel entry (once) and returns the table.
  PyMethodDef* Finish();

  bool Empty() const noexcept { return defs_.empty(); }
  std::size_t Size() const noexcept { return finished_ ? defs_.size() - 1 : defs_.size(); }
  bool Contains(const std::string& name) const;

 private:
  const char* intern(std::string text);

  std::deque<std::string> strings_{};
  std::vector<PyMethodDef> defs_{};
  bool finished_{false};
};

struct TypeStorage {
  std::string name;
  std::string doc;
  MethodTable methods{};
  std::vector<PyType_Slot> slots{};
  PyType_Spec spec{};
};

}  // namespace pyhost::bindings::detail
