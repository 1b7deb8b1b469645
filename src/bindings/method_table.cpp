/***
 * Name: pyhost::bindings::detail::MethodTable
 * Purpose: Accumulate PyMethodDef entries with stable string storage.
 * Inputs:
 *   - name/doc: copied into interned storage
 *   - function/flags: calling convention as CPython expects it
 * Outputs: Sentinel-terminated PyMethodDef array
 */
#include "pyhost/bindings/storage.h"

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

#include "pyhost/exceptions/internal_error.h"

namespace pyhost::bindings::detail {

const char* MethodTable::intern(std::string text) {
  strings_.push_back(std::move(text));
  return strings_.back().c_str();
}

void MethodTable::Add(std::string name, PyCFunction function, int flags, std::string doc) {
  if (finished_) { throw exceptions::InternalError("method '" + name + "' added after the table was finished"); }
  if (Contains(name)) { throw exceptions::InternalError("method '" + name + "' registered twice"); }
  const char* docPtr = doc.empty() ? nullptr : intern(std::move(doc));
  PyMethodDef def{};
  def.ml_name = intern(std::move(name));
  def.ml_meth = function;
  def.ml_flags = flags;
  def.ml_doc = docPtr;
  defs_.push_back(def);
}

bool MethodTable::Contains(const std::string& name) const {
  return std::any_of(defs_.begin(), defs_.end(), [&name](const PyMethodDef& def) {
    return def.ml_name != nullptr && std::strcmp(def.ml_name, name.c_str()) == 0;
  });
}

PyMethodDef* MethodTable::Finish() {
  if (!finished_) {
    defs_.push_back(PyMethodDef{nullptr, nullptr, 0, nullptr});
    finished_ = true;
  }
  return defs_.data();
}

}  // namespace pyhost::bindings::detail
