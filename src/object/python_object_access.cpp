/***
 * Name: pyhost::PythonObject (attribute and item access)
 * Purpose: getattr/setattr/hasattr/delattr and obj[key] in all its forms.
 * Inputs:
 *   - name: attribute name (UTF-8)
 *   - key(s): one key, several keys (packed into a tuple), or slices
 * Outputs: New handles for reads; PythonError on runtime failure
 * Theory of Operation:
 *   Each Slice bound becomes an int object or None before PySlice_New. A
 *   single slice is the key itself; several slices form a tuple key, so
 *   GetItem({Slice::All(), Slice::Range(0, 2)}) reads obj[:, 0:2].
 */
#include "pyhost/object/python_object.h"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "pyhost/object/checked.h"

namespace pyhost {

static PythonObject slice_bound(const std::optional<std::int64_t>& bound) {
  if (!bound) { return PythonObject::None(); }
  return PythonObject(*bound);
}

static PythonObject to_slice(const Slice& slice) {
  const PythonObject start = slice_bound(slice.start);
  const PythonObject stop = slice_bound(slice.stop);
  const PythonObject step = slice_bound(slice.step);
  return detail::Checked(PySlice_New(start.Get(), stop.Get(), step.Get()), "PySlice_New");
}

PythonObject PythonObject::Attr(std::string_view name) const {
  const PythonObject key(name);
  return detail::Checked(PyObject_GetAttr(target(), key.Get()), "PyObject_GetAttr");
}

void PythonObject::SetAttr(std::string_view name, const PythonObject& value) {
  const PythonObject key(name);
  detail::CheckStatus(PyObject_SetAttr(target(), key.Get(), value.target()), "PyObject_SetAttr");
}

bool PythonObject::HasAttr(std::string_view name) const {
  const PythonObject key(name);
  return PyObject_HasAttr(target(), key.Get()) == 1;
}

void PythonObject::DelAttr(std::string_view name) {
  const PythonObject key(name);
  detail::CheckStatus(PyObject_SetAttr(target(), key.Get(), nullptr), "PyObject_DelAttr");
}

PythonObject PythonObject::GetItem(const PythonObject& key) const {
  return detail::Checked(PyObject_GetItem(target(), key.target()), "PyObject_GetItem");
}

PythonObject PythonObject::GetItem(const std::vector<PythonObject>& keys) const { return GetItem(TupleFrom(keys)); }

PythonObject PythonObject::GetItem(const Slice& slice) const { return GetItem(to_slice(slice)); }

PythonObject PythonObject::GetItem(const std::vector<Slice>& slices) const {
  std::vector<PythonObject> keys;
  keys.reserve(slices.size());
  for (const auto& slice : slices) { keys.push_back(to_slice(slice)); }
  return GetItem(TupleFrom(keys));
}

void PythonObject::SetItem(const PythonObject& key, const PythonObject& value) {
  detail::CheckStatus(PyObject_SetItem(target(), key.target(), value.target()), "PyObject_SetItem");
}

void PythonObject::SetItem(const std::vector<PythonObject>& keys, const PythonObject& value) {
  SetItem(TupleFrom(keys), value);
}

void PythonObject::SetItem(const Slice& slice, const PythonObject& value) { SetItem(to_slice(slice), value); }

void PythonObject::DelItem(const PythonObject& key) {
  detail::CheckStatus(PyObject_DelItem(target(), key.target()), "PyObject_DelItem");
}

}  // namespace pyhost
