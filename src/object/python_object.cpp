/***
 * Name: pyhost::PythonObject (lifecycle)
 * Purpose: Ownership operations and literal construction of object handles.
 * Inputs: Raw references or host literals
 * Outputs: Handles each holding one owned reference (or null)
 * Theory of Operation:
 *   Copy increments, move steals, reset() is the single decrement point.
 *   reset() takes the GIL itself so handles may die on any thread, and skips
 *   the runtime entirely once the interpreter has been finalized.
 *   Literal constructors start the interpreter on first use.
 */
#include "pyhost/object/python_object.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "pyhost/exceptions/internal_error.h"
#include "pyhost/object/checked.h"
#include "pyhost/runtime/gil.h"
#include "pyhost/runtime/interpreter.h"

namespace pyhost {

PythonObject::PythonObject(const PythonObject& other) noexcept : ptr_(other.ptr_) { Py_XINCREF(ptr_); }

PythonObject::PythonObject(PythonObject&& other) noexcept : ptr_(std::exchange(other.ptr_, nullptr)) {}

PythonObject& PythonObject::operator=(const PythonObject& other) noexcept {
  if (this != &other) {
    Py_XINCREF(other.ptr_);
    reset();
    ptr_ = other.ptr_;
  }
  return *this;
}

PythonObject& PythonObject::operator=(PythonObject&& other) noexcept {
  if (this != &other) {
    reset();
    ptr_ = std::exchange(other.ptr_, nullptr);
  }
  return *this;
}

PythonObject::~PythonObject() { reset(); }

void PythonObject::reset() noexcept {
  PyObject* old = std::exchange(ptr_, nullptr);
  if (old == nullptr || !runtime::Interpreter::IsAlive()) { return; }
  const runtime::ScopedGil gil;
  Py_DECREF(old);
}

PythonObject PythonObject::FromOwned(PyObject* owned) noexcept {
  PythonObject out;
  out.ptr_ = owned;
  return out;
}

PythonObject PythonObject::FromBorrowed(PyObject* borrowed) noexcept {
  Py_XINCREF(borrowed);
  return FromOwned(borrowed);
}

PythonObject::PythonObject(bool value) {
  runtime::Interpreter::Require();
  ptr_ = PyBool_FromLong(value ? 1 : 0);
}

PythonObject PythonObject::FromSigned(long long value) {
  runtime::Interpreter::Require();
  return detail::Checked(PyLong_FromLongLong(value), "PyLong_FromLongLong");
}

PythonObject PythonObject::FromUnsigned(unsigned long long value) {
  runtime::Interpreter::Require();
  return detail::Checked(PyLong_FromUnsignedLongLong(value), "PyLong_FromUnsignedLongLong");
}

PythonObject PythonObject::FromDouble(double value) {
  runtime::Interpreter::Require();
  return detail::Checked(PyFloat_FromDouble(value), "PyFloat_FromDouble");
}

PythonObject::PythonObject(const char* value) : PythonObject(std::string_view(value != nullptr ? value : "")) {}

PythonObject::PythonObject(const std::string& value) : PythonObject(std::string_view(value)) {}

PythonObject::PythonObject(std::string_view value) {
  runtime::Interpreter::Require();
  ptr_ = detail::Checked(PyUnicode_FromStringAndSize(value.data(), static_cast<Py_ssize_t>(value.size())),
                         "PyUnicode_FromStringAndSize")
             .Release();
}

PythonObject PythonObject::None() {
  runtime::Interpreter::Require();
  return FromBorrowed(Py_None);
}

PythonObject PythonObject::List(std::initializer_list<PythonObject> items) {
  return ListFrom(std::vector<PythonObject>(items));
}

PythonObject PythonObject::ListFrom(const std::vector<PythonObject>& items) {
  runtime::Interpreter::Require();
  PythonObject list = detail::Checked(PyList_New(static_cast<Py_ssize_t>(items.size())), "PyList_New");
  for (std::size_t i = 0; i < items.size(); ++i) {
    // Fresh list: SET_ITEM steals into an empty slot.
    PyList_SET_ITEM(list.Get(), static_cast<Py_ssize_t>(i), items[i].NewReference());
  }
  return list;
}

PythonObject PythonObject::Tuple(std::initializer_list<PythonObject> items) {
  return TupleFrom(std::vector<PythonObject>(items));
}

PythonObject PythonObject::TupleFrom(const std::vector<PythonObject>& items) {
  runtime::Interpreter::Require();
  PythonObject tuple = detail::Checked(PyTuple_New(static_cast<Py_ssize_t>(items.size())), "PyTuple_New");
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (PyTuple_SetItem(tuple.Get(), static_cast<Py_ssize_t>(i), items[i].NewReference()) != 0) {
      PyErr_Clear();
      throw exceptions::InternalError("PyTuple_SetItem rejected item " + std::to_string(i));
    }
  }
  return tuple;
}

PythonObject PythonObject::Dict(std::initializer_list<std::pair<PythonObject, PythonObject>> items) {
  runtime::Interpreter::Require();
  PythonObject dict = detail::Checked(PyDict_New(), "PyDict_New");
  for (const auto& [key, value] : items) {
    detail::CheckStatus(PyDict_SetItem(dict.Get(), key.target(), value.target()), "PyDict_SetItem");
  }
  return dict;
}

PyObject* PythonObject::NewReference() const noexcept {
  PyObject* out = target();
  Py_INCREF(out);
  return out;
}

PyObject* PythonObject::IntoPython() && noexcept {
  if (ptr_ == nullptr) {
    Py_INCREF(Py_None);
    return Py_None;
  }
  return Release();
}

std::string PythonObject::TypeName() const { return Py_TYPE(target())->tp_name; }

}  // namespace pyhost
