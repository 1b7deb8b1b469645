/***
 * Name: pyhost::PythonObject (conversions)
 * Purpose: str()/repr() and host scalar extraction.
 * Inputs: The referenced object (None when null)
 * Outputs: New handles or host values; PythonError on runtime failure
 * Theory of Operation: Intermediates are held in handles so every exit path
 *   drops them.
 */
#include "pyhost/object/python_object.h"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "pyhost/object/checked.h"

namespace pyhost {

PythonObject PythonObject::Str() const { return detail::Checked(PyObject_Str(target()), "PyObject_Str"); }

PythonObject PythonObject::Repr() const { return detail::Checked(PyObject_Repr(target()), "PyObject_Repr"); }

static std::string utf8_of(const PythonObject& text) {
  Py_ssize_t len = 0;
  const char* data = PyUnicode_AsUTF8AndSize(text.Get(), &len);
  if (data == nullptr) { detail::ThrowPendingError("PyUnicode_AsUTF8AndSize"); }
  return std::string(data, static_cast<std::size_t>(len));
}

std::string PythonObject::ToString() const {
  if (PyUnicode_Check(target()) != 0) { return utf8_of(*this); }
  return utf8_of(Str());
}

std::string PythonObject::ReprString() const { return utf8_of(Repr()); }

std::int64_t PythonObject::ToInt64() const {
  const PythonObject number = detail::Checked(PyNumber_Long(target()), "PyNumber_Long");
  const long long value = PyLong_AsLongLong(number.Get());
  if (value == -1 && PyErr_Occurred() != nullptr) { detail::ThrowPendingError("PyLong_AsLongLong"); }
  return static_cast<std::int64_t>(value);
}

double PythonObject::ToDouble() const {
  const double value = PyFloat_AsDouble(target());
  if (value == -1.0 && PyErr_Occurred() != nullptr) { detail::ThrowPendingError("PyFloat_AsDouble"); }
  return value;
}

bool PythonObject::ToBool() const { return detail::CheckStatus(PyObject_IsTrue(target()), "PyObject_IsTrue") == 1; }

std::ostream& operator<<(std::ostream& out, const PythonObject& object) { return out << object.ToString(); }

}  // namespace pyhost
