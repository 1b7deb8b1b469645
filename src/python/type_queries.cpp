/***
 * Name: pyhost::python::Type / IsType / IsInstance
 * Purpose: Runtime type inspection of objects.
 * Inputs: An object (null acts as None) and a type object
 * Outputs: The object's type, or the answer to the type question
 */
#include "pyhost/python.h"

namespace pyhost::python {

TypedPythonObject<shape::Type> Type(const PythonObject& object) {
  PyObject* target = object.IsNull() ? Py_None : object.Get();
  return TypedPythonObject<shape::Type>::Unchecked(
      PythonObject::FromBorrowed(reinterpret_cast<PyObject*>(Py_TYPE(target))));
}

bool IsType(const PythonObject& object, const TypedPythonObject<shape::Type>& type) {
  PyObject* target = object.IsNull() ? Py_None : object.Get();
  return Py_TYPE(target) == type.TypeObject();
}

bool IsInstance(const PythonObject& object, const TypedPythonObject<shape::Type>& type) {
  return type.IsInstance(object);
}

}  // namespace pyhost::python
