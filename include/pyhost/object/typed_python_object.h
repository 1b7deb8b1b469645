/***
 * Name: pyhost::TypedPythonObject
 * Purpose: Zero-cost shape tag on a PythonObject that narrows which
 *   operations are offered at compile time.
 * Inputs: A PythonObject the caller asserts has the tagged shape
 * Outputs: Shape-specific accessors (tuple items, module attributes, type name)
 * Theory of Operation:
 *   The tag is a type parameter only; the wrapper stores exactly one
 *   PythonObject and never inspects the real Python type. Unchecked() is the
 *   only way in, and its name says what it does. Shape-specific members are
 *   guarded by static_assert, so they fail to compile for other tags.
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "pyhost/object/python_object.h"

namespace pyhost {

namespace shape {

struct Tuple { static constexpr const char* kName = "Tuple"; };
struct List { static constexpr const char* kName = "List"; };
struct Dict { static constexpr const char* kName = "Dict"; };
struct Module { static constexpr const char* kName = "Module"; };
struct Type { static constexpr const char* kName = "Type"; };

}  // namespace shape

template <class Shape>
class TypedPythonObject {
 public:
  TypedPythonObject() noexcept = default;

  // No validation: the caller guarantees `object` has this shape.
  static TypedPythonObject Unchecked(PythonObject object) noexcept {
    TypedPythonObject typed;
    typed.object_ = std::move(object);
    return typed;
  }

  static constexpr const char* ShapeName() noexcept { return Shape::kName; }

  const PythonObject& Object() const& noexcept { return object_; }
  PythonObject Object() && noexcept { return std::move(object_); }
  operator const PythonObject&() const& noexcept { return object_; }
  const PythonObject* operator->() const noexcept { return &object_; }

  PyObject* Get() const noexcept { return object_.Get(); }
  PyObject* Release() noexcept { return object_.Release(); }

  // Tuple / List / Dict
  std::size_t Size() const {
    Py_ssize_t size = -1;
    if constexpr (std::is_same_v<Shape, shape::Tuple>) {
      size = PyTuple_Size(object_.Get());
    } else if constexpr (std::is_same_v<Shape, shape::List>) {
      size = PyList_Size(object_.Get());
    } else {
      static_assert(std::is_same_v<Shape, shape::Dict>, "Size() needs a Tuple, List or Dict shape");
      size = PyDict_Size(object_.Get());
    }
    if (size < 0) { detail::ThrowPendingError("Size()"); }
    return static_cast<std::size_t>(size);
  }

  // Tuple / List: item at a non-negative position.
  PythonObject At(std::size_t index) const {
    PyObject* item = nullptr;  // borrowed
    if constexpr (std::is_same_v<Shape, shape::Tuple>) {
      item = PyTuple_GetItem(object_.Get(), static_cast<Py_ssize_t>(index));
    } else {
      static_assert(std::is_same_v<Shape, shape::List>, "At() needs a Tuple or List shape");
      item = PyList_GetItem(object_.Get(), static_cast<Py_ssize_t>(index));
    }
    if (item == nullptr) { detail::ThrowPendingError("At()"); }
    return PythonObject::FromBorrowed(item);
  }

  // Module
  void AddObject(const std::string& name, const PythonObject& value) {
    static_assert(std::is_same_v<Shape, shape::Module>, "AddObject() needs a Module shape");
    PyObject* ref = value.NewReference();
    const int rc = PyModule_AddObjectRef(object_.Get(), name.c_str(), ref);
    Py_DECREF(ref);
    if (rc != 0) { detail::ThrowPendingError("PyModule_AddObjectRef"); }
  }

  // Module (__name__) / Type (__qualname__-style tp_name).
  std::string Name() const {
    if constexpr (std::is_same_v<Shape, shape::Module>) {
      const char* name = PyModule_GetName(object_.Get());
      if (name == nullptr) { detail::ThrowPendingError("PyModule_GetName"); }
      return name;
    } else {
      static_assert(std::is_same_v<Shape, shape::Type>, "Name() needs a Module or Type shape");
      return reinterpret_cast<PyTypeObject*>(object_.Get())->tp_name;
    }
  }

  // Type
  bool IsInstance(const PythonObject& object) const {
    static_assert(std::is_same_v<Shape, shape::Type>, "IsInstance() needs a Type shape");
    const int rc = PyObject_IsInstance(object.IsNull() ? Py_None : object.Get(), object_.Get());
    if (rc < 0) { detail::ThrowPendingError("PyObject_IsInstance"); }
    return rc == 1;
  }

  PyTypeObject* TypeObject() const noexcept {
    static_assert(std::is_same_v<Shape, shape::Type>, "TypeObject() needs a Type shape");
    return reinterpret_cast<PyTypeObject*>(object_.Get());
  }

 private:
  PythonObject object_{};
};

static_assert(sizeof(TypedPythonObject<shape::Tuple>) == sizeof(PythonObject),
              "shape tags must not change the handle's layout");

}  // namespace pyhost
