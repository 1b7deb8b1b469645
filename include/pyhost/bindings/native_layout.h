/***
 * Name: pyhost::bindings::NativeLayout / NativeTypeRegistry / Unbox
 * Purpose: Memory layout of a Python object that carries a native payload.
 * Inputs: Native payload type T
 * Outputs:
 *   - kPayloadOffset: where T lives inside the object
 *   - kInstanceSize: basicsize declared in the type spec
 *   - Payload(): the single accessor for the embedded T
 * Theory of Operation:
 *   The object is a PyObject header followed by T, with the header size
 *   rounded up to alignof(T). Every slot and trampoline reaches the payload
 *   through Payload(); nothing else computes the offset. CPython allocates
 *   object memory with at least max_align_t alignment, which bounds alignof(T).
 *   NativeTypeRegistry<T> remembers the type object TypeBuilder<T> created so
 *   UnboxChecked can verify an object before handing out its payload.
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include <cstddef>
#include <new>
#include <string>

#include "pyhost/exceptions/type_mismatch_error.h"
#include "pyhost/object/python_object.h"

namespace pyhost::bindings {

template <class T>
struct NativeLayout {
  static_assert(alignof(T) <= alignof(std::max_align_t), "payload alignment exceeds what the allocator guarantees");

  static constexpr std::size_t kPayloadOffset = (sizeof(PyObject) + alignof(T) - 1) / alignof(T) * alignof(T);
  static constexpr std::size_t kInstanceSize = kPayloadOffset + sizeof(T);

  // Raw storage; the payload may not be constructed yet.
  static void* PayloadStorage(PyObject* self) noexcept { return reinterpret_cast<char*>(self) + kPayloadOffset; }

  static T& Payload(PyObject* self) noexcept { return *std::launder(reinterpret_cast<T*>(PayloadStorage(self))); }
};

template <class T>
struct NativeTypeRegistry {
  // Holds one reference for the life of the process.
  static inline PyTypeObject* type = nullptr;
  static inline std::string name{};
};

// No type check: `object` must be an instance of T's registered type.
template <class T>
T& Unbox(const PythonObject& object) noexcept {
  return NativeLayout<T>::Payload(object.Get());
}

template <class T>
T& UnboxChecked(const PythonObject& object) {
  PyTypeObject* type = NativeTypeRegistry<T>::type;
  if (type == nullptr || object.IsNull() || PyObject_TypeCheck(object.Get(), type) == 0) {
    const std::string expected = type != nullptr ? std::string(type->tp_name) : "unregistered native type";
    throw exceptions::TypeMismatchError("expected '" + expected + "' but received '" + object.TypeName() + "'");
  }
  return Unbox<T>(object);
}

}  // namespace pyhost::bindings
