/***
 * Name: pyhost::bindings::TypeBuilder<T>
 * Purpose: Expose a native value type T to Python as a new heap type.
 * Inputs:
 *   - T: default-constructible, move-assignable, `std::string Repr() const`
 *   - methods added before Finalize()
 * Outputs: The created type object (and, when built through a
 *   ModuleBuilder, a module attribute holding it)
 * Theory of Operation:
 *   Instances use NativeLayout<T>. The slot functions keep the payload's
 *   lifetime tied to the object's:
 *     tp_alloc   PyType_GenericAlloc (zeroed memory, type reference taken)
 *     tp_new     allocate, then default-construct T in place
 *     tp_init    reject every argument, else reset the payload to T()
 *     tp_dealloc ~T(), tp_free, drop the type reference
 *     tp_repr    T::Repr() as a str
 *   Because tp_new constructs the payload, dealloc always destroys a live T,
 *   even for objects whose __init__ failed or was never called.
 *   Finalize() hands the spec to PyType_FromSpec; the spec's strings and
 *   tables are then kept alive by the interpreter handle.
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include <exception>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "pyhost/bindings/function_wrapper.h"
#include "pyhost/bindings/native_layout.h"
#include "pyhost/bindings/storage.h"
#include "pyhost/bridge/error_bridge.h"
#include "pyhost/exceptions/internal_error.h"
#include "pyhost/object/python_object.h"
#include "pyhost/object/typed_python_object.h"

namespace pyhost::bindings {

class ModuleBuilder;

namespace detail {

template <class T, class = void>
struct HasRepr : std::false_type {};

template <class T>
struct HasRepr<T, std::void_t<decltype(std::declval<const T&>().Repr())>>
    : std::is_convertible<decltype(std::declval<const T&>().Repr()), std::string> {};

// "pkg.mod.Point" -> "Point"
const char* ShortTypeName(PyTypeObject* type) noexcept;

// PyType_FromSpec on storage->spec; registers the storage for keep-alive and
// adds the type to `module` under `attrName` when a module is given.
TypedPythonObject<shape::Type> MaterializeType(const std::shared_ptr<TypeStorage>& storage,
                                               TypedPythonObject<shape::Module>* module,
                                               const std::string& attrName);

}  // namespace detail

template <class T>
class TypeBuilder {
  static_assert(std::is_default_constructible_v<T>, "native type must be default-constructible");
  static_assert(std::is_move_assignable_v<T>, "native type must be move-assignable");
  static_assert(detail::HasRepr<T>::value, "native type must provide std::string Repr() const");

 public:
  // `name` is the qualified type name, e.g. "geometry.Point".
  explicit TypeBuilder(std::string name, std::string doc = {}) : storage_(std::make_shared<detail::TypeStorage>()) {
    storage_->name = std::move(name);
    storage_->doc = std::move(doc);
  }

  TypeBuilder& AddMethod(std::string name, PyCFunction function, std::string doc = {}) {
    storage_->methods.Add(std::move(name), function, METH_VARARGS, std::move(doc));
    return *this;
  }

  template <auto Fn>
  TypeBuilder& DefMethod(std::string name, std::string doc = {}) {
    return AddMethod(std::move(name), WrapMethod<T, Fn>, std::move(doc));
  }

  const std::string& Name() const noexcept { return storage_->name; }

  TypedPythonObject<shape::Type> Finalize() {
    if (finalized_) { throw exceptions::InternalError("type '" + storage_->name + "' finalized twice"); }
    detail::TypeStorage& storage = *storage_;
    storage.slots = {
        {Py_tp_alloc, reinterpret_cast<void*>(&PyType_GenericAlloc)},
        {Py_tp_new, reinterpret_cast<void*>(&tpNew)},
        {Py_tp_init, reinterpret_cast<void*>(&tpInit)},
        {Py_tp_dealloc, reinterpret_cast<void*>(&tpDealloc)},
        {Py_tp_repr, reinterpret_cast<void*>(&tpRepr)},
    };
    if (!storage.doc.empty()) { storage.slots.push_back({Py_tp_doc, const_cast<char*>(storage.doc.c_str())}); }
    if (!storage.methods.Empty()) { storage.slots.push_back({Py_tp_methods, storage.methods.Finish()}); }
    storage.slots.push_back({0, nullptr});
    storage.spec.name = storage.name.c_str();
    storage.spec.basicsize = static_cast<int>(NativeLayout<T>::kInstanceSize);
    storage.spec.itemsize = 0;
    storage.spec.flags = Py_TPFLAGS_DEFAULT;
    storage.spec.slots = storage.slots.data();

    TypedPythonObject<shape::Type> type =
        detail::MaterializeType(storage_, module_ ? &*module_ : nullptr, attrName_);
    finalized_ = true;
    if (NativeTypeRegistry<T>::type != nullptr) { Py_DECREF(NativeTypeRegistry<T>::type); }
    NativeTypeRegistry<T>::type = reinterpret_cast<PyTypeObject*>(type.Object().NewReference());
    NativeTypeRegistry<T>::name = storage.name;
    return type;
  }

 private:
  friend class ModuleBuilder;

  TypeBuilder(std::string name, std::string doc, TypedPythonObject<shape::Module> module, std::string attrName)
      : TypeBuilder(std::move(name), std::move(doc)) {
    module_ = std::move(module);
    attrName_ = std::move(attrName);
  }

  static PyObject* tpNew(PyTypeObject* type, PyObject* /*args*/, PyObject* /*kwds*/) noexcept {
    PyObject* self = type->tp_alloc(type, 0);
    if (self == nullptr) { return nullptr; }
    try {
      ::new (NativeLayout<T>::PayloadStorage(self)) T();
    } catch (const std::exception& error) {
      // Payload never existed: free the memory without running tp_dealloc.
      type->tp_free(self);
      Py_DECREF(type);
      bridge::SetErrorFromException(error);
      return nullptr;
    } catch (...) {
      type->tp_free(self);
      Py_DECREF(type);
      bridge::SetError("unknown native exception", PyExc_SystemError);
      return nullptr;
    }
    return self;
  }

  static int tpInit(PyObject* self, PyObject* args, PyObject* kwds) noexcept {
    const Py_ssize_t given = (args != nullptr ? PyTuple_GET_SIZE(args) : 0) + (kwds != nullptr ? PyDict_GET_SIZE(kwds) : 0);
    if (given != 0) {
      PyErr_Format(PyExc_ValueError, "%s() takes no arguments (%zd given)", detail::ShortTypeName(Py_TYPE(self)), given);
      return -1;
    }
    try {
      NativeLayout<T>::Payload(self) = T();
    } catch (const std::exception& error) {
      bridge::SetErrorFromException(error);
      return -1;
    } catch (...) {
      bridge::SetError("unknown native exception", PyExc_SystemError);
      return -1;
    }
    return 0;
  }

  static void tpDealloc(PyObject* self) noexcept {
    PyTypeObject* type = Py_TYPE(self);
    NativeLayout<T>::Payload(self).~T();
    type->tp_free(self);
    Py_DECREF(type);
  }

  static PyObject* tpRepr(PyObject* self) noexcept {
    try {
      const std::string text = NativeLayout<T>::Payload(self).Repr();
      return PyUnicode_FromStringAndSize(text.data(), static_cast<Py_ssize_t>(text.size()));
    } catch (const std::exception& error) {
      bridge::SetErrorFromException(error);
      return nullptr;
    } catch (...) {
      bridge::SetError("unknown native exception", PyExc_SystemError);
      return nullptr;
    }
  }

  std::shared_ptr<detail::TypeStorage> storage_;
  std::optional<TypedPythonObject<shape::Module>> module_{};
  std::string attrName_{};
  bool finalized_{false};
};

}  // namespace pyhost::bindings
