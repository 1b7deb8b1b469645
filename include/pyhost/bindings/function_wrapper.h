/***
 * Name: pyhost::bindings (function boundary wrappers)
 * Purpose: Adapt native functions to CPython's PyCFunction calling convention.
 * Inputs: A native function chosen at compile time (non-type template argument)
 * Outputs: A PyCFunction trampoline usable with METH_VARARGS
 * Theory of Operation:
 *   - WrapPlain<Fn>: Fn is noexcept. The trampoline adds nothing around the
 *     call: no lock handling, no exception handling.
 *   - WrapFailing<Fn>: takes the GIL state for the duration of the call and
 *     turns any exception escaping Fn into the Python error indicator before
 *     returning nullptr. The lock is given back on every exit path.
 *   - WrapMethod<T, Fn>: failing flavor whose first argument is the native
 *     payload T& of self (a free function or a member function of T).
 *   self and args are borrowed. They are wrapped in handles for the call and
 *   released without a decrement on every path, so the reference counts seen
 *   by CPython are untouched. A null result handle is returned as None.
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include <cstddef>
#include <exception>
#include <functional>
#include <string_view>
#include <type_traits>

#include "pyhost/bindings/native_layout.h"
#include "pyhost/bridge/error_bridge.h"
#include "pyhost/object/python_object.h"
#include "pyhost/runtime/gil.h"

namespace pyhost::bindings {

namespace detail {

class BorrowedArgs {
 public:
  BorrowedArgs(PyObject* self, PyObject* args) noexcept
      : self_(PythonObject::FromOwned(self)), args_(PythonObject::FromOwned(args)) {}
  ~BorrowedArgs() {
    self_.Release();
    args_.Release();
  }
  BorrowedArgs(const BorrowedArgs&) = delete;
  BorrowedArgs& operator=(const BorrowedArgs&) = delete;

  const PythonObject& Self() const noexcept { return self_; }
  const PythonObject& Args() const noexcept { return args_; }

 private:
  PythonObject self_;
  PythonObject args_;
};

template <auto Fn>
PyObject* PlainTrampoline(PyObject* self, PyObject* args) noexcept {
  const BorrowedArgs borrowed(self, args);
  return std::invoke(Fn, borrowed.Self(), borrowed.Args()).IntoPython();
}

template <auto Fn>
PyObject* FailingTrampoline(PyObject* self, PyObject* args) noexcept {
  const runtime::ScopedGil gil;
  const BorrowedArgs borrowed(self, args);
  try {
    return std::invoke(Fn, borrowed.Self(), borrowed.Args()).IntoPython();
  } catch (const std::exception& error) {
    bridge::SetErrorFromException(error);
  } catch (...) {
    bridge::SetError("unknown native exception", PyExc_SystemError);
  }
  return nullptr;
}

template <class T, auto Fn>
PyObject* MethodTrampoline(PyObject* self, PyObject* args) noexcept {
  const runtime::ScopedGil gil;
  const BorrowedArgs borrowed(self, args);
  try {
    return std::invoke(Fn, NativeLayout<T>::Payload(self), borrowed.Args()).IntoPython();
  } catch (const std::exception& error) {
    bridge::SetErrorFromException(error);
  } catch (...) {
    bridge::SetError("unknown native exception", PyExc_SystemError);
  }
  return nullptr;
}

}  // namespace detail

template <auto Fn>
inline constexpr PyCFunction WrapPlain = [] {
  static_assert(std::is_nothrow_invocable_r_v<PythonObject, decltype(Fn), const PythonObject&, const PythonObject&>,
                "WrapPlain needs PythonObject(const PythonObject&, const PythonObject&) noexcept");
  return &detail::PlainTrampoline<Fn>;
}();

template <auto Fn>
inline constexpr PyCFunction WrapFailing = [] {
  static_assert(std::is_invocable_r_v<PythonObject, decltype(Fn), const PythonObject&, const PythonObject&>,
                "WrapFailing needs PythonObject(const PythonObject&, const PythonObject&)");
  return &detail::FailingTrampoline<Fn>;
}();

template <class T, auto Fn>
inline constexpr PyCFunction WrapMethod = [] {
  static_assert(std::is_invocable_r_v<PythonObject, decltype(Fn), T&, const PythonObject&>,
                "WrapMethod needs PythonObject(T&, const PythonObject&)");
  return &detail::MethodTrampoline<T, Fn>;
}();

// Throws ArityError("<fn>() takes exactly <n> arguments (<m> given)") unless
// the args tuple holds exactly `expected` items.
void CheckArity(const PythonObject& args, std::size_t expected, std::string_view function);

}  // namespace pyhost::bindings
