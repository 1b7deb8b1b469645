/***
 * Name: pyhost::PythonObject::Call / InvokeMethod
 * Purpose: Call the referenced object, and the named-method primitive every
 *   dunder-based operator goes through.
 * Inputs:
 *   - args: positional arguments (null handles become None)
 *   - kwargs: named arguments, packed into a dict with str keys
 * Outputs: The call's result as a new handle
 * Theory of Operation:
 *   A null result with the error indicator set is bridged into PythonError;
 *   a null result without one is reported as such instead of being ignored.
 */
#include "pyhost/object/python_object.h"

#include <string_view>
#include <vector>

#include "pyhost/bridge/error_bridge.h"
#include "pyhost/exceptions/python_error.h"
#include "pyhost/metrics/metrics.h"

namespace pyhost {

PythonObject PythonObject::Call(const std::vector<PythonObject>& args, const std::vector<Kwarg>& kwargs) const {
  metrics::Metrics::Increment(metrics::Metrics::Counter::DispatchCalls);
  const PythonObject positional = TupleFrom(args);
  PythonObject named;
  if (!kwargs.empty()) {
    named = Dict();
    for (const auto& kwarg : kwargs) { named.SetItem(PythonObject(kwarg.name), kwarg.value); }
  }
  PyObject* result = PyObject_Call(target(), positional.Get(), named.Get());
  if (result == nullptr) {
    if (PyErr_Occurred() != nullptr) { throw bridge::UnsafeGetError(); }
    throw exceptions::PythonError("call returned null without raising");
  }
  return FromOwned(result);
}

PythonObject PythonObject::Call(const std::vector<PythonObject>& args) const { return Call(args, {}); }

PythonObject PythonObject::InvokeMethod(std::string_view name, const std::vector<PythonObject>& args) const {
  metrics::Metrics::Increment(metrics::Metrics::Counter::DispatchMethods);
  return Attr(name).Call(args);
}

}  // namespace pyhost
