/***
 * Name: pyhost::bridge::UnsafeGetError
 * Purpose: Convert the pending Python error into a PythonError value.
 * Inputs: Python error indicator (must be set)
 * Outputs: exceptions::PythonError whose message is str(exception)
 * Theory of Operation:
 *   Fetches and clears the indicator, renders the exception with PyObject_Str
 *   and drops every fetched reference. An exception whose __str__ itself
 *   fails is rendered as "<unprintable TYPE object>".
 */
#include "pyhost/bridge/error_bridge.h"

#include <cassert>
#include <cstddef>
#include <string>
#include <utility>

#include "pyhost/metrics/metrics.h"
#include "pyhost/support/debug_log.h"

namespace pyhost::bridge {

static std::string render_exception(PyObject* exc) {
  if (exc == nullptr) { return "unknown python error"; }
  PyObject* text = PyObject_Str(exc);
  if (text != nullptr) {
    Py_ssize_t len = 0;
    const char* data = PyUnicode_AsUTF8AndSize(text, &len);
    if (data != nullptr) {
      std::string out(data, static_cast<std::size_t>(len));
      Py_DECREF(text);
      return out;
    }
    Py_DECREF(text);
  }
  PyErr_Clear();
  return std::string("<unprintable ") + Py_TYPE(exc)->tp_name + " object>";
}

exceptions::PythonError UnsafeGetError() {
  assert(PyErr_Occurred() != nullptr && "UnsafeGetError requires a pending Python error");
#if PY_VERSION_HEX >= 0x030C0000
  PyObject* exc = PyErr_GetRaisedException();
  std::string message = render_exception(exc);
  Py_XDECREF(exc);
#else
  PyObject* type = nullptr;
  PyObject* value = nullptr;
  PyObject* traceback = nullptr;
  PyErr_Fetch(&type, &value, &traceback);
  PyErr_NormalizeException(&type, &value, &traceback);
  std::string message = render_exception(value != nullptr ? value : type);
  Py_XDECREF(type);
  Py_XDECREF(value);
  Py_XDECREF(traceback);
#endif
  metrics::Metrics::Increment(metrics::Metrics::Counter::BridgedErrors);
  PYHOST_DEBUG_LOG("bridged python error: %s", message.c_str());
  return exceptions::PythonError(std::move(message));
}

}  // namespace pyhost::bridge
