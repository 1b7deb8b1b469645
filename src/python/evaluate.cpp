/***
 * Name: pyhost::python::Evaluate
 * Purpose: Run Python source text from the host.
 * Inputs:
 *   - code: source text
 *   - mode: Expression (eval) or File (exec of a statement block)
 * Outputs: Expression value, or the namespace dict after exec
 * Theory of Operation: Every call gets its own globals dict holding
 *   __builtins__ and __name__, so definitions made by one Evaluate() never
 *   leak into another.
 */
#include "pyhost/python.h"

#include <string>
#include <string_view>

#include "pyhost/object/checked.h"
#include "pyhost/runtime/interpreter.h"

namespace pyhost::python {

PythonObject Evaluate(std::string_view code, EvalMode mode) {
  runtime::Interpreter::Require();
  const std::string source(code);
  PythonObject globals = PythonObject::Dict();
  globals.SetItem(PythonObject("__builtins__"), Builtins());
  globals.SetItem(PythonObject("__name__"), PythonObject("__pyhost__"));
  const int start = mode == EvalMode::Expression ? Py_eval_input : Py_file_input;
  PythonObject result =
      detail::Checked(PyRun_String(source.c_str(), start, globals.Get(), globals.Get()), "PyRun_String");
  if (mode == EvalMode::File) { return globals; }
  return result;
}

}  // namespace pyhost::python
