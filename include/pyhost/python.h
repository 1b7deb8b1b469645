/***
 * Name: pyhost::python
 * Purpose: Entry points into the interpreter that are not operations on an
 *   existing object: importing, evaluating source, sys.path, builtins and
 *   type queries.
 * Inputs: Module names, source text, objects
 * Outputs: PythonObject / TypedPythonObject handles; PythonError on failure
 * Theory of Operation: Each call starts the interpreter on first use through
 *   runtime::Interpreter::Require() and must run with the GIL held.
 */
#pragma once

#include "pyhost/runtime/python_api.h"

#include <string_view>

#include "pyhost/object/python_object.h"
#include "pyhost/object/typed_python_object.h"

namespace pyhost::python {

enum class EvalMode {
  Expression,  // eval(): returns the expression's value
  File,        // exec(): returns the namespace dict the code ran in
};

TypedPythonObject<shape::Module> ImportModule(std::string_view name);

// Runs `code` in a fresh namespace that sees the builtins.
PythonObject Evaluate(std::string_view code, EvalMode mode = EvalMode::Expression);

void AddToPath(std::string_view directory);

TypedPythonObject<shape::Module> Builtins();

TypedPythonObject<shape::Type> Type(const PythonObject& object);

// Exact type identity (no subclasses).
bool IsType(const PythonObject& object, const TypedPythonObject<shape::Type>& type);

// isinstance(object, type)
bool IsInstance(const PythonObject& object, const TypedPythonObject<shape::Type>& type);

}  // namespace pyhost::python
