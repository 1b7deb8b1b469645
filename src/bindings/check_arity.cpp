/***
 * Name: pyhost::bindings::CheckArity
 * Purpose: Validate the positional argument count of a wrapped call.
 * Inputs:
 *   - args: the METH_VARARGS tuple (null counts as empty)
 *   - expected: required number of arguments
 *   - function: name used in the message
 * Outputs: Returns normally, or throws ArityError (surfaces as TypeError)
 */
#include "pyhost/bindings/function_wrapper.h"

#include <cstddef>
#include <string>
#include <string_view>

#include "pyhost/exceptions/arity_error.h"

namespace pyhost::bindings {

void CheckArity(const PythonObject& args, std::size_t expected, std::string_view function) {
  const std::size_t given =
      args.IsNull() || PyTuple_Check(args.Get()) == 0 ? 0 : static_cast<std::size_t>(PyTuple_GET_SIZE(args.Get()));
  if (given == expected) { return; }
  throw exceptions::ArityError(std::string(function) + "() takes exactly " + std::to_string(expected) +
                               " arguments (" + std::to_string(given) + " given)");
}

}  // namespace pyhost::bindings
