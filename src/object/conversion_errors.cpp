/***
 * Name: pyhost::detail::ThrowConversionMismatch / ThrowIntegerOverflow
 * Purpose: Failure paths of Converter<T>::FromPython.
 * Inputs:
 *   - expected: Python type name the converter accepts
 *   - actual: the rejected object
 *   - target: host integer category that overflowed
 */
#include <string>

#include "pyhost/exceptions/python_error.h"
#include "pyhost/exceptions/type_mismatch_error.h"
#include "pyhost/object/python_object.h"

namespace pyhost::detail {

void ThrowConversionMismatch(const char* expected, const PythonObject& actual) {
  throw exceptions::TypeMismatchError(std::string("expected '") + expected + "' but received '" +
                                      actual.TypeName() + "'");
}

void ThrowIntegerOverflow(const char* target) {
  throw exceptions::PythonError(std::string("Python int too large to convert to ") + target);
}

}  // namespace pyhost::detail
