/***
 * Name: pyhost::exceptions::PyhostException::PyhostException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "pyhost/exceptions/pyhost_exception.h"

#include <string>
#include <utility>

namespace pyhost {
namespace exceptions {

PyhostException::PyhostException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pyhost
