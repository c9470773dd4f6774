/***
 * Name: pytgen::exceptions::PytgenException::PytgenException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "pytgen/exceptions/pytgen_exception.h"

#include <utility>

namespace pytgen {
namespace exceptions {

PytgenException::PytgenException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pytgen
