/***
 * Name: pytgen::exceptions::PytgenException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "pytgen/exceptions/pytgen_exception.h"

namespace pytgen::exceptions {

const char* PytgenException::what() const noexcept { return message_.c_str(); }

}  // namespace pytgen::exceptions
