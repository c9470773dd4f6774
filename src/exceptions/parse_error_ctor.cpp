/***
 * Name: pytgen::exceptions::ParseError::ParseError
 * Purpose: Construct a located parse error.
 * Inputs:
 *   - file: source identifier (may be empty)
 *   - line, col: 1-based position of the offending token
 *   - detail: short description without location
 * Outputs: Exception whose what() is "file:line:col: detail"
 */
#include "pytgen/exceptions/parse_error.h"

#include <string>
#include <utility>

namespace pytgen::exceptions {

ParseError::ParseError(std::string file, int line, int col, std::string detail)
    : PytgenException(file + ":" + std::to_string(line) + ":" + std::to_string(col) + ": " + detail),
      file_(std::move(file)),
      line_(line),
      col_(col),
      detail_(std::move(detail)) {}

}  // namespace pytgen::exceptions
