/***
 * Name: pytgen::exceptions::ParseError
 * Purpose: Exception for lexing and parsing failures.
 * Inputs: Source identifier, 1-based line and column, short description
 * Outputs: Exception object; what() reads "file:line:col: detail"
 * Theory of Operation: Keeps the location parts separately so callers can
 *   render their own message (extractor, validator, CLI caret printer).
 */
#pragma once

#include <string>

#include "pytgen/exceptions/pytgen_exception.h"

namespace pytgen {
namespace exceptions {

class ParseError : public PytgenException {
 public:
  ParseError(std::string file, int line, int col, std::string detail);

  const std::string& file() const noexcept { return file_; }
  int line() const noexcept { return line_; }
  int column() const noexcept { return col_; }
  const std::string& detail() const noexcept { return detail_; }

 private:
  std::string file_;
  int line_{0};
  int col_{0};
  std::string detail_;
};

}  // namespace exceptions
}  // namespace pytgen
