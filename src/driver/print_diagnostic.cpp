/***
 * Name: pytgen::driver::PrintDiagnostic
 * Purpose: Render a ParseError with its source line and a caret.
 */
#include "pytgen/driver/app.h"

#include <sstream>
#include <string>
#include <string_view>

namespace pytgen::driver {

// ANSI fragments
static constexpr std::string_view kRed = "\033[31m";
static constexpr std::string_view kBold = "\033[1m";
static constexpr std::string_view kReset = "\033[0m";

static void PrintHeader(const exceptions::ParseError& error, const bool color, std::ostream& err) {
  if (error.file().empty()) { return; }
  if (color) { err << kBold; }
  err << error.file() << ':' << error.line() << ':' << error.column() << ": ";
  if (color) { err << kReset; }
}

static void PrintLabel(const bool color, std::ostream& err) {
  if (color) {
    err << kRed << "error: " << kReset;
  } else {
    err << "error: ";
  }
}

static void PrintSourceWithCaret(const exceptions::ParseError& error, const std::string& source, std::ostream& err) {
  if (error.line() <= 0 || error.column() <= 0) { return; }
  std::istringstream input(source);
  std::string lineStr;
  int curLine = 0;
  while (curLine < error.line() && std::getline(input, lineStr)) { ++curLine; }
  if (curLine != error.line()) { return; }
  if (!lineStr.empty() && lineStr.back() == '\r') { lineStr.pop_back(); }
  err << "  " << lineStr << '\n' << "  ";
  for (int i = 1; i < error.column(); ++i) { err << ' '; }
  err << "^\n";
}

auto PrintDiagnostic(const exceptions::ParseError& error, const std::string& source, const bool color,
                     std::ostream& err) -> void {
  PrintHeader(error, color, err);
  PrintLabel(color, err);
  err << error.detail() << '\n';
  PrintSourceWithCaret(error, source, err);
}

}  // namespace pytgen::driver
