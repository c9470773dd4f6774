/***
 * Name: pytgen::validate::detail::CollapseWhitespaceRuns
 * Purpose: Text the regex checks search.
 * Theory of Operation: std::regex recurses once per character a quantifier
 *   consumes, so a long whitespace run under `\s*` exhausts the stack. Each
 *   run shrinks to one character: '\n' when the run holds a newline, else
 *   its first character.
 */
#include "validate/Checks.h"

#include <cctype>

namespace pytgen::validate::detail {

std::string CollapseWhitespaceRuns(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (std::isspace(static_cast<unsigned char>(text[i])) == 0) {
      out += text[i++];
      continue;
    }
    const size_t start = i;
    bool newline = false;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) {
      newline = newline || text[i] == '\n';
      ++i;
    }
    out += newline ? '\n' : text[start];
  }
  return out;
}

} // namespace pytgen::validate::detail
