/***
 * Name: pytgen::extract::CleanDocstring
 * Purpose: inspect.cleandoc-style indentation normalization.
 */
#include "extract/Docstring.h"

#include <cstddef>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace pytgen::extract {

namespace {

std::string expandTabs(const std::string& text) {
  std::string out;
  size_t column = 0;
  for (const char c : text) {
    if (c == '\t') {
      const size_t pad = 8 - (column % 8);
      out.append(pad, ' ');
      column += pad;
    } else {
      out += c;
      column = (c == '\n') ? 0 : column + 1;
    }
  }
  return out;
}

bool isBlank(const std::string& s) { return s.find_first_not_of(" \t\r\f\v") == std::string::npos; }

std::string lstrip(const std::string& s) {
  const size_t at = s.find_first_not_of(" \t\r\f\v");
  return at == std::string::npos ? std::string{} : s.substr(at);
}

} // namespace

std::string CleanDocstring(const std::string& doc) {
  std::vector<std::string> lines;
  std::istringstream in(expandTabs(doc));
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  if (!doc.empty() && doc.back() == '\n') lines.emplace_back();
  if (lines.empty()) return {};

  size_t margin = std::numeric_limits<size_t>::max();
  for (size_t i = 1; i < lines.size(); ++i) {
    const size_t content = lines[i].find_first_not_of(' ');
    if (content != std::string::npos && content < margin) margin = content;
  }
  lines[0] = lstrip(lines[0]);
  if (margin != std::numeric_limits<size_t>::max()) {
    for (size_t i = 1; i < lines.size(); ++i) lines[i] = lines[i].size() > margin ? lines[i].substr(margin) : lstrip(lines[i]);
  }
  size_t first = 0;
  size_t last = lines.size();
  while (first < last && isBlank(lines[first])) ++first;
  while (last > first && isBlank(lines[last - 1])) --last;

  std::string out;
  for (size_t i = first; i < last; ++i) {
    if (i != first) out += '\n';
    out += lines[i];
  }
  return out;
}

} // namespace pytgen::extract
