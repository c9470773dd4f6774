/***
 * Name: pytgen::validate::CleanCandidate
 * Purpose: Unwrap fenced code and drop reasoning spans from generated text.
 */
#include "validate/CleanCandidate.h"

#include <string>

namespace pytgen::validate {

namespace {

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n\f\v");
  return s.substr(first, last - first + 1);
}

} // namespace

std::string CleanCandidate(const std::string& raw) {
  std::string text = trim(raw);
  const std::string fence = "```";
  if (text.size() >= 2 * fence.size() && text.compare(0, fence.size(), fence) == 0 &&
      text.compare(text.size() - fence.size(), fence.size(), fence) == 0) {
    const auto firstNewline = text.find('\n');
    if (firstNewline == std::string::npos || firstNewline >= text.size() - fence.size()) {
      text.clear();
    } else {
      text = text.substr(firstNewline + 1, text.size() - fence.size() - firstNewline - 1);
    }
  }
  const std::string openTag = "<think>";
  const std::string closeTag = "</think>";
  const auto open = text.find(openTag);
  if (open != std::string::npos) {
    const auto close = text.find(closeTag, open);
    if (close != std::string::npos) text.erase(open, close + closeTag.size() - open);
  }
  return trim(text);
}

} // namespace pytgen::validate
