#include "validate/Finding.h"

#include <algorithm>

namespace pytgen::validate {

const char* to_string(const Severity severity) {
  switch (severity) {
    case Severity::Warning: return "WARNING";
    case Severity::Error: return "ERROR";
  }
  return "ERROR";
}

std::size_t ValidationVerdict::errorCount() const {
  return static_cast<std::size_t>(std::count_if(findings.begin(), findings.end(),
                                                [](const Finding& f) { return f.severity == Severity::Error; }));
}

std::size_t ValidationVerdict::warningCount() const { return findings.size() - errorCount(); }

} // namespace pytgen::validate
