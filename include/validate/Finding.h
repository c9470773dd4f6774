/***
 * Name: pytgen::validate (findings)
 * Purpose: Value types returned by the CodeValidator.
 * Inputs: N/A (declarations only)
 * Outputs: Severity, Finding, ValidationVerdict
 * Theory of Operation: Findings are data, never thrown. The verdict is valid
 *   exactly when no ERROR finding was produced.
 */
#pragma once

#include <string>
#include <vector>

namespace pytgen::validate {

enum class Severity { Warning, Error };

// "WARNING" / "ERROR"
const char* to_string(Severity severity);

struct Finding {
  Severity severity{Severity::Error};
  std::string message;

  bool operator==(const Finding&) const = default;
};

struct ValidationVerdict {
  bool isValid{true};
  std::vector<Finding> findings; // check execution order

  [[nodiscard]] std::size_t errorCount() const;
  [[nodiscard]] std::size_t warningCount() const;

  bool operator==(const ValidationVerdict&) const = default;
};

} // namespace pytgen::validate
