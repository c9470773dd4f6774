#include "report/Report.h"

#include "pytgen/support/json.h"

#include <cstddef>

namespace pytgen::report {

void WriteVerdictJson(const validate::ValidationVerdict& verdict, std::ostream& out) {
  out << "{\n  \"is_valid\": " << (verdict.isValid ? "true" : "false") << ",\n  \"findings\": [";
  for (std::size_t i = 0; i < verdict.findings.size(); ++i) {
    const auto& f = verdict.findings[i];
    out << (i != 0U ? "," : "") << "\n    {\"severity\": \"" << validate::to_string(f.severity)
        << "\", \"message\": \"" << support::JsonEscape(f.message) << "\"}";
  }
  out << (verdict.findings.empty() ? "]" : "\n  ]") << "\n}\n";
}

void WriteVerdictText(const validate::ValidationVerdict& verdict, std::ostream& out) {
  for (const auto& f : verdict.findings) {
    out << (f.severity == validate::Severity::Error ? "error: " : "warning: ") << f.message << '\n';
  }
  out << (verdict.isValid ? "valid" : "invalid") << " (" << verdict.errorCount() << " error(s), "
      << verdict.warningCount() << " warning(s))\n";
}

std::string FormatRejectEntry(const validate::ValidationVerdict& verdict, const std::string& code) {
  std::string messages;
  for (std::size_t i = 0; i < verdict.findings.size(); ++i) {
    if (i != 0U) messages += '\n';
    messages += verdict.findings[i].message;
  }
  return "\n" + std::string(40, '=') + "\nValidation Errors:\n" + messages + "\nTest Code:\n" + code + "\n";
}

} // namespace pytgen::report
