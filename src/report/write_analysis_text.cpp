#include "report/Report.h"

#include "extract/Docstring.h"

#include <sstream>

namespace pytgen::report {

namespace {

void writeDocstring(const std::optional<std::string>& doc, const std::string& indent, std::ostream& out) {
  if (!doc) return;
  std::istringstream lines(extract::CleanDocstring(*doc));
  std::string line;
  while (std::getline(lines, line)) out << indent << line << '\n';
}

void writeCallable(const extract::CallableSignature& sig, const std::string& indent, std::ostream& out) {
  out << indent << (sig.isAsync ? "async def " : "def ") << FormatSignature(sig) << "  [lines " << sig.startLine << '-' << sig.endLine
      << "]\n";
  writeDocstring(sig.docstring, indent + "    ", out);
}

} // namespace

void WriteAnalysisText(const extract::AnalysisResult& result, std::ostream& out) {
  for (const auto& fn : result.functions) writeCallable(fn, "", out);
  for (const auto& cls : result.classes) {
    out << "class " << cls.name;
    if (!cls.baseNames.empty()) {
      out << '(';
      for (std::size_t i = 0; i < cls.baseNames.size(); ++i) out << (i != 0U ? ", " : "") << cls.baseNames[i];
      out << ')';
    }
    out << "  [lines " << cls.startLine << '-' << cls.endLine << "]\n";
    writeDocstring(cls.docstring, "    ", out);
    for (const auto& m : cls.methods) writeCallable(m, "    ", out);
  }
  out << result.functions.size() << " function(s), " << result.classes.size() << " class(es)\n";
}

} // namespace pytgen::report
