/***
 * Name: pytgen::report::WriteAnalysisJson
 * Purpose: Serialize an AnalysisResult as a JSON document.
 * Theory of Operation: Hand-written writer in the style of the metrics JSON
 *   printer; two-space indentation, optional fields as null.
 */
#include "report/Report.h"

#include "pytgen/support/json.h"

#include <cstddef>

namespace pytgen::report {

namespace {

void writeString(const std::string& s, std::ostream& out) { out << '"' << support::JsonEscape(s) << '"'; }

void writeOptional(const std::optional<std::string>& s, std::ostream& out) {
  if (s) writeString(*s, out);
  else out << "null";
}

void writeCallable(const extract::CallableSignature& sig, const std::string& indent, std::ostream& out) {
  out << "{\n" << indent << "  \"name\": ";
  writeString(sig.name, out);
  out << ",\n" << indent << "  \"arguments\": [";
  for (std::size_t i = 0; i < sig.arguments.size(); ++i) {
    const auto& a = sig.arguments[i];
    out << (i != 0U ? "," : "") << "\n" << indent << "    {\"name\": ";
    writeString(a.name, out);
    out << ", \"type_annotation\": ";
    writeOptional(a.typeAnnotation, out);
    out << ", \"kind\": \"" << extract::to_string(a.kind) << "\"}";
  }
  out << (sig.arguments.empty() ? "]" : "\n" + indent + "  ]");
  out << ",\n" << indent << "  \"return_type\": ";
  writeOptional(sig.returnType, out);
  out << ",\n" << indent << "  \"docstring\": ";
  writeOptional(sig.docstring, out);
  out << ",\n" << indent << "  \"start_line\": " << sig.startLine;
  out << ",\n" << indent << "  \"end_line\": " << sig.endLine;
  out << ",\n" << indent << "  \"is_async\": " << (sig.isAsync ? "true" : "false");
  out << "\n" << indent << "}";
}

template <typename T, typename Fn>
void writeArray(const std::vector<T>& items, const std::string& indent, std::ostream& out, Fn&& each) {
  if (items.empty()) {
    out << "[]";
    return;
  }
  out << "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    out << (i != 0U ? ",\n" : "\n") << indent << "  ";
    each(items[i], indent + "  ");
  }
  out << "\n" << indent << "]";
}

} // namespace

void WriteAnalysisJson(const extract::AnalysisResult& result, std::ostream& out) {
  out << "{\n  \"functions\": ";
  writeArray(result.functions, "  ", out,
             [&](const extract::CallableSignature& fn, const std::string& ind) { writeCallable(fn, ind, out); });
  out << ",\n  \"classes\": ";
  writeArray(result.classes, "  ", out, [&](const extract::ClassSignature& cls, const std::string& ind) {
    out << "{\n" << ind << "  \"name\": ";
    writeString(cls.name, out);
    out << ",\n" << ind << "  \"base_names\": [";
    for (std::size_t i = 0; i < cls.baseNames.size(); ++i) {
      out << (i != 0U ? ", " : "");
      writeString(cls.baseNames[i], out);
    }
    out << "],\n" << ind << "  \"docstring\": ";
    writeOptional(cls.docstring, out);
    out << ",\n" << ind << "  \"methods\": ";
    writeArray(cls.methods, ind + "  ", out,
               [&](const extract::CallableSignature& m, const std::string& mind) { writeCallable(m, mind, out); });
    out << ",\n" << ind << "  \"start_line\": " << cls.startLine;
    out << ",\n" << ind << "  \"end_line\": " << cls.endLine;
    out << "\n" << ind << "}";
  });
  out << "\n}\n";
}

} // namespace pytgen::report
