#include "report/Report.h"

namespace pytgen::report {

std::string FormatSignature(const extract::CallableSignature& sig) {
  using extract::ArgumentKind;
  std::string out = sig.name + "(";
  bool first = true;
  bool sawVarArg = false;
  for (const auto& arg : sig.arguments) {
    if (!first) out += ", ";
    first = false;
    switch (arg.kind) {
      case ArgumentKind::Positional: break;
      case ArgumentKind::VariadicPositional: out += "*"; sawVarArg = true; break;
      case ArgumentKind::KeywordOnly:
        if (!sawVarArg) { out += "*, "; sawVarArg = true; }
        break;
      case ArgumentKind::VariadicKeyword: out += "**"; break;
    }
    out += arg.name;
    if (arg.typeAnnotation) out += ": " + *arg.typeAnnotation;
  }
  out += ")";
  if (sig.returnType) out += " -> " + *sig.returnType;
  return out;
}

} // namespace pytgen::report
