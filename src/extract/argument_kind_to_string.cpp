#include "extract/Signatures.h"

namespace pytgen::extract {

const char* to_string(const ArgumentKind kind) {
  switch (kind) {
    case ArgumentKind::Positional: return "POSITIONAL";
    case ArgumentKind::VariadicPositional: return "VARIADIC_POSITIONAL";
    case ArgumentKind::KeywordOnly: return "KEYWORD_ONLY";
    case ArgumentKind::VariadicKeyword: return "VARIADIC_KEYWORD";
  }
  return "UNKNOWN";
}

} // namespace pytgen::extract
