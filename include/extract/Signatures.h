/***
 * Name: pytgen::extract (signatures)
 * Purpose: Value types produced by the SourceExtractor.
 * Inputs: N/A (declarations only)
 * Outputs: ArgumentSpec, CallableSignature, ClassSignature, AnalysisResult
 * Theory of Operation: Plain aggregates compared member-wise so results of two
 *   extractions over the same text can be asserted equal.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pytgen::extract {

enum class ArgumentKind { Positional, VariadicPositional, KeywordOnly, VariadicKeyword };

// "POSITIONAL", "VARIADIC_POSITIONAL", "KEYWORD_ONLY", "VARIADIC_KEYWORD"
const char* to_string(ArgumentKind kind);

struct ArgumentSpec {
  std::string name;
  std::optional<std::string> typeAnnotation; // rendered annotation, absent if none
  ArgumentKind kind{ArgumentKind::Positional};

  bool operator==(const ArgumentSpec&) const = default;
};

// Positional*, VariadicPositional?, KeywordOnly*, VariadicKeyword?
struct CallableSignature {
  std::string name;
  std::vector<ArgumentSpec> arguments;
  std::optional<std::string> returnType;
  std::optional<std::string> docstring;
  int startLine{0};
  int endLine{0};
  bool isAsync{false};

  bool operator==(const CallableSignature&) const = default;
};

struct ClassSignature {
  std::string name;
  std::vector<std::string> baseNames; // rendered base expressions, keywords excluded
  std::optional<std::string> docstring;
  std::vector<CallableSignature> methods; // direct-body defs only
  int startLine{0};
  int endLine{0};

  bool operator==(const ClassSignature&) const = default;
};

// Both lists in breadth-first discovery order.
struct AnalysisResult {
  std::vector<CallableSignature> functions;
  std::vector<ClassSignature> classes;

  bool operator==(const AnalysisResult&) const = default;
};

} // namespace pytgen::extract
