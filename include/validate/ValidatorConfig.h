/***
 * Name: pytgen::validate::ValidatorConfig
 * Purpose: Name and pattern tables that drive the check battery.
 * Inputs: Defaults() or caller-supplied tables (CLI flags)
 * Outputs: Plain configuration struct consumed by CodeValidator
 * Theory of Operation:
 *   Every literal a check compares against lives here so the validator can be
 *   retargeted to another testing ecosystem without code changes. Regex
 *   strings use ECMAScript syntax and are compiled once when a CodeValidator
 *   is constructed; a malformed one raises ConfigError there.
 */
#pragma once

#include <string>
#include <vector>

#include "validate/Finding.h"

namespace pytgen::validate {

// One regex searched anywhere in the raw candidate text.
struct TextualPattern {
  std::string pattern;
  Severity severity{Severity::Error};
  std::string message;
};

struct ValidatorConfig {
  std::string testPrefix;
  bool namingIncludesNested{false};
  std::vector<std::string> frameworkNames;     // substrings, any one suffices
  std::vector<std::string> assertionPatterns;  // regexes
  std::vector<std::string> mockPatterns;       // regexes
  std::vector<std::string> callableTypeNames;  // annotation heads that need mocks
  std::vector<std::string> codeExecCalls;
  std::vector<std::string> commandExecCalls;
  std::vector<std::string> dynamicImportCalls;
  std::vector<std::string> fileOpenCalls;
  std::vector<std::string> riskyImports;
  std::vector<TextualPattern> textualPatterns;
  std::string sourceIdentifier{"<candidate>"};

  static ValidatorConfig Defaults();
};

} // namespace pytgen::validate
