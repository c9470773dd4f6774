/***
 * Name: pytgen::extract::SourceExtractor
 * Purpose: Produce function and class signatures for a Python module.
 * Inputs:
 *   - source text plus an identifier used only in error messages, or
 *   - an already parsed module
 * Outputs:
 *   - AnalysisResult; ParseError when the text does not parse
 * Theory of Operation:
 *   A ParentMap is built over the tree, then every node is visited breadth
 *   first. A def whose direct parent is a class is left to that class's
 *   direct-body method scan; every other def is a function. Classes at any
 *   depth are reported, each with its own methods.
 */
#pragma once

#include <string>

#include "ast/Module.h"
#include "extract/Signatures.h"
#include "pytgen/exceptions/parse_error.h"

namespace pytgen::extract {

class SourceExtractor {
 public:
  [[nodiscard]] AnalysisResult extract(const std::string& sourceText, const std::string& identifier) const;
  [[nodiscard]] AnalysisResult extract(const ast::Module& module) const;
};

// "Syntax error in <file> at line <n>: <detail>"
std::string FormatSyntaxError(const exceptions::ParseError& err);

} // namespace pytgen::extract
