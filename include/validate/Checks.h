/***
 * Name: pytgen::validate::detail (check battery)
 * Purpose: The seven validation checks as independent functions.
 * Inputs: CheckInput (candidate, parsed tree or null, context, tables)
 * Outputs: findings appended to the caller's list
 * Theory of Operation: kChecks fixes the execution order; adding a check
 *   means appending a function here.
 */
#pragma once

#include <array>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "ast/Expr.h"
#include "ast/Module.h"
#include "extract/Signatures.h"
#include "pytgen/exceptions/parse_error.h"
#include "validate/Finding.h"
#include "validate/ModuleResolver.h"
#include "validate/ValidatorConfig.h"

namespace pytgen::validate::detail {

struct CompiledTextualPattern {
  std::regex regex;
  Severity severity{Severity::Error};
  std::string message;
};

struct CompiledPatterns {
  std::vector<CompiledTextualPattern> textual;
  std::vector<std::regex> assertions;
  std::vector<std::regex> mocks;
};

// Throws exceptions::ConfigError naming the offending pattern.
CompiledPatterns CompilePatterns(const ValidatorConfig& config);

struct CheckInput {
  const std::string& candidate;
  const std::string& searchText; // candidate after CollapseWhitespaceRuns, for the regex checks
  const ast::Module* module; // null when the candidate did not parse
  const std::optional<exceptions::ParseError>& parseError;
  const std::optional<extract::CallableSignature>& context;
  const ValidatorConfig& config;
  const CompiledPatterns& patterns;
  const ModuleResolver& resolver;
};

using Check = void (*)(const CheckInput&, std::vector<Finding>&);

void CheckSyntax(const CheckInput& in, std::vector<Finding>& out);
void CheckForbiddenConstructs(const CheckInput& in, std::vector<Finding>& out);
void CheckFrameworkReference(const CheckInput& in, std::vector<Finding>& out);
void CheckTestNaming(const CheckInput& in, std::vector<Finding>& out);
void CheckAssertions(const CheckInput& in, std::vector<Finding>& out);
void CheckMockUsage(const CheckInput& in, std::vector<Finding>& out);
void CheckDependencies(const CheckInput& in, std::vector<Finding>& out);

inline constexpr std::array<Check, 7> kChecks{
    &CheckSyntax,      &CheckForbiddenConstructs, &CheckFrameworkReference, &CheckTestNaming,
    &CheckAssertions,  &CheckMockUsage,           &CheckDependencies,
};

// Every whitespace run becomes one character ('\n' if the run had one).
std::string CollapseWhitespaceRuns(const std::string& text);

// "<detail> (<identifier>, line <n>)", the wording Python gives str(SyntaxError).
std::string DescribeParseError(const exceptions::ParseError& err);

// Dotted text of a Name/Attribute chain ("os.system"); empty for anything else.
std::string DottedName(const ast::Expr& expr);

} // namespace pytgen::validate::detail
