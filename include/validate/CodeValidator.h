/***
 * Name: pytgen::validate::CodeValidator
 * Purpose: Run the fixed check battery over a candidate test snippet.
 * Inputs:
 *   - config: name and pattern tables (regexes compiled here)
 *   - resolver: module oracle used by the dependency check
 *   - candidate text and an optional signature of the function under test
 * Outputs:
 *   - ValidationVerdict; construction throws ConfigError on a bad regex
 * Theory of Operation:
 *   The candidate is parsed once. Each check in detail::kChecks then runs in
 *   order against the same input and appends its findings; nothing
 *   short-circuits. Checks that need a tree see a null module after a parse
 *   failure and stay silent, except the dependency check which reports it.
 *   A validator is immutable after construction and safe to share.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "extract/Signatures.h"
#include "validate/Checks.h"
#include "validate/Finding.h"
#include "validate/ModuleResolver.h"
#include "validate/ValidatorConfig.h"

namespace pytgen::validate {

class CodeValidator {
 public:
  CodeValidator(ValidatorConfig config, std::shared_ptr<const ModuleResolver> resolver);

  [[nodiscard]] ValidationVerdict validate(
      const std::string& candidate,
      const std::optional<extract::CallableSignature>& context = std::nullopt) const;

  [[nodiscard]] const ValidatorConfig& config() const { return config_; }

 private:
  ValidatorConfig config_;
  detail::CompiledPatterns patterns_;
  std::shared_ptr<const ModuleResolver> resolver_;
};

} // namespace pytgen::validate
