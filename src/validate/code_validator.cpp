/***
 * Name: pytgen::validate::CodeValidator
 * Purpose: Parse the candidate once and run every check in order.
 */
#include "validate/CodeValidator.h"

#include "parser/ParseSource.h"

#include <memory>
#include <utility>

namespace pytgen::validate {

CodeValidator::CodeValidator(ValidatorConfig config, std::shared_ptr<const ModuleResolver> resolver)
    : config_(std::move(config)), patterns_(detail::CompilePatterns(config_)), resolver_(std::move(resolver)) {
  if (!resolver_) {
    resolver_ = std::make_shared<StaticModuleResolver>(DefaultModuleNames(config_.frameworkNames));
  }
}

ValidationVerdict CodeValidator::validate(const std::string& candidate,
                                          const std::optional<extract::CallableSignature>& context) const {
  std::unique_ptr<ast::Module> module;
  std::optional<exceptions::ParseError> parseError;
  try {
    module = parse::ParseSource(candidate, config_.sourceIdentifier);
  } catch (const exceptions::ParseError& e) {
    parseError = e;
  }

  const std::string searchText = detail::CollapseWhitespaceRuns(candidate);
  const detail::CheckInput input{candidate,  searchText, module.get(), parseError,
                                 context,    config_,    patterns_,    *resolver_};
  ValidationVerdict verdict;
  for (const detail::Check check : detail::kChecks) {
    check(input, verdict.findings);
  }
  verdict.isValid = verdict.errorCount() == 0;
  return verdict;
}

} // namespace pytgen::validate
