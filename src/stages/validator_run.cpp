#include "pytgen/stages/validator.h"

#include "validate/CleanCandidate.h"

namespace pytgen::stages {

auto Validator::Clean(const std::string& raw) -> std::string {
  const ScopedTimer timer(Phase::Clean);
  return validate::CleanCandidate(raw);
}

auto Validator::Run(const validate::CodeValidator& validator, const std::string& candidate,
                    const std::optional<extract::CallableSignature>& context) -> validate::ValidationVerdict {
  const ScopedTimer timer(Phase::Validate);
  auto verdict = validator.validate(candidate, context);
  RecordCounter("errors", verdict.errorCount());
  RecordCounter("warnings", verdict.warningCount());
  return verdict;
}

}  // namespace pytgen::stages
