/***
 * Name: pytgen::stages::Validator
 * Purpose: Stage class for candidate cleaning and validation.
 * Inputs: Candidate text, a configured CodeValidator, optional context
 * Outputs: Cleaned text / ValidationVerdict
 * Theory of Operation: Times the Clean and Validate phases and records
 *   error and warning counters.
 */
#pragma once

#include <optional>
#include <string>

#include "extract/Signatures.h"
#include "pytgen/metrics/metrics.h"
#include "validate/CodeValidator.h"

namespace pytgen {
namespace stages {

class Validator : public metrics::Metrics {
 public:
  static std::string Clean(const std::string& raw);

  static validate::ValidationVerdict Run(const validate::CodeValidator& validator, const std::string& candidate,
                                         const std::optional<extract::CallableSignature>& context);
};

}  // namespace stages
}  // namespace pytgen
