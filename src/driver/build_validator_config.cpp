/***
 * Name: pytgen::driver::BuildValidatorConfig
 * Purpose: Map CLI table options onto ValidatorConfig::Defaults().
 * Theory of Operation: --framework, --assert-pattern, --mock-pattern and
 *   --callable-type replace their default tables; --dangerous-call extends
 *   the code execution table; --test-prefix keeps the last value given.
 */
#include "pytgen/driver/app.h"

namespace pytgen::driver {

auto BuildValidatorConfig(const CliOptions& opts) -> validate::ValidatorConfig {
  auto cfg = validate::ValidatorConfig::Defaults();
  if (!opts.test_prefix.empty()) cfg.testPrefix = opts.test_prefix.back();
  cfg.namingIncludesNested = opts.include_nested_tests;
  if (!opts.frameworks.empty()) cfg.frameworkNames = opts.frameworks;
  if (!opts.assert_patterns.empty()) cfg.assertionPatterns = opts.assert_patterns;
  if (!opts.mock_patterns.empty()) cfg.mockPatterns = opts.mock_patterns;
  if (!opts.callable_types.empty()) cfg.callableTypeNames = opts.callable_types;
  cfg.codeExecCalls.insert(cfg.codeExecCalls.end(), opts.dangerous_calls.begin(), opts.dangerous_calls.end());
  if (!opts.input.empty()) cfg.sourceIdentifier = opts.input;
  return cfg;
}

}  // namespace pytgen::driver
