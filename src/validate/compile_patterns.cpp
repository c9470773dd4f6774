#include "validate/Checks.h"

#include "pytgen/exceptions/config_error.h"

namespace pytgen::validate::detail {

namespace {

std::regex compileOne(const std::string& pattern) {
  try {
    return std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    throw exceptions::ConfigError("invalid pattern '" + pattern + "': " + e.what());
  }
}

} // namespace

CompiledPatterns CompilePatterns(const ValidatorConfig& config) {
  CompiledPatterns out;
  for (const auto& p : config.textualPatterns) {
    out.textual.push_back(CompiledTextualPattern{compileOne(p.pattern), p.severity, p.message});
  }
  for (const auto& p : config.assertionPatterns) out.assertions.push_back(compileOne(p));
  for (const auto& p : config.mockPatterns) out.mocks.push_back(compileOne(p));
  return out;
}

} // namespace pytgen::validate::detail
