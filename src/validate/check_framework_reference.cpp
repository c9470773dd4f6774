#include "validate/Checks.h"

namespace pytgen::validate::detail {

void CheckFrameworkReference(const CheckInput& in, std::vector<Finding>& out) {
  for (const auto& name : in.config.frameworkNames) {
    if (in.candidate.find(name) != std::string::npos) return;
  }
  out.push_back({Severity::Warning, "Missing pytest or mock imports"});
}

} // namespace pytgen::validate::detail
