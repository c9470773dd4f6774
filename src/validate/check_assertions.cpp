#include "validate/Checks.h"

namespace pytgen::validate::detail {

void CheckAssertions(const CheckInput& in, std::vector<Finding>& out) {
  for (const auto& re : in.patterns.assertions) {
    if (std::regex_search(in.searchText, re)) return;
  }
  out.push_back({Severity::Error, "No valid assertions found in test code"});
}

} // namespace pytgen::validate::detail
