/***
 * Name: pytgen::validate::detail::CheckMockUsage
 * Purpose: Warn when a function taking a callable is tested without mocks.
 * Theory of Operation: Active only with a context. An annotation's head is
 *   the text before '['; it matches the table as a whole ("typing.Callable")
 *   or by its last dotted segment ("Callable").
 */
#include "validate/Checks.h"

#include <algorithm>

namespace pytgen::validate::detail {

namespace {

bool isCallableType(const std::string& annotation, const std::vector<std::string>& table) {
  std::string head = annotation.substr(0, annotation.find('['));
  while (!head.empty() && head.back() == ' ') head.pop_back();
  const auto dot = head.rfind('.');
  const std::string last = dot == std::string::npos ? head : head.substr(dot + 1);
  return std::any_of(table.begin(), table.end(),
                     [&](const std::string& name) { return name == head || name == last; });
}

} // namespace

void CheckMockUsage(const CheckInput& in, std::vector<Finding>& out) {
  if (!in.context) return;
  const auto& args = in.context->arguments;
  const bool needsMocks = std::any_of(args.begin(), args.end(), [&](const extract::ArgumentSpec& a) {
    return a.typeAnnotation && isCallableType(*a.typeAnnotation, in.config.callableTypeNames);
  });
  if (!needsMocks) return;
  for (const auto& re : in.patterns.mocks) {
    if (std::regex_search(in.searchText, re)) return;
  }
  out.push_back({Severity::Warning, "Callable argument detected but no mocks found"});
}

} // namespace pytgen::validate::detail
