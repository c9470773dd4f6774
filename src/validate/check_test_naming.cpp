/***
 * Name: pytgen::validate::detail::CheckTestNaming
 * Purpose: Require at least one test function.
 * Theory of Operation: Looks at module-level defs (sync and async); with
 *   namingIncludesNested every def in the tree counts, which admits
 *   unittest-style methods of a TestX class.
 */
#include "validate/Checks.h"

#include "ast/Children.h"
#include "ast/FunctionDef.h"
#include "ast/NodeKind.h"

namespace pytgen::validate::detail {

namespace {

bool isTestDef(const ast::Node& node, const std::string& prefix) {
  return node.kind == ast::NodeKind::FunctionDef &&
         static_cast<const ast::FunctionDef&>(node).name.rfind(prefix, 0) == 0;
}

} // namespace

void CheckTestNaming(const CheckInput& in, std::vector<Finding>& out) {
  if (in.module == nullptr) return;
  bool found = false;
  if (in.config.namingIncludesNested) {
    for (const ast::Node* node : ast::WalkBreadthFirst(*in.module)) {
      if (isTestDef(*node, in.config.testPrefix)) { found = true; break; }
    }
  } else {
    for (const auto& stmt : in.module->body) {
      if (isTestDef(*stmt, in.config.testPrefix)) { found = true; break; }
    }
  }
  if (!found) {
    out.push_back({Severity::Error, "No test functions found (missing '" + in.config.testPrefix + "' prefix)"});
  }
}

} // namespace pytgen::validate::detail
