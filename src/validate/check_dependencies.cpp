/***
 * Name: pytgen::validate::detail::CheckDependencies
 * Purpose: Every imported module must resolve.
 * Theory of Operation:
 *   Collect 'import a.b' names and 'from m import x' modules in walk order,
 *   then ask the resolver about each. The first miss ends the check. Problems
 *   collecting names, or a resolver failure, become one
 *   "Dependency check failed" finding.
 */
#include "validate/Checks.h"

#include "ast/Children.h"
#include "ast/Import.h"
#include "ast/ImportFrom.h"
#include "ast/NodeKind.h"
#include "pytgen/exceptions/pytgen_exception.h"

namespace pytgen::validate::detail {

namespace {

// False with a reason when a name cannot be determined.
bool collectImports(const ast::Module& module, std::vector<std::string>& names, std::string& reason) {
  for (const ast::Node* node : ast::WalkBreadthFirst(module)) {
    if (node->kind == ast::NodeKind::Import) {
      for (const auto& alias : static_cast<const ast::Import*>(node)->names) names.push_back(alias->name);
    } else if (node->kind == ast::NodeKind::ImportFrom) {
      const auto* from = static_cast<const ast::ImportFrom*>(node);
      if (from->module.empty()) {
        reason = "relative import without a module name at line " + std::to_string(from->line);
        return false;
      }
      names.push_back(from->module);
    }
  }
  return true;
}

} // namespace

void CheckDependencies(const CheckInput& in, std::vector<Finding>& out) {
  if (in.module == nullptr) {
    const std::string reason = in.parseError ? DescribeParseError(*in.parseError) : std::string("no module");
    out.push_back({Severity::Error, "Dependency check failed: " + reason});
    return;
  }
  std::vector<std::string> names;
  std::string reason;
  if (!collectImports(*in.module, names, reason)) {
    out.push_back({Severity::Error, "Dependency check failed: " + reason});
    return;
  }
  try {
    for (const auto& name : names) {
      if (!in.resolver.resolves(name)) {
        out.push_back({Severity::Error, "Missing dependency: " + name});
        return;
      }
    }
  } catch (const exceptions::PytgenException& e) {
    out.push_back({Severity::Error, std::string("Dependency check failed: ") + e.what()});
  }
}

} // namespace pytgen::validate::detail
