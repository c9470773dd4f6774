/***
 * Name: pytgen::validate::detail::CheckForbiddenConstructs
 * Purpose: Flag code execution, shell commands, dynamic imports and file access.
 * Theory of Operation:
 *   Two passes that never consult each other. The tree pass matches call
 *   targets and import statements against the configured tables; the text
 *   pass searches the raw candidate with the configured regexes. The same
 *   construct may be reported by both.
 */
#include "validate/Checks.h"

#include "ast/Attribute.h"
#include "ast/Call.h"
#include "ast/Children.h"
#include "ast/Import.h"
#include "ast/Name.h"
#include "ast/NodeKind.h"

#include <algorithm>

namespace pytgen::validate::detail {

namespace {

bool contains(const std::vector<std::string>& table, const std::string& name) {
  return std::find(table.begin(), table.end(), name) != table.end();
}

void checkCall(const ast::Call& call, const ValidatorConfig& cfg, std::vector<Finding>& out) {
  if (!call.callee) return;
  const std::string name = DottedName(*call.callee);
  if (name.empty()) return;
  if (contains(cfg.codeExecCalls, name)) {
    out.push_back({Severity::Error, "Dangerous function call: " + name});
  } else if (contains(cfg.commandExecCalls, name)) {
    out.push_back({Severity::Error, "Dangerous system call: " + name});
  } else if (contains(cfg.dynamicImportCalls, name)) {
    out.push_back({Severity::Error, "Unsafe dynamic import: " + name});
  } else if (contains(cfg.fileOpenCalls, name)) {
    out.push_back({Severity::Warning, "Potential file operation: " + name});
  }
}

} // namespace

std::string DottedName(const ast::Expr& expr) {
  if (expr.kind == ast::NodeKind::Name) return static_cast<const ast::Name&>(expr).id;
  if (expr.kind == ast::NodeKind::Attribute) {
    const auto& attr = static_cast<const ast::Attribute&>(expr);
    if (!attr.value) return {};
    const std::string base = DottedName(*attr.value);
    return base.empty() ? std::string{} : base + "." + attr.attr;
  }
  return {};
}

void CheckForbiddenConstructs(const CheckInput& in, std::vector<Finding>& out) {
  if (in.module != nullptr) {
    for (const ast::Node* node : ast::WalkBreadthFirst(*in.module)) {
      if (node->kind == ast::NodeKind::Import) {
        for (const auto& alias : static_cast<const ast::Import*>(node)->names) {
          if (contains(in.config.riskyImports, alias->name)) {
            out.push_back({Severity::Warning, "Potentially risky import: " + alias->name});
          }
        }
      } else if (node->kind == ast::NodeKind::Call) {
        checkCall(*static_cast<const ast::Call*>(node), in.config, out);
      }
    }
  }
  for (const auto& p : in.patterns.textual) {
    if (std::regex_search(in.searchText, p.regex)) out.push_back({p.severity, p.message});
  }
}

} // namespace pytgen::validate::detail
