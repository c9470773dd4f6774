#include "extract/Docstring.h"

#include "ast/ExprStmt.h"
#include "ast/NodeKind.h"
#include "ast/StringLiteral.h"

namespace pytgen::extract {

std::optional<std::string> DocstringOf(const std::vector<std::unique_ptr<ast::Stmt>>& body) {
  if (body.empty() || body.front()->kind != ast::NodeKind::ExprStmt) return std::nullopt;
  const auto& stmt = static_cast<const ast::ExprStmt&>(*body.front());
  if (!stmt.value || stmt.value->kind != ast::NodeKind::StringLiteral) return std::nullopt;
  return static_cast<const ast::StringLiteral&>(*stmt.value).value;
}

} // namespace pytgen::extract
