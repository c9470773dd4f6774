#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

struct ListLiteral final : Expr, Acceptable<ListLiteral, NodeKind::ListLiteral> {
  std::vector<std::unique_ptr<Expr>> elements;
  ListLiteral() : Expr(NodeKind::ListLiteral) {}
};

} // namespace pytgen::ast
