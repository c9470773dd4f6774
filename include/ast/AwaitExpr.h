#pragma once

#include <memory>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

struct AwaitExpr final : Expr, Acceptable<AwaitExpr, NodeKind::AwaitExpr> {
  std::unique_ptr<Expr> value;
  explicit AwaitExpr(std::unique_ptr<Expr> v) : Expr(NodeKind::AwaitExpr), value(std::move(v)) {}
};

} // namespace pytgen::ast
