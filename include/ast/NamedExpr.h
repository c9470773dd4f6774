/**
 * @file
 * @brief AST named expression declarations.
 */
#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

// target := value
struct NamedExpr final : Expr, Acceptable<NamedExpr, NodeKind::NamedExpr> {
  std::unique_ptr<Expr> target;       // always a Name
  std::unique_ptr<Expr> value;
  NamedExpr(std::unique_ptr<Expr> t, std::unique_ptr<Expr> v)
      : Expr(NodeKind::NamedExpr), target(std::move(t)), value(std::move(v)) {}
};

} // namespace pytgen::ast
