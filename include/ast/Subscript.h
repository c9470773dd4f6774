#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

struct Subscript final : Expr, Acceptable<Subscript, NodeKind::Subscript> {
  std::unique_ptr<Expr> value;
  std::unique_ptr<Expr> slice; // TupleLiteral for a[i, j]
  Subscript(std::unique_ptr<Expr> v, std::unique_ptr<Expr> s)
      : Expr(NodeKind::Subscript), value(std::move(v)), slice(std::move(s)) {}
};

} // namespace pytgen::ast
