#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

// lower:upper:step inside a subscript; each part may be null.
struct Slice final : Expr, Acceptable<Slice, NodeKind::Slice> {
  std::unique_ptr<Expr> lower;
  std::unique_ptr<Expr> upper;
  std::unique_ptr<Expr> step;
  Slice() : Expr(NodeKind::Slice) {}
};

} // namespace pytgen::ast
