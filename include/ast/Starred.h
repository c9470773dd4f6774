#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

// *value in calls, displays and assignment targets
struct Starred final : Expr, Acceptable<Starred, NodeKind::Starred> {
  std::unique_ptr<Expr> value;
  explicit Starred(std::unique_ptr<Expr> v) : Expr(NodeKind::Starred), value(std::move(v)) {}
};

} // namespace pytgen::ast
