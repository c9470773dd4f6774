/**
 * @file
 * @brief AST tuple display declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

struct TupleLiteral final : Expr, Acceptable<TupleLiteral, NodeKind::TupleLiteral> {
  std::vector<std::unique_ptr<Expr>> elements;
  bool parenthesized{false}; // written with surrounding ( )
  TupleLiteral() : Expr(NodeKind::TupleLiteral) {}
};

} // namespace pytgen::ast
