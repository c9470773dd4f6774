/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

struct DictLiteral final : Expr, Acceptable<DictLiteral, NodeKind::DictLiteral> {
  // keys[i] is null for a '**expr' entry, whose expression is values[i]
  std::vector<std::unique_ptr<Expr>> keys;
  std::vector<std::unique_ptr<Expr>> values;
  DictLiteral() : Expr(NodeKind::DictLiteral) {}
};

} // namespace pytgen::ast
