/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/HasParams.h"
#include "ast/Param.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

struct LambdaExpr final : Expr, HasParams<Param>, Acceptable<LambdaExpr, NodeKind::LambdaExpr> {
  std::unique_ptr<Expr> body;
  LambdaExpr() : Expr(NodeKind::LambdaExpr) {}
};

} // namespace pytgen::ast
