/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

// An f-string, possibly implicitly concatenated with plain string literals.
struct FStringLiteral final : Expr, Acceptable<FStringLiteral, NodeKind::FStringLiteral> {
  std::string text;                          // source spelling of every piece, space-joined
  std::vector<std::unique_ptr<Expr>> values; // replacement-field expressions in order
  FStringLiteral() : Expr(NodeKind::FStringLiteral) {}
};

} // namespace pytgen::ast
