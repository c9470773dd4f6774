/**
 * @file
 * @brief Render expressions back to Python source text.
 */
/***
 * Name: pytgen::ast::RenderExpr
 * Purpose: Produce canonical source text for an expression, following the
 *          layout rules of Python's ast.unparse (minimal parentheses, tuple
 *          subscripts without parentheses, string literals in repr form).
 * Inputs:
 *   - expr: any expression node
 * Outputs:
 *   - text such as "dict[str, int]", "Callable[[int], None]", "'Vector'"
 */
#pragma once

#include <string>
#include "ast/Expr.h"

namespace pytgen::ast {

std::string RenderExpr(const Expr& expr);

// Python repr() of a str value given as UTF-8 (single quotes preferred).
std::string ReprString(const std::string& utf8);

// Python repr() of a bytes value.
std::string ReprBytes(const std::string& bytes);

} // namespace pytgen::ast
