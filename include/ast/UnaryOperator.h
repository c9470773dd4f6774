/**
 * @file
 * @brief AST unary operator enumeration.
 */
#pragma once

namespace pytgen::ast {

enum class UnaryOperator {
    Pos,
    Neg,
    Not,
    BitNot
};

} // namespace pytgen::ast
