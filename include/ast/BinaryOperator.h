#pragma once

namespace pytgen::ast {

// Binary, boolean and comparison operators. Comparisons appear only in Compare::ops.
enum class BinaryOperator {
    Add,
    Sub,
    Mul,
    MatMul,
    Div,
    Mod,
    FloorDiv,
    Pow,
    LShift,
    RShift,
    BitAnd,
    BitOr,
    BitXor,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    Is,
    IsNot,
    In,
    NotIn,
    And,
    Or
};

// Python spelling of the operator ("+", "not in", "and", ...)
const char* to_symbol(BinaryOperator op);

} // namespace pytgen::ast
