#pragma once

#include <utility>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

template <typename T, NodeKind K>
struct Literal final : Expr, Acceptable<Literal<T, K>, K> {
    T value;
    explicit Literal(T v) : Expr(K), value(std::move(v)) {}
};

} // namespace pytgen::ast
