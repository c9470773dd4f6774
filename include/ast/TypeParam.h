#pragma once

#include <memory>
#include <string>

namespace pytgen::ast {
    struct Expr; // fwd

    // One entry of a PEP 695 type-parameter list: T, T: bound, *Ts, **P, T = default.
    struct TypeParam {
        enum class Kind { TypeVar, TypeVarTuple, ParamSpec };
        Kind kind{Kind::TypeVar};
        std::string name;
        std::unique_ptr<Expr> bound{};        // TypeVar only
        std::unique_ptr<Expr> defaultValue{}; // optional
    };
} // namespace pytgen::ast
