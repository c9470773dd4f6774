#pragma once

#include <memory>
#include <string>

namespace pytgen::ast {
    struct Expr; // fwd

    // One formal parameter of a def or lambda, in declaration order.
    struct Param {
        std::string name;
        std::unique_ptr<Expr> annotation{};   // optional
        std::unique_ptr<Expr> defaultValue{}; // optional
        bool isVarArg{false};   // *args
        bool isKwVarArg{false}; // **kwargs
        bool isKwOnly{false};   // kw-only param (after * or *args)
        bool isPosOnly{false};  // positional-only (before '/')
    };
} // namespace pytgen::ast
