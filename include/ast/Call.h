#pragma once
#include <memory>
#include <string>
#include <vector>

#include "Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    // name is empty for a '**expr' argument
    struct KeywordArg { std::string name; std::unique_ptr<Expr> value; };

    struct Call final : Expr, Acceptable<Call, NodeKind::Call> {
        std::unique_ptr<Expr> callee;             // typically Name or Attribute
        std::vector<std::unique_ptr<Expr>> args;  // positional, Starred for *expr
        std::vector<KeywordArg> keywords;         // named args and **expr
        explicit Call(std::unique_ptr<Expr> c) : Expr(NodeKind::Call), callee(std::move(c)) {}
    };

} // namespace pytgen::ast
