#pragma once

#include <memory>
#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    struct ExprStmt final : Stmt, Acceptable<ExprStmt, NodeKind::ExprStmt> {
        std::unique_ptr<Expr> value;
        explicit ExprStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ExprStmt), value(std::move(v)) {}
    };
} // namespace pytgen::ast
