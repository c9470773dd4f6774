#pragma once

#include <memory>

#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

    // target: annotation [= value]
    struct AnnAssignStmt final : Stmt, Acceptable<AnnAssignStmt, NodeKind::AnnAssignStmt> {
        std::unique_ptr<Expr> target;
        std::unique_ptr<Expr> annotation;
        std::unique_ptr<Expr> value; // optional
        AnnAssignStmt() : Stmt(NodeKind::AnnAssignStmt) {}
    };
} // namespace pytgen::ast
