#pragma once

#include <memory>
#include <vector>

#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

    // a = b = value
    struct AssignStmt final : Stmt, Acceptable<AssignStmt, NodeKind::AssignStmt> {
        std::vector<std::unique_ptr<Expr>> targets;
        std::unique_ptr<Expr> value;
        AssignStmt() : Stmt(NodeKind::AssignStmt) {}
    };
} // namespace pytgen::ast
