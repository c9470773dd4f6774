/**
 * @file
 * @brief AST try/except declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "Stmt.h"
#include "ast/Acceptable.h"
#include "ast/ExceptHandler.h"
#include "ast/HasBody.h"

namespace pytgen::ast {
    struct TryStmt final : Stmt, HasBody<Stmt>, Acceptable<TryStmt, NodeKind::TryStmt> {
        std::vector<std::unique_ptr<ExceptHandler>> handlers;
        std::vector<std::unique_ptr<Stmt>> orelse;
        std::vector<std::unique_ptr<Stmt>> finalbody;
        bool isStar{false}; // except* groups
        TryStmt() : Stmt(NodeKind::TryStmt) {}
    };
}
