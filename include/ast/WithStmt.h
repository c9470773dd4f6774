/**
 * @file
 * @brief AST with statement declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "Stmt.h"
#include "ast/WithItem.h"
#include "ast/HasBody.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    struct WithStmt final : Stmt, HasBody<Stmt>, Acceptable<WithStmt, NodeKind::WithStmt> {
        std::vector<std::unique_ptr<WithItem>> items;
        bool isAsync{false};
        WithStmt() : Stmt(NodeKind::WithStmt) {}
    };
}
