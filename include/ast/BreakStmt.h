#pragma once

#include "ast/Stmt.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    struct BreakStmt final : Stmt, Acceptable<BreakStmt, NodeKind::BreakStmt> {
        BreakStmt() : Stmt(NodeKind::BreakStmt) {}
    };
}
