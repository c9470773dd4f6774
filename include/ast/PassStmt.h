#pragma once

#include "ast/Stmt.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    struct PassStmt final : Stmt, Acceptable<PassStmt, NodeKind::PassStmt> {
        PassStmt() : Stmt(NodeKind::PassStmt) {}
    };
}
