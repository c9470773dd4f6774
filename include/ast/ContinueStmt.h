#pragma once

#include "ast/Stmt.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    struct ContinueStmt final : Stmt, Acceptable<ContinueStmt, NodeKind::ContinueStmt> {
        ContinueStmt() : Stmt(NodeKind::ContinueStmt) {}
    };
}
