#pragma once

#include <memory>
#include <string>
#include "Expr.h"
#include "Stmt.h"
#include "ast/HasBody.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    struct ExceptHandler final : Node, HasBody<Stmt>, Acceptable<ExceptHandler, NodeKind::ExceptHandler> {
        std::unique_ptr<Expr> type; // may be null (bare except)
        std::string name;           // optional name (empty if none)
        ExceptHandler() : Node(NodeKind::ExceptHandler) {}
    };
}
