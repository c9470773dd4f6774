#pragma once

#include <memory>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    struct WithItem final : Node, Acceptable<WithItem, NodeKind::WithItem> {
        std::unique_ptr<Expr> context;
        std::unique_ptr<Expr> target; // 'as' target, null if none
        WithItem() : Node(NodeKind::WithItem) {}
    };
}
