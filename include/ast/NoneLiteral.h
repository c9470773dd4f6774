#pragma once

#include "Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    struct NoneLiteral final : Expr, Acceptable<NoneLiteral, NodeKind::NoneLiteral> {
        NoneLiteral() : Expr(NodeKind::NoneLiteral) {}
    };
}
