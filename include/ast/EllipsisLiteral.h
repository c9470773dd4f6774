#pragma once

#include "Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    struct EllipsisLiteral final : Expr, Acceptable<EllipsisLiteral, NodeKind::EllipsisLiteral> {
        EllipsisLiteral() : Expr(NodeKind::EllipsisLiteral) {}
    };
}
