#pragma once

#include "ast/Literal.h"

namespace pytgen::ast {
    using BoolLiteral = Literal<bool, NodeKind::BoolLiteral>;
} // namespace pytgen::ast
