#pragma once

#include <string>
#include "ast/Literal.h"

namespace pytgen::ast {
    // Source spelling (e.g. "0x_ff"); values are never evaluated.
    using IntLiteral = Literal<std::string, NodeKind::IntLiteral>;
} // namespace pytgen::ast
