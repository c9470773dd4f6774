#pragma once

#include <string>
#include "ast/Literal.h"

namespace pytgen::ast {
    // Decoded text (escapes processed, adjacent literals concatenated), UTF-8.
    using StringLiteral = Literal<std::string, NodeKind::StringLiteral>;
} // namespace pytgen::ast
