#pragma once

#include <string>
#include "ast/Literal.h"

namespace pytgen::ast {
    using FloatLiteral = Literal<std::string, NodeKind::FloatLiteral>;
} // namespace pytgen::ast
