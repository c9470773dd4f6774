#pragma once

#include <string>
#include "ast/Literal.h"

namespace pytgen::ast {
    using ImagLiteral = Literal<std::string, NodeKind::ImagLiteral>;
} // namespace pytgen::ast
