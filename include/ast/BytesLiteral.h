#pragma once

#include <string>
#include "ast/Literal.h"

namespace pytgen::ast {
    using BytesLiteral = Literal<std::string, NodeKind::BytesLiteral>;
} // namespace pytgen::ast
