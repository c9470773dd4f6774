/**
 * @file
 * @brief AST expression base declarations.
 */
#pragma once

#include "Node.h"

namespace pytgen::ast {
    struct Expr : Node {
        using Node::Node;
    };
} // namespace pytgen::ast
