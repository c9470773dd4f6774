/**
 * @file
 * @brief AST module node declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Node.h"
#include "ast/HasBody.h"
#include "ast/Stmt.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    struct Module final : Node, HasBody<Stmt>, Acceptable<Module, NodeKind::Module> {
        Module() : Node(NodeKind::Module) {}
    };
} // namespace pytgen::ast
