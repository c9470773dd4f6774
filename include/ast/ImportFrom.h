/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Stmt.h"
#include "ast/Alias.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    struct ImportFrom final : Stmt, Acceptable<ImportFrom, NodeKind::ImportFrom> {
        std::string module; // empty for relative-only ('from . import x')
        int level{0};       // number of leading dots
        std::vector<std::unique_ptr<Alias>> names; // single "*" alias for star imports
        ImportFrom() : Stmt(NodeKind::ImportFrom) {}
    };
}
