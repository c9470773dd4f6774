/**
 * @file
 * @brief AST geometry summary declarations.
 */
#pragma once

#include <cstdint>
#include "ast/Node.h"

namespace pytgen::ast {
    // Compute a simple geometry summary for a tree
    struct GeometrySummary {
        uint64_t nodes{0};
        uint64_t maxDepth{0};
    };

    GeometrySummary ComputeGeometry(const Node& root);

} // namespace pytgen::ast
