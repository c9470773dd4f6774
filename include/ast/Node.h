/**
 * @file
 * @brief AST base node declarations.
 */
#pragma once

#include "NodeKind.h"
#include <string>

namespace pytgen::ast {

    struct VisitorBase; // fwd

    struct Node {
        NodeKind kind;
        explicit Node(const NodeKind k) : kind(k) {}
        virtual ~Node() = default;

        // Polymorphic dispatch entrypoint (default implemented out-of-line)
        virtual void accept(VisitorBase& v) const;

        int line{0};
        int col{0};
        int endLine{0}; // last source line covered by the node
        std::string file{};
    };

} // namespace pytgen::ast
