#pragma once

#include <string>
#include <utility>
#include "ast/Node.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    // One imported name: dotted module path for 'import', member name for 'from'
    struct Alias final : Node, Acceptable<Alias, NodeKind::Alias> {
        std::string name;
        std::string asname; // empty if none
        Alias() : Node(NodeKind::Alias) {}
        Alias(std::string n, std::string a) : Node(NodeKind::Alias), name(std::move(n)), asname(std::move(a)) {}
    };
}
