/**
 * @file
 * @brief Direct-child enumeration and traversal helpers.
 */
#pragma once

#include <vector>
#include "ast/Node.h"

namespace pytgen::ast {

// Direct children of a node in source-field order (the order of Python's
// ast.iter_child_nodes): e.g. a def yields parameter annotations/defaults,
// then body statements, then decorators, then the return annotation.
std::vector<const Node*> ChildNodes(const Node& node);

// Every node reachable from root, root first, level by level (ast.walk order).
std::vector<const Node*> WalkBreadthFirst(const Node& root);

} // namespace pytgen::ast
