/***
 * Name: pytgen::ast::ParentMap
 * Purpose: Index every node of a tree by identity to its direct parent.
 */
#include "ast/ParentMap.h"
#include "ast/Children.h"

namespace pytgen::ast {

ParentMap::ParentMap(const Node& root) {
  for (const Node* node : WalkBreadthFirst(root)) {
    for (const Node* child : ChildNodes(*node)) { parents_.emplace(child, node); }
  }
}

const Node* ParentMap::parentOf(const Node& node) const {
  const auto it = parents_.find(&node);
  return it == parents_.end() ? nullptr : it->second;
}

} // namespace pytgen::ast
