/**
 * @file
 * @brief Node-to-parent index keyed by node identity.
 */
#pragma once

#include <cstddef>
#include <unordered_map>
#include "ast/Node.h"

namespace pytgen::ast {

// Built once over a tree; borrowed pointers stay valid while the tree lives.
class ParentMap {
 public:
  explicit ParentMap(const Node& root);

  // nullptr for the root and for nodes outside the indexed tree
  [[nodiscard]] const Node* parentOf(const Node& node) const;

  [[nodiscard]] std::size_t size() const { return parents_.size(); }

 private:
  std::unordered_map<const Node*, const Node*> parents_;
};

} // namespace pytgen::ast
