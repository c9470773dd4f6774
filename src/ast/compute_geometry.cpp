/***
 * Name: pytgen::ast::ComputeGeometry
 * Purpose: Compute AST geometry (node count and maximum depth) via DFS.
 * Inputs:
 *   - root: AST root node
 * Outputs:
 *   - node count and maximum depth (root has depth 1)
 * Theory of Operation: Recursive traversal over ChildNodes, counting nodes and tracking depth.
 */
#include <algorithm>
#include <cstdint>

#include "ast/Children.h"
#include "ast/GeometrySummary.h"

namespace pytgen::ast {

static void DepthFirstAccumulate(const Node& node, uint64_t depth_value, GeometrySummary& out) {
  out.maxDepth = std::max(depth_value, out.maxDepth);
  ++out.nodes;
  for (const Node* child : ChildNodes(node)) {
    DepthFirstAccumulate(*child, depth_value + 1, out);
  }
}

GeometrySummary ComputeGeometry(const Node& root) {
  GeometrySummary out{};
  constexpr uint64_t kInitialDepth = 1U;
  DepthFirstAccumulate(root, kInitialDepth, out);
  return out;
}

}  // namespace pytgen::ast
