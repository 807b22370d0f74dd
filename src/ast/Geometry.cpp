/**
 * @file
 * @brief Tree geometry computation implementation.
 */
/***
 * Name: pyinfer::ast::ComputeGeometry
 * Purpose: Walk a tree and compute node count and max depth (root depth 1).
 */
#include "ast/GeometrySummary.h"
#include "ast/NodeArena.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace pyinfer::ast {

GeometrySummary ComputeGeometry(const Node& root) {
  GeometrySummary summary;
  std::vector<std::pair<const Node*, uint64_t>> pending{{&root, 1}};
  while (!pending.empty()) {
    const auto [node, depth] = pending.back();
    pending.pop_back();
    ++summary.nodes;
    summary.maxDepth = std::max(summary.maxDepth, depth);
    for (std::size_t i = 0; i < node->childCount(); ++i) {
      pending.emplace_back(&node->child(i), depth + 1);
    }
  }
  return summary;
}

} // namespace pyinfer::ast
