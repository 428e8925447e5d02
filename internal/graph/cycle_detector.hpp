#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/graph/graph_snapshot.hpp"

namespace depgraph::graph {

/*
  CycleDetector

  Runs against a candidate snapshot that already contains `origin` and its
  edges. An edge to contract C reaches every version of C, so a cycle exists
  when some version of a newly referenced contract can walk forward edges
  back to `origin`.

  Traversal is depth-first and deterministic: new edges in insertion order,
  target versions in publish order, and the same order recursively. The
  visited set is shared across the whole run, so the cost is O(V + E).
*/
class CycleDetector {
 public:
  // Node path origin -> ... -> origin for the first closure found.
  static std::optional<std::vector<NodeIndex>> DetectCycle(const GraphSnapshot& snapshot, NodeIndex origin,
                                                           const std::vector<model::Reference>& new_edges);

  static std::vector<std::string> RenderPath(const GraphSnapshot& snapshot, const std::vector<NodeIndex>& path);
};

} // namespace depgraph::graph
