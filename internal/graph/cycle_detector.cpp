#include "cycle_detector.hpp"

#include <cstddef>

namespace depgraph::graph {

namespace {

struct Frame {
  NodeIndex   node;
  std::size_t ref_pos;
  std::size_t version_pos;
};

std::vector<NodeIndex> ClosePath(NodeIndex origin, const std::vector<Frame>& stack) {
  std::vector<NodeIndex> path;
  path.reserve(stack.size() + 2);
  path.push_back(origin);
  for (const auto& frame : stack) {
    path.push_back(frame.node);
  }
  path.push_back(origin);
  return path;
}

} // namespace

std::optional<std::vector<NodeIndex>> CycleDetector::DetectCycle(const GraphSnapshot& snapshot, NodeIndex origin,
                                                                 const std::vector<model::Reference>& new_edges) {
  std::vector<bool>  visited(snapshot.NodeCount(), false);
  std::vector<Frame> stack;

  for (const auto& edge : new_edges) {
    for (const auto start : snapshot.VersionsOf(edge.target_contract_id)) {
      if (start == origin) {
        return std::vector<NodeIndex>{origin, origin};
      }
      if (visited[start]) {
        continue;
      }

      visited[start] = true;
      stack.push_back({start, 0, 0});

      while (!stack.empty()) {
        auto&       top  = stack.back();
        const auto& refs = snapshot.Node(top.node).references;

        if (top.ref_pos >= refs.size()) {
          stack.pop_back();
          continue;
        }

        const auto& targets = snapshot.VersionsOf(refs[top.ref_pos].target_contract_id);
        if (top.version_pos >= targets.size()) {
          ++top.ref_pos;
          top.version_pos = 0;
          continue;
        }

        const auto next = targets[top.version_pos++];
        if (next == origin) {
          return ClosePath(origin, stack);
        }
        if (visited[next]) {
          continue;
        }

        visited[next] = true;
        stack.push_back({next, 0, 0});
      }
    }
  }

  return std::nullopt;
}

std::vector<std::string> CycleDetector::RenderPath(const GraphSnapshot& snapshot, const std::vector<NodeIndex>& path) {
  std::vector<std::string> rendered;
  rendered.reserve(path.size());
  for (const auto index : path) {
    rendered.push_back(model::NodeId(snapshot.Node(index).version.key));
  }
  return rendered;
}

} // namespace depgraph::graph
