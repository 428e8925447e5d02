#include "query_engine.hpp"

#include <algorithm>
#include <limits>
#include <queue>
#include <tuple>

#include "internal/util/errors.hpp"

namespace depgraph::query {

using graph::GraphSnapshot;
using graph::NodeIndex;

namespace {

NodeIndex RequireVersion(const GraphSnapshot& snapshot, const model::VersionKey& version) {
  auto index = snapshot.Find(version);
  if (!index) {
    throw util::NotFound("version " + model::NodeId(version) + " not found");
  }
  return *index;
}

std::vector<DependencyEdge> DirectDependencies(const GraphSnapshot& snapshot, NodeIndex index) {
  const auto& node = snapshot.Node(index);

  std::vector<DependencyEdge> edges;
  edges.reserve(node.references.size());
  for (const auto& ref : node.references) {
    edges.push_back({node.version.key, ref.target_contract_id, ref.kind, snapshot.HasVersions(ref.target_contract_id)});
  }

  std::sort(edges.begin(), edges.end(), [](const DependencyEdge& a, const DependencyEdge& b) {
    return std::tie(a.kind, a.to_contract_id) < std::tie(b.kind, b.to_contract_id);
  });
  return edges;
}

constexpr std::uint32_t kUnreached = std::numeric_limits<std::uint32_t>::max();

/*
  Expands every version at most once per tree, at the shallowest level it
  appears on. Other occurrences are leaves flagged `repeated`, so the output
  is bounded by the edge count instead of growing with the number of paths.
*/
class TreeBuilder {
 public:
  TreeBuilder(const GraphSnapshot& snapshot, NodeIndex root, std::uint32_t max_depth)
      : snapshot_(snapshot), max_depth_(max_depth), level_(snapshot.NodeCount(), kUnreached), expanded_(snapshot.NodeCount(), false) {
    level_[root]    = 0;
    expanded_[root] = true;

    std::queue<NodeIndex> q;
    q.push(root);
    while (!q.empty()) {
      const auto node = q.front();
      q.pop();
      if (level_[node] >= max_depth_) {
        continue;
      }
      for (const auto& ref : snapshot_.Node(node).references) {
        const auto latest = snapshot_.LatestVersionOf(ref.target_contract_id);
        if (latest && level_[*latest] == kUnreached) {
          level_[*latest] = level_[node] + 1;
          q.push(*latest);
        }
      }
    }
  }

  std::vector<DependencyTreeNode> Expand(NodeIndex index, std::uint32_t level) {
    std::vector<DependencyTreeNode> children;

    for (const auto& edge : DirectDependencies(snapshot_, index)) {
      DependencyTreeNode child;
      child.contract_id = edge.to_contract_id;
      child.kind        = edge.kind;

      if (auto latest = snapshot_.LatestVersionOf(edge.to_contract_id)) {
        const auto child_level = level + 1;
        child.resolved         = true;
        child.version_label    = snapshot_.Node(*latest).version.key.version_label;

        if (expanded_[*latest] || level_[*latest] < child_level) {
          child.repeated = true;
        } else if (child_level < max_depth_) {
          expanded_[*latest] = true;
          child.dependencies = Expand(*latest, child_level);
        }
      }

      children.push_back(std::move(child));
    }

    return children;
  }

 private:
  const GraphSnapshot&       snapshot_;
  const std::uint32_t        max_depth_;
  std::vector<std::uint32_t> level_;
  std::vector<bool>          expanded_;
};

} // namespace

// ------------------------------------------------------------
// Direct edges
// ------------------------------------------------------------

std::vector<DependencyEdge> QueryEngine::Dependencies(const GraphSnapshot& snapshot, const model::VersionKey& version) {
  return DirectDependencies(snapshot, RequireVersion(snapshot, version));
}

std::vector<Dependent> QueryEngine::Dependents(const GraphSnapshot& snapshot, const std::string& contract_id) {
  if (!snapshot.HasVersions(contract_id) && !snapshot.IsReferenced(contract_id)) {
    throw util::NotFound("contract " + contract_id + " not found");
  }

  const auto& refs = snapshot.ReferencesTo(contract_id);

  std::vector<Dependent> dependents;
  dependents.reserve(refs.size());
  for (const auto& ref : refs) {
    dependents.push_back({snapshot.Node(ref.from).version.key, ref.kind});
  }

  std::sort(dependents.begin(), dependents.end(), [](const Dependent& a, const Dependent& b) {
    return std::tie(a.from, a.kind) < std::tie(b.from, b.kind);
  });
  return dependents;
}

std::vector<Dependent> QueryEngine::Dependents(const GraphSnapshot& snapshot, const model::VersionKey& version) {
  RequireVersion(snapshot, version);
  return Dependents(snapshot, version.contract_id);
}

// ------------------------------------------------------------
// Impact (BFS over reverse edges)
// ------------------------------------------------------------

std::vector<ImpactEntry> QueryEngine::ImpactAnalysis(const GraphSnapshot& snapshot, const model::VersionKey& version) {
  const auto origin = RequireVersion(snapshot, version);

  std::vector<std::int64_t> depth(snapshot.NodeCount(), -1);
  std::queue<NodeIndex>     q;
  std::vector<ImpactEntry>  result;

  depth[origin] = 0;
  q.push(origin);

  while (!q.empty()) {
    const auto node = q.front();
    q.pop();

    const auto& contract_id = snapshot.Node(node).version.key.contract_id;
    for (const auto& ref : snapshot.ReferencesTo(contract_id)) {
      if (depth[ref.from] >= 0) {
        continue;
      }

      depth[ref.from] = depth[node] + 1;
      result.push_back({snapshot.Node(ref.from).version.key, static_cast<std::uint32_t>(depth[ref.from])});
      q.push(ref.from);
    }
  }

  std::sort(result.begin(), result.end(), [](const ImpactEntry& a, const ImpactEntry& b) {
    return std::tie(a.depth, a.version) < std::tie(b.depth, b.version);
  });
  return result;
}

// ------------------------------------------------------------
// Export
// ------------------------------------------------------------

GraphExport QueryEngine::ExportGraph(const GraphSnapshot& snapshot) {
  GraphExport out;
  out.epoch = snapshot.Epoch();
  out.nodes.reserve(snapshot.NodeCount());
  out.edges.reserve(snapshot.EdgeCount());

  for (NodeIndex i = 0; i < snapshot.NodeCount(); ++i) {
    const auto& node = snapshot.Node(i);
    const auto  id   = model::NodeId(node.version.key);

    out.nodes.push_back({id, node.version.key.contract_id, node.version.key.version_label});
    for (const auto& ref : node.references) {
      out.edges.push_back({id, ref.target_contract_id, ref.kind});
    }
  }

  return out;
}

std::vector<DependencyTreeNode> QueryEngine::DependencyTree(const GraphSnapshot& snapshot, const model::VersionKey& version,
                                                            std::uint32_t max_depth) {
  const auto root = RequireVersion(snapshot, version);
  if (max_depth == 0) {
    return {};
  }
  return TreeBuilder(snapshot, root, max_depth).Expand(root, 0);
}

std::vector<model::ContractVersion> QueryEngine::ListVersions(const GraphSnapshot& snapshot, const std::string& contract_id) {
  const auto& versions = snapshot.VersionsOf(contract_id);
  if (versions.empty()) {
    throw util::NotFound("contract " + contract_id + " has no published versions");
  }

  std::vector<model::ContractVersion> out;
  out.reserve(versions.size());
  for (const auto index : versions) {
    out.push_back(snapshot.Node(index).version);
  }
  return out;
}

} // namespace depgraph::query
