#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/graph/graph_snapshot.hpp"
#include "internal/query/query_types.hpp"

namespace depgraph::query {

/*
  QueryEngine

  Pure reads over one snapshot passed by the caller. Every result is fully
  ordered so repeated calls on the same snapshot return identical sequences.

  Throws util::NotFound when the subject is not in the snapshot.
*/
class QueryEngine {
 public:
  // Direct forward edges ordered by (kind, target contract).
  static std::vector<DependencyEdge> Dependencies(const graph::GraphSnapshot& snapshot, const model::VersionKey& version);

  // Direct reverse edges ordered by (from contract, from version, kind).
  // A contract that is only referenced, never published, is a valid subject.
  static std::vector<Dependent> Dependents(const graph::GraphSnapshot& snapshot, const std::string& contract_id);
  static std::vector<Dependent> Dependents(const graph::GraphSnapshot& snapshot, const model::VersionKey& version);

  // Transitive reverse closure with minimum hop counts, origin excluded.
  // Ordered by depth, then (contract, version).
  static std::vector<ImpactEntry> ImpactAnalysis(const graph::GraphSnapshot& snapshot, const model::VersionKey& version);

  // Nodes and edges in insertion order.
  static GraphExport ExportGraph(const graph::GraphSnapshot& snapshot);

  // Dependencies expanded through the latest version of each target, at
  // most `max_depth` levels. Unresolved targets are leaves. A version is
  // expanded once, at its shallowest level; its other occurrences are
  // `repeated` leaves.
  static std::vector<DependencyTreeNode> DependencyTree(const graph::GraphSnapshot& snapshot, const model::VersionKey& version,
                                                        std::uint32_t max_depth);

  static std::vector<model::ContractVersion> ListVersions(const graph::GraphSnapshot& snapshot, const std::string& contract_id);
};

} // namespace depgraph::query
