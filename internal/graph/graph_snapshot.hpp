#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/contract_version.hpp"

namespace depgraph::graph {

using NodeIndex = std::uint32_t;

// A version node and its forward edges, in insertion order.
struct NodeRecord {
  NodeIndex                     index = 0;
  model::ContractVersion        version;
  std::vector<model::Reference> references;
};

// Reverse index entry: `from` references the contract the list is keyed by.
struct ReverseRef {
  NodeIndex            from = 0;
  model::ReferenceKind kind = model::ReferenceKind::kImport;
};

/*
  GraphSnapshot

  Immutable adjacency structure at one committed epoch.

  Node indices are assigned in publish order and are stable across all
  snapshots derived from each other. Node records and adjacency lists are
  shared between a snapshot and the snapshots extended from it; Extend()
  allocates only the new node, the version list of its contract, and the
  reverse lists of the contracts it references.
*/
class GraphSnapshot {
 public:
  GraphSnapshot() = default;

  uint64_t Epoch() const {
    return epoch_;
  }

  std::size_t NodeCount() const {
    return nodes_.size();
  }

  std::size_t EdgeCount() const {
    return edge_count_;
  }

  // Contracts with at least one published version.
  std::size_t ContractCount() const {
    return versions_.size();
  }

  const NodeRecord& Node(NodeIndex index) const;

  std::optional<NodeIndex> Find(const model::VersionKey& key) const;

  // Versions of a contract in publish order; empty when unpublished.
  const std::vector<NodeIndex>& VersionsOf(const std::string& contract_id) const;

  std::optional<NodeIndex> LatestVersionOf(const std::string& contract_id) const;

  // Incoming references to a contract in insertion order.
  const std::vector<ReverseRef>& ReferencesTo(const std::string& contract_id) const;

  bool HasVersions(const std::string& contract_id) const;
  bool IsReferenced(const std::string& contract_id) const;

  // New snapshot at Epoch() + 1 with `version` added. Caller guarantees the
  // version key is not present and references are deduplicated.
  std::shared_ptr<const GraphSnapshot> Extend(model::ContractVersion version, std::vector<model::Reference> references) const;

 private:
  using VersionList = std::vector<NodeIndex>;
  using ReverseList = std::vector<ReverseRef>;

  uint64_t    epoch_      = 0;
  std::size_t edge_count_ = 0;

  std::vector<std::shared_ptr<const NodeRecord>>                       nodes_;
  std::unordered_map<std::string, std::shared_ptr<const VersionList>> versions_;
  std::unordered_map<std::string, std::shared_ptr<const ReverseList>> reverse_;
};

using SnapshotPtr = std::shared_ptr<const GraphSnapshot>;

} // namespace depgraph::graph
