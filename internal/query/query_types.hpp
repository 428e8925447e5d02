#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/contract_version.hpp"

namespace depgraph::query {

/*
  Plain result records. No pointers into snapshots, so results can be cached
  and serialized after the snapshot they came from is gone.
*/

struct DependencyEdge {
  model::VersionKey    from;
  std::string          to_contract_id;
  model::ReferenceKind kind            = model::ReferenceKind::kImport;
  bool                 target_resolved = false;

  bool operator==(const DependencyEdge&) const = default;
};

struct Dependent {
  model::VersionKey    from;
  model::ReferenceKind kind = model::ReferenceKind::kImport;

  bool operator==(const Dependent&) const = default;
};

struct ImpactEntry {
  model::VersionKey version;
  std::uint32_t     depth = 0;

  bool operator==(const ImpactEntry&) const = default;
};

struct GraphNode {
  std::string id;
  std::string contract_id;
  std::string version_label;

  bool operator==(const GraphNode&) const = default;
};

struct GraphEdge {
  std::string          from;
  std::string          to;
  model::ReferenceKind kind = model::ReferenceKind::kImport;

  bool operator==(const GraphEdge&) const = default;
};

struct GraphExport {
  std::uint64_t          epoch = 0;
  std::vector<GraphNode> nodes;
  std::vector<GraphEdge> edges;

  bool operator==(const GraphExport&) const = default;
};

struct DependencyTreeNode {
  std::string                     contract_id;
  std::string                     version_label; // latest version; empty when unresolved
  model::ReferenceKind            kind     = model::ReferenceKind::kImport;
  bool                            resolved = false;
  // expanded at another position of the same tree; dependencies left empty
  bool                            repeated = false;
  std::vector<DependencyTreeNode> dependencies;

  bool operator==(const DependencyTreeNode&) const = default;
};

} // namespace depgraph::query
