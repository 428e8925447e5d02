#pragma once

#include <atomic>
#include <vector>

#include "internal/graph/graph_snapshot.hpp"

namespace depgraph::graph {

/*
  GraphStore

  Owns the handle to the current snapshot.

  Readers call Current() and keep the returned pointer for the whole
  operation; they never see a partially applied publish. Writers are
  expected to be serialized by the caller (PublicationCoordinator);
  Swap() still refuses a candidate not built on the current snapshot.
*/
class GraphStore {
 public:
  GraphStore();

  SnapshotPtr Current() const;

  // Validates and builds the next snapshot without publishing it.
  // Throws util::DuplicateVersion or util::CycleDetected.
  SnapshotPtr BuildCandidate(const model::ContractVersion& version, const std::vector<model::Reference>& references) const;

  // Publishes a candidate from BuildCandidate(). Throws util::InvalidState
  // when another snapshot was published in between.
  void Swap(const SnapshotPtr& candidate);

  SnapshotPtr CommitNewVersion(const model::ContractVersion& version, const std::vector<model::Reference>& references);

 private:
  std::atomic<SnapshotPtr> current_;
};

} // namespace depgraph::graph
