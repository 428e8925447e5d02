#include "graph_store.hpp"

#include <algorithm>
#include <sstream>

#include "internal/graph/cycle_detector.hpp"
#include "internal/util/errors.hpp"

namespace depgraph::graph {

namespace {

std::vector<model::Reference> Deduplicate(const std::vector<model::Reference>& references) {
  std::vector<model::Reference> unique;
  unique.reserve(references.size());
  for (const auto& ref : references) {
    if (std::find(unique.begin(), unique.end(), ref) == unique.end()) {
      unique.push_back(ref);
    }
  }
  return unique;
}

std::string JoinPath(const std::vector<std::string>& path) {
  std::ostringstream out;
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (i) out << " -> ";
    out << path[i];
  }
  return out.str();
}

} // namespace

GraphStore::GraphStore() : current_(std::make_shared<const GraphSnapshot>()) {
}

SnapshotPtr GraphStore::Current() const {
  return current_.load(std::memory_order_acquire);
}

SnapshotPtr GraphStore::BuildCandidate(const model::ContractVersion& version, const std::vector<model::Reference>& references) const {
  const auto base = Current();

  if (base->Find(version.key)) {
    throw util::DuplicateVersion("version " + model::NodeId(version.key) + " is already published");
  }

  auto edges     = Deduplicate(references);
  auto candidate = base->Extend(version, edges);
  auto origin    = static_cast<NodeIndex>(candidate->NodeCount() - 1);

  if (auto cycle = CycleDetector::DetectCycle(*candidate, origin, edges)) {
    auto path = CycleDetector::RenderPath(*candidate, *cycle);
    auto msg  = "publishing " + model::NodeId(version.key) + " would create a cycle: " + JoinPath(path);
    throw util::CycleDetected(msg, std::move(path));
  }

  return candidate;
}

void GraphStore::Swap(const SnapshotPtr& candidate) {
  auto expected = Current();
  if (expected->Epoch() + 1 != candidate->Epoch() || !current_.compare_exchange_strong(expected, candidate, std::memory_order_acq_rel)) {
    throw util::InvalidState("graph store: candidate at epoch " + std::to_string(candidate->Epoch()) +
                             " was not built on the current snapshot");
  }
}

SnapshotPtr GraphStore::CommitNewVersion(const model::ContractVersion& version, const std::vector<model::Reference>& references) {
  auto candidate = BuildCandidate(version, references);
  Swap(candidate);
  return candidate;
}

} // namespace depgraph::graph
