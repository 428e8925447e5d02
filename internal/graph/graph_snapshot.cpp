#include "graph_snapshot.hpp"

#include <stdexcept>

namespace depgraph::graph {

namespace {

const std::vector<NodeIndex>  kNoVersions;
const std::vector<ReverseRef> kNoReferences;

} // namespace

const NodeRecord& GraphSnapshot::Node(NodeIndex index) const {
  if (index >= nodes_.size()) {
    throw std::out_of_range("graph snapshot: node index " + std::to_string(index) + " out of range");
  }
  return *nodes_[index];
}

std::optional<NodeIndex> GraphSnapshot::Find(const model::VersionKey& key) const {
  for (const auto index : VersionsOf(key.contract_id)) {
    if (nodes_[index]->version.key.version_label == key.version_label) {
      return index;
    }
  }
  return std::nullopt;
}

const std::vector<NodeIndex>& GraphSnapshot::VersionsOf(const std::string& contract_id) const {
  auto it = versions_.find(contract_id);
  return it == versions_.end() ? kNoVersions : *it->second;
}

std::optional<NodeIndex> GraphSnapshot::LatestVersionOf(const std::string& contract_id) const {
  const auto& versions = VersionsOf(contract_id);
  if (versions.empty()) {
    return std::nullopt;
  }
  return versions.back();
}

const std::vector<ReverseRef>& GraphSnapshot::ReferencesTo(const std::string& contract_id) const {
  auto it = reverse_.find(contract_id);
  return it == reverse_.end() ? kNoReferences : *it->second;
}

bool GraphSnapshot::HasVersions(const std::string& contract_id) const {
  return versions_.count(contract_id) > 0;
}

bool GraphSnapshot::IsReferenced(const std::string& contract_id) const {
  return reverse_.count(contract_id) > 0;
}

// ------------------------------------------------------------
// Copy-on-extend
// ------------------------------------------------------------

std::shared_ptr<const GraphSnapshot> GraphSnapshot::Extend(model::ContractVersion version, std::vector<model::Reference> references) const {
  auto next = std::make_shared<GraphSnapshot>(*this);

  const auto index       = static_cast<NodeIndex>(nodes_.size());
  const auto contract_id = version.key.contract_id;

  auto node        = std::make_shared<NodeRecord>();
  node->index      = index;
  node->version    = std::move(version);
  node->references = std::move(references);

  for (const auto& ref : node->references) {
    auto& slot = next->reverse_[ref.target_contract_id];
    auto  list = slot ? std::make_shared<ReverseList>(*slot) : std::make_shared<ReverseList>();
    list->push_back({index, ref.kind});
    slot = std::move(list);
  }

  {
    auto& slot = next->versions_[contract_id];
    auto  list = slot ? std::make_shared<VersionList>(*slot) : std::make_shared<VersionList>();
    list->push_back(index);
    slot = std::move(list);
  }

  next->edge_count_ += node->references.size();
  next->nodes_.push_back(std::move(node));
  next->epoch_ = epoch_ + 1;

  return next;
}

} // namespace depgraph::graph
