#include "graph_reader.hpp"

#include <utility>
#include <variant>

#include "internal/graph/graph_store.hpp"
#include "internal/observability/spans.hpp"
#include "internal/query/query_engine.hpp"

namespace depgraph::core {

namespace {

// Length-prefixed so a contract id containing '@' cannot alias a version.
std::string Subject(const std::string& contract_id) {
  return std::to_string(contract_id.size()) + ":" + contract_id;
}

std::string Subject(const model::VersionKey& key) {
  return Subject(key.contract_id) + "@" + key.version_label;
}

} // namespace

GraphReader::GraphReader(std::shared_ptr<graph::GraphStore> store, std::shared_ptr<cache::ResultCache> cache, std::uint32_t max_tree_depth)
    : store_(std::move(store)), cache_(std::move(cache)), max_tree_depth_(max_tree_depth == 0 ? kDefaultMaxTreeDepth : max_tree_depth) {
}

template <typename T, typename Compute>
Versioned<T> GraphReader::Cached(cache::QueryKind kind, std::string subject, Compute&& compute) {
  const auto snapshot = store_->Current();
  const auto epoch    = snapshot->Epoch();

  cache::CacheKey key{kind, std::move(subject)};

  if (cache_->Enabled()) {
    // the cache epoch may still trail a snapshot that was just swapped in
    if (auto entry = cache_->Get(key, epoch)) {
      if (const auto* value = std::get_if<T>(entry->payload.get())) {
        observability::Metrics::Instance().RecordCacheLookup(cache::ToString(kind), true);
        return {epoch, *value};
      }
    }
    observability::Metrics::Instance().RecordCacheLookup(cache::ToString(kind), false);
  }

  T value = compute(*snapshot);
  if (cache_->Enabled()) {
    cache_->Put(key, epoch, std::make_shared<const cache::QueryResult>(value));
  }
  return {epoch, std::move(value)};
}

Versioned<std::vector<query::DependencyEdge>> GraphReader::Dependencies(const model::VersionKey& version) {
  return Cached<std::vector<query::DependencyEdge>>(cache::QueryKind::kDependencies, Subject(version), [&](const graph::GraphSnapshot& s) {
    return query::QueryEngine::Dependencies(s, version);
  });
}

Versioned<std::vector<query::Dependent>> GraphReader::Dependents(const std::string& contract_id) {
  return Cached<std::vector<query::Dependent>>(cache::QueryKind::kDependents, Subject(contract_id), [&](const graph::GraphSnapshot& s) {
    return query::QueryEngine::Dependents(s, contract_id);
  });
}

Versioned<std::vector<query::Dependent>> GraphReader::Dependents(const model::VersionKey& version) {
  return Cached<std::vector<query::Dependent>>(cache::QueryKind::kDependents, Subject(version), [&](const graph::GraphSnapshot& s) {
    return query::QueryEngine::Dependents(s, version);
  });
}

Versioned<std::vector<query::ImpactEntry>> GraphReader::Impact(const model::VersionKey& version) {
  return Cached<std::vector<query::ImpactEntry>>(cache::QueryKind::kImpact, Subject(version), [&](const graph::GraphSnapshot& s) {
    return query::QueryEngine::ImpactAnalysis(s, version);
  });
}

query::GraphExport GraphReader::Export() {
  return Cached<query::GraphExport>(cache::QueryKind::kExport, "", [](const graph::GraphSnapshot& s) {
           return query::QueryEngine::ExportGraph(s);
         })
      .value;
}

Versioned<std::vector<query::DependencyTreeNode>> GraphReader::DependencyTree(const model::VersionKey& version, std::uint32_t max_depth) {
  const auto depth = (max_depth == 0 || max_depth > max_tree_depth_) ? max_tree_depth_ : max_depth;
  return Cached<std::vector<query::DependencyTreeNode>>(
      cache::QueryKind::kDependencyTree, Subject(version) + "#" + std::to_string(depth),
      [&](const graph::GraphSnapshot& s) { return query::QueryEngine::DependencyTree(s, version, depth); });
}

Versioned<std::vector<model::ContractVersion>> GraphReader::ListVersions(const std::string& contract_id) {
  return Cached<std::vector<model::ContractVersion>>(cache::QueryKind::kVersions, Subject(contract_id), [&](const graph::GraphSnapshot& s) {
    return query::QueryEngine::ListVersions(s, contract_id);
  });
}

GraphStats GraphReader::Stats() const {
  const auto snapshot = store_->Current();
  return {snapshot->Epoch(), snapshot->NodeCount(), snapshot->EdgeCount(), snapshot->ContractCount()};
}

cache::CacheStats GraphReader::CacheStats() const {
  return cache_->Stats();
}

} // namespace depgraph::core
