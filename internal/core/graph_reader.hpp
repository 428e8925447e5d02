#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/result_cache.hpp"
#include "internal/graph/graph_snapshot.hpp"
#include "internal/query/query_types.hpp"

namespace depgraph::graph {
class GraphStore;
}

namespace depgraph::core {

// A query result and the epoch of the snapshot it was computed from.
template <typename T>
struct Versioned {
  std::uint64_t epoch = 0;
  T             value;
};

struct GraphStats {
  std::uint64_t epoch     = 0;
  std::uint64_t nodes     = 0;
  std::uint64_t edges     = 0;
  std::uint64_t contracts = 0;
};

/*
  GraphReader

  Read side of the engine: takes one snapshot per call, serves the result
  from the ResultCache when an entry for that exact epoch exists, and
  otherwise computes it with QueryEngine and offers it back to the cache.

  Never blocks on a publish. Throws util::NotFound like QueryEngine.
*/
class GraphReader {
 public:
  static constexpr std::uint32_t kDefaultMaxTreeDepth = 16;

  GraphReader(std::shared_ptr<graph::GraphStore> store, std::shared_ptr<cache::ResultCache> cache,
              std::uint32_t max_tree_depth = kDefaultMaxTreeDepth);

  Versioned<std::vector<query::DependencyEdge>> Dependencies(const model::VersionKey& version);
  Versioned<std::vector<query::Dependent>>      Dependents(const std::string& contract_id);
  Versioned<std::vector<query::Dependent>>      Dependents(const model::VersionKey& version);
  Versioned<std::vector<query::ImpactEntry>>    Impact(const model::VersionKey& version);
  query::GraphExport                            Export();

  // max_depth 0 or above the configured bound is clamped to the bound.
  Versioned<std::vector<query::DependencyTreeNode>> DependencyTree(const model::VersionKey& version, std::uint32_t max_depth);

  Versioned<std::vector<model::ContractVersion>> ListVersions(const std::string& contract_id);

  GraphStats        Stats() const;
  cache::CacheStats CacheStats() const;

  std::uint32_t MaxTreeDepth() const {
    return max_tree_depth_;
  }

 private:
  template <typename T, typename Compute>
  Versioned<T> Cached(cache::QueryKind kind, std::string subject, Compute&& compute);

  std::shared_ptr<graph::GraphStore>  store_;
  std::shared_ptr<cache::ResultCache> cache_;
  std::uint32_t                       max_tree_depth_;
};

} // namespace depgraph::core
