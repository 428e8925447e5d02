#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "internal/query/query_types.hpp"

namespace depgraph::cache {

enum class QueryKind : std::uint8_t {
  kDependencies,
  kDependents,
  kImpact,
  kExport,
  kDependencyTree,
  kVersions,
};

constexpr std::string_view ToString(QueryKind kind) {
  switch (kind) {
    case QueryKind::kDependencies:
      return "dependencies";
    case QueryKind::kDependents:
      return "dependents";
    case QueryKind::kImpact:
      return "impact";
    case QueryKind::kExport:
      return "export";
    case QueryKind::kDependencyTree:
      return "dependency_tree";
    case QueryKind::kVersions:
    default:
      return "versions";
  }
}

struct CacheKey {
  QueryKind   kind = QueryKind::kDependencies;
  std::string subject;

  bool operator==(const CacheKey&) const = default;
};

struct CacheKeyHash {
  std::size_t operator()(const CacheKey& key) const {
    return std::hash<std::string>{}(key.subject) * 31 + static_cast<std::size_t>(key.kind);
  }
};

using QueryResult = std::variant<std::vector<query::DependencyEdge>, std::vector<query::Dependent>, std::vector<query::ImpactEntry>,
                                 query::GraphExport, std::vector<query::DependencyTreeNode>, std::vector<model::ContractVersion>>;

struct CacheEntry {
  std::uint64_t                      epoch = 0;
  std::shared_ptr<const QueryResult> payload;
};

struct CacheStats {
  bool          enabled         = true;
  std::uint64_t epoch           = 0;
  std::uint64_t entries         = 0;
  std::uint64_t max_entries     = 0;
  std::uint64_t hits            = 0;
  std::uint64_t misses          = 0;
  std::uint64_t stale_evictions = 0;

  double HitRatePercent() const {
    const auto total = hits + misses;
    return total == 0 ? 0.0 : 100.0 * static_cast<double>(hits) / static_cast<double>(total);
  }
};

/*
  ResultCache

  Memoizes query results per (kind, subject), each entry stamped with the
  epoch of the snapshot it was computed from.

  Consistency model:
  - InvalidateAll() only advances the epoch; storage is not touched.
  - Get() returns an entry only when its epoch equals both the current one
    and the epoch the caller reads at; only those count as hits. Entries
    behind the current epoch are evicted on the spot.
  - Put() drops payloads computed for any epoch but the current one, so a
    fill that races with a publish cannot install a stale result.
  - When max_entries is reached, Put() first sweeps stale entries and then
    declines the fill if the cache is still full.
*/
class ResultCache {
 public:
  explicit ResultCache(std::size_t max_entries = 0, bool enabled = true);

  std::optional<CacheEntry> Get(const CacheKey& key, std::uint64_t epoch);

  // Returns false when the payload was not stored.
  bool Put(const CacheKey& key, std::uint64_t epoch, std::shared_ptr<const QueryResult> payload);

  void InvalidateAll();

  std::uint64_t Epoch() const {
    return epoch_.load(std::memory_order_acquire);
  }

  bool Enabled() const {
    return enabled_;
  }

  CacheStats Stats() const;

 private:
  std::size_t SweepStaleLocked(std::uint64_t current);

  const bool        enabled_;
  const std::size_t max_entries_;

  std::atomic<std::uint64_t> epoch_{0};
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> stale_evictions_{0};

  mutable std::shared_mutex                              mutex_;
  std::unordered_map<CacheKey, CacheEntry, CacheKeyHash> entries_;
};

} // namespace depgraph::cache
