#include "result_cache.hpp"

#include <mutex>

namespace depgraph::cache {

ResultCache::ResultCache(std::size_t max_entries, bool enabled) : enabled_(enabled), max_entries_(max_entries) {
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<CacheEntry> ResultCache::Get(const CacheKey& key, std::uint64_t epoch) {
  if (!enabled_) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }

  {
    std::shared_lock lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
      misses_.fetch_add(1, std::memory_order_relaxed);
      return std::nullopt;
    }

    if (it->second.epoch == Epoch()) {
      if (it->second.epoch != epoch) {
        // current for the cache, but not for the caller's snapshot
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
      }
      hits_.fetch_add(1, std::memory_order_relaxed);
      return it->second;
    }
  }

  // stale: re-check under the write lock, another reader may have
  // evicted or refilled it meanwhile
  std::unique_lock lock(mutex_);
  misses_.fetch_add(1, std::memory_order_relaxed);

  auto it = entries_.find(key);
  if (it != entries_.end() && it->second.epoch != Epoch()) {
    entries_.erase(it);
    stale_evictions_.fetch_add(1, std::memory_order_relaxed);
  }
  return std::nullopt;
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

bool ResultCache::Put(const CacheKey& key, std::uint64_t epoch, std::shared_ptr<const QueryResult> payload) {
  if (!enabled_ || !payload) {
    return false;
  }

  std::unique_lock lock(mutex_);

  const auto current = Epoch();
  if (epoch != current) {
    return false;
  }

  auto it = entries_.find(key);
  if (it != entries_.end()) {
    it->second = CacheEntry{epoch, std::move(payload)};
    return true;
  }

  if (max_entries_ && entries_.size() >= max_entries_) {
    SweepStaleLocked(current);
    if (entries_.size() >= max_entries_) {
      return false;
    }
  }

  entries_.emplace(key, CacheEntry{epoch, std::move(payload)});
  return true;
}

void ResultCache::InvalidateAll() {
  epoch_.fetch_add(1, std::memory_order_acq_rel);
}

std::size_t ResultCache::SweepStaleLocked(std::uint64_t current) {
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.epoch != current) {
      it = entries_.erase(it);
      ++removed;
      continue;
    }
    ++it;
  }
  stale_evictions_.fetch_add(removed, std::memory_order_relaxed);
  return removed;
}

CacheStats ResultCache::Stats() const {
  CacheStats stats;
  stats.enabled         = enabled_;
  stats.epoch           = Epoch();
  stats.max_entries     = max_entries_;
  stats.hits            = hits_.load(std::memory_order_relaxed);
  stats.misses          = misses_.load(std::memory_order_relaxed);
  stats.stale_evictions = stale_evictions_.load(std::memory_order_relaxed);

  std::shared_lock lock(mutex_);
  stats.entries = entries_.size();
  return stats;
}

} // namespace depgraph::cache
