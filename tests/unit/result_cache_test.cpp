#include "internal/cache/result_cache.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

using depgraph::cache::CacheKey;
using depgraph::cache::QueryKind;
using depgraph::cache::QueryResult;
using depgraph::cache::ResultCache;
using depgraph::model::VersionKey;
using depgraph::query::ImpactEntry;

std::shared_ptr<const QueryResult> ImpactOf(const std::string& contract) {
  return std::make_shared<const QueryResult>(std::vector<ImpactEntry>{{VersionKey{contract, "1"}, 1}});
}

CacheKey Key(const std::string& subject) {
  return CacheKey{QueryKind::kImpact, subject};
}

void TestHitAtCurrentEpoch() {
  ResultCache cache;
  assert(cache.Put(Key("a"), 0, ImpactOf("b")));

  const auto entry = cache.Get(Key("a"), cache.Epoch());
  assert(entry);
  assert(entry->epoch == 0);
  const auto& impact = std::get<std::vector<ImpactEntry>>(*entry->payload);
  assert(impact.size() == 1);
  assert(impact[0].version.contract_id == "b");

  const auto stats = cache.Stats();
  assert(stats.hits == 1);
  assert(stats.misses == 0);
  assert(stats.entries == 1);
}

void TestReaderAheadOfCacheCountsAMiss() {
  ResultCache cache;
  assert(cache.Put(Key("a"), 0, ImpactOf("b")));

  // a snapshot at epoch 1 is live but InvalidateAll has not run yet
  assert(!cache.Get(Key("a"), 1));

  auto stats = cache.Stats();
  assert(stats.hits == 0);
  assert(stats.misses == 1);
  assert(stats.entries == 1);

  assert(cache.Get(Key("a"), 0));
  stats = cache.Stats();
  assert(stats.hits == 1);
  assert(stats.misses == 1);
}

void TestKindsDoNotCollide() {
  ResultCache cache;
  assert(cache.Put(Key("a"), 0, ImpactOf("b")));
  assert(!cache.Get(CacheKey{QueryKind::kDependents, "a"}, 0));
}

void TestInvalidateAllHidesOldEntries() {
  ResultCache cache;
  assert(cache.Put(Key("a"), 0, ImpactOf("b")));

  cache.InvalidateAll();
  assert(cache.Epoch() == 1);

  // storage is untouched until the stale entry is looked up
  assert(cache.Stats().entries == 1);
  assert(!cache.Get(Key("a"), cache.Epoch()));

  const auto stats = cache.Stats();
  assert(stats.entries == 0);
  assert(stats.stale_evictions == 1);
  assert(stats.misses == 1);
}

void TestPutForOldEpochIsDropped() {
  ResultCache cache;
  cache.InvalidateAll();

  assert(!cache.Put(Key("a"), 0, ImpactOf("b")));
  assert(!cache.Get(Key("a"), cache.Epoch()));

  assert(cache.Put(Key("a"), 1, ImpactOf("c")));
  assert(cache.Get(Key("a"), cache.Epoch()));
}

void TestPutForFutureEpochIsDropped() {
  ResultCache cache;
  assert(!cache.Put(Key("a"), 5, ImpactOf("b")));
  assert(cache.Stats().entries == 0);
}

void TestBoundedCacheSweepsThenDeclines() {
  ResultCache cache(2);
  assert(cache.Put(Key("a"), 0, ImpactOf("x")));
  assert(cache.Put(Key("b"), 0, ImpactOf("x")));
  assert(!cache.Put(Key("c"), 0, ImpactOf("x")));

  // replacing an existing key does not need room
  assert(cache.Put(Key("a"), 0, ImpactOf("y")));

  cache.InvalidateAll();
  assert(cache.Put(Key("c"), 1, ImpactOf("x")));

  const auto stats = cache.Stats();
  assert(stats.entries == 1);
  assert(stats.stale_evictions == 2);
  assert(stats.max_entries == 2);
}

void TestDisabledCacheStoresNothing() {
  ResultCache cache(0, false);
  assert(!cache.Enabled());
  assert(!cache.Put(Key("a"), 0, ImpactOf("b")));
  assert(!cache.Get(Key("a"), cache.Epoch()));

  const auto stats = cache.Stats();
  assert(!stats.enabled);
  assert(stats.misses == 1);
  assert(stats.HitRatePercent() == 0.0);
}

void TestNullPayloadIsRejected() {
  ResultCache cache;
  assert(!cache.Put(Key("a"), 0, nullptr));
}

void TestConcurrentFillAndInvalidate() {
  ResultCache cache;

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, t] {
      for (int i = 0; i < 2000; ++i) {
        const auto epoch = cache.Epoch();
        const auto key   = Key("k" + std::to_string((t * 7 + i) % 16));
        cache.Put(key, epoch, ImpactOf("x"));
        if (auto entry = cache.Get(key, epoch)) {
          assert(entry->epoch <= cache.Epoch());
        }
      }
    });
  }
  threads.emplace_back([&cache] {
    for (int i = 0; i < 200; ++i) {
      cache.InvalidateAll();
      std::this_thread::yield();
    }
  });

  for (auto& thread : threads) {
    thread.join();
  }

  assert(cache.Epoch() == 200);
  const auto current = cache.Epoch();
  for (int i = 0; i < 16; ++i) {
    if (auto entry = cache.Get(Key("k" + std::to_string(i)), current)) {
      assert(entry->epoch == current);
    }
  }
}

} // namespace

int main() {
  TestHitAtCurrentEpoch();
  TestReaderAheadOfCacheCountsAMiss();
  TestKindsDoNotCollide();
  TestInvalidateAllHidesOldEntries();
  TestPutForOldEpochIsDropped();
  TestPutForFutureEpochIsDropped();
  TestBoundedCacheSweepsThenDeclines();
  TestDisabledCacheStoresNothing();
  TestNullPayloadIsRejected();
  TestConcurrentFillAndInvalidate();

  std::cout << "depgraph_unit_result_cache: pass\n";
  return 0;
}
