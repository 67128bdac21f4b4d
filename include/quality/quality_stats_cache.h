#ifndef QUALITY_STATS_CACHE_H
#define QUALITY_STATS_CACHE_H

#include "core/engine_config.h"
#include "quality/project_quality_aggregator.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <unordered_map>

struct CacheStats {
  size_t totalEntries = 0;
  size_t validEntries = 0;
  size_t expiredEntries = 0;
  int64_t ttlSeconds = 0;
  uint64_t totalHits = 0;
  uint64_t totalMisses = 0;
  uint64_t evictions = 0;
  double hitRate = 0.0;
};

void to_json(nlohmann::json &j, const CacheStats &stats);

struct CacheEntryInfo {
  uint64_t hitCount = 0;
  std::chrono::steady_clock::time_point cachedAt;
  std::chrono::steady_clock::time_point lastAccess;
  bool fresh = false;
};

// Project statistics cache with a fixed TTL and LRU capacity. An entry is
// fresh while now - cached_at <= ttl, however often it is read. Expiry is
// evaluated lazily on access and in stats().
class QualityStatsCache {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;
  using Loader = std::function<ProjectQualityStats(int64_t projectId)>;
  using Payload = std::shared_ptr<const ProjectQualityStats>;

  explicit QualityStatsCache(
      Loader loader,
      std::chrono::seconds ttl =
          std::chrono::seconds(EngineConfig::getCacheTtlSeconds()),
      size_t maxEntries = EngineConfig::getCacheMaxEntries(),
      Clock clock = nullptr);

  // Returns the cached payload on a hit. On a miss the loader runs once per
  // key; concurrent callers for the same key wait for that computation.
  // Loader failures propagate and leave nothing cached.
  Payload get(int64_t projectId);

  void invalidate(int64_t projectId);
  void invalidateAll();

  CacheStats stats() const;
  std::optional<CacheEntryInfo> entryInfo(int64_t projectId) const;

  std::chrono::seconds ttl() const { return ttl_; }

private:
  struct Entry {
    Payload payload;
    std::chrono::steady_clock::time_point cachedAt;
    std::chrono::steady_clock::time_point lastAccess;
    uint64_t hitCount = 0;
    std::list<int64_t>::iterator lruPosition;
  };

  Loader loader_;
  std::chrono::seconds ttl_;
  size_t maxEntries_;
  Clock clock_;

  mutable std::mutex mutex_;
  std::unordered_map<int64_t, Entry> entries_;
  std::list<int64_t> lru_;
  std::unordered_map<int64_t, std::shared_future<Payload>> inFlight_;
  // Invalidation count per key with a load in flight; no entry means zero.
  std::unordered_map<int64_t, uint64_t> keyGenerations_;
  uint64_t globalGeneration_ = 0;
  uint64_t totalHits_ = 0;
  uint64_t totalMisses_ = 0;
  uint64_t evictions_ = 0;

  bool isFresh(const Entry &entry,
               std::chrono::steady_clock::time_point now) const;
  void eraseEntry(int64_t projectId);
  void store(int64_t projectId, Payload payload);
};

#endif
