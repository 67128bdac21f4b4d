#include "quality/quality_stats_cache.h"
#include "core/logger.h"

void to_json(nlohmann::json &j, const CacheStats &stats) {
  j = nlohmann::json{{"total_entries", stats.totalEntries},
                     {"valid_entries", stats.validEntries},
                     {"expired_entries", stats.expiredEntries},
                     {"ttl_seconds", stats.ttlSeconds},
                     {"total_hits", stats.totalHits},
                     {"total_misses", stats.totalMisses},
                     {"evictions", stats.evictions},
                     {"hit_rate", stats.hitRate}};
}

QualityStatsCache::QualityStatsCache(Loader loader, std::chrono::seconds ttl,
                                     size_t maxEntries, Clock clock)
    : loader_(std::move(loader)), ttl_(ttl), maxEntries_(maxEntries),
      clock_(std::move(clock)) {
  if (!loader_) {
    throw std::invalid_argument("QualityStatsCache requires a loader");
  }
  if (ttl_.count() <= 0) {
    throw std::invalid_argument("Cache TTL must be positive");
  }
  if (maxEntries_ == 0) {
    throw std::invalid_argument("Cache capacity must be positive");
  }
  if (!clock_) {
    clock_ = [] { return std::chrono::steady_clock::now(); };
  }
}

bool QualityStatsCache::isFresh(const Entry &entry,
                                std::chrono::steady_clock::time_point now) const {
  return now - entry.cachedAt <= ttl_;
}

void QualityStatsCache::eraseEntry(int64_t projectId) {
  auto it = entries_.find(projectId);
  if (it == entries_.end())
    return;
  lru_.erase(it->second.lruPosition);
  entries_.erase(it);
}

void QualityStatsCache::store(int64_t projectId, Payload payload) {
  eraseEntry(projectId);
  auto now = clock_();
  lru_.push_front(projectId);

  Entry entry;
  entry.payload = std::move(payload);
  entry.cachedAt = now;
  entry.lastAccess = now;
  entry.lruPosition = lru_.begin();
  entries_.emplace(projectId, std::move(entry));

  while (entries_.size() > maxEntries_) {
    int64_t victim = lru_.back();
    eraseEntry(victim);
    evictions_++;
    Logger::debug(LogCategory::CACHE, "QualityStatsCache::store",
                  "Evicted project " + std::to_string(victim));
  }
}

QualityStatsCache::Payload QualityStatsCache::get(int64_t projectId) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto now = clock_();

  auto it = entries_.find(projectId);
  if (it != entries_.end() && isFresh(it->second, now)) {
    Entry &entry = it->second;
    entry.hitCount++;
    entry.lastAccess = now;
    lru_.splice(lru_.begin(), lru_, entry.lruPosition);
    totalHits_++;
    return entry.payload;
  }

  totalMisses_++;
  auto pending = inFlight_.find(projectId);
  if (pending != inFlight_.end()) {
    std::shared_future<Payload> shared = pending->second;
    lock.unlock();
    return shared.get();
  }

  std::promise<Payload> promise;
  inFlight_[projectId] = promise.get_future().share();
  uint64_t keyGeneration = 0;
  uint64_t globalGeneration = globalGeneration_;
  lock.unlock();

  Payload payload;
  try {
    payload = std::make_shared<const ProjectQualityStats>(loader_(projectId));
  } catch (const std::exception &e) {
    Logger::warning(LogCategory::CACHE, "QualityStatsCache::get",
                    "Recomputing project " + std::to_string(projectId) +
                        " failed: " + std::string(e.what()));
    lock.lock();
    inFlight_.erase(projectId);
    keyGenerations_.erase(projectId);
    lock.unlock();
    promise.set_exception(std::current_exception());
    throw;
  }

  lock.lock();
  inFlight_.erase(projectId);
  // A result computed across an invalidation is handed out but not kept.
  auto generation = keyGenerations_.find(projectId);
  bool invalidated = generation != keyGenerations_.end() &&
                     generation->second != keyGeneration;
  if (generation != keyGenerations_.end())
    keyGenerations_.erase(generation);
  if (!invalidated && globalGeneration_ == globalGeneration) {
    store(projectId, payload);
  }
  lock.unlock();

  promise.set_value(payload);
  return payload;
}

void QualityStatsCache::invalidate(int64_t projectId) {
  std::lock_guard<std::mutex> lock(mutex_);
  eraseEntry(projectId);
  // Generations are only tracked while a load for the key is running.
  if (inFlight_.count(projectId) > 0)
    keyGenerations_[projectId]++;
  Logger::debug(LogCategory::CACHE, "QualityStatsCache::invalidate",
                "Invalidated project " + std::to_string(projectId));
}

void QualityStatsCache::invalidateAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  lru_.clear();
  globalGeneration_++;
  Logger::debug(LogCategory::CACHE, "QualityStatsCache::invalidateAll",
                "Invalidated all entries");
}

CacheStats QualityStatsCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = clock_();
  CacheStats stats;
  stats.totalEntries = entries_.size();
  for (const auto &entry : entries_) {
    if (isFresh(entry.second, now))
      stats.validEntries++;
  }
  stats.expiredEntries = stats.totalEntries - stats.validEntries;
  stats.ttlSeconds = ttl_.count();
  stats.totalHits = totalHits_;
  stats.totalMisses = totalMisses_;
  stats.evictions = evictions_;
  uint64_t requests = totalHits_ + totalMisses_;
  stats.hitRate = requests > 0 ? static_cast<double>(totalHits_) /
                                     static_cast<double>(requests)
                               : 0.0;
  return stats;
}

std::optional<CacheEntryInfo>
QualityStatsCache::entryInfo(int64_t projectId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(projectId);
  if (it == entries_.end())
    return std::nullopt;
  CacheEntryInfo info;
  info.hitCount = it->second.hitCount;
  info.cachedAt = it->second.cachedAt;
  info.lastAccess = it->second.lastAccess;
  info.fresh = isFresh(it->second, clock_());
  return info;
}
