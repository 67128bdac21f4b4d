#ifndef QUALITY_SERVICE_H
#define QUALITY_SERVICE_H

#include "normalization/normalization_worker_pool.h"
#include "quality/project_quality_aggregator.h"
#include "quality/quality_stats_cache.h"
#include "storage/project_database_lookup.h"
#include "storage/target_database.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// JSON request/response facade over the worker pool, the quality components
// and the statistics cache. Operation methods throw QualityError subclasses;
// handle() turns every failure into {success:false, error:{type, message}}.
class QualityService {
public:
  static constexpr int64_t DEFAULT_LIMIT = 50;
  static constexpr int64_t MAX_LIMIT = 1000;

  // A null aggregator is built from the lookup.
  QualityService(std::shared_ptr<NormalizationWorkerPool> pool,
                 std::shared_ptr<IProjectDatabaseLookup> lookup,
                 std::shared_ptr<ProjectQualityAggregator> aggregator = nullptr);
  ~QualityService();

  QualityService(const QualityService &) = delete;
  QualityService &operator=(const QualityService &) = delete;

  nlohmann::json handle(const std::string &operation,
                        const nlohmann::json &request);

  static std::vector<std::string> operations();

  nlohmann::json start(const nlohmann::json &request);
  nlohmann::json stop(const nlohmann::json &request);
  nlohmann::json status(const nlohmann::json &request);
  nlohmann::json analyze(const nlohmann::json &request);

  nlohmann::json listDuplicates(const nlohmann::json &request);
  nlohmann::json mergeDuplicateGroup(const nlohmann::json &request);
  nlohmann::json listViolations(const nlohmann::json &request);
  nlohmann::json resolveViolation(const nlohmann::json &request);
  nlohmann::json listSuggestions(const nlohmann::json &request);
  nlohmann::json applySuggestion(const nlohmann::json &request);

  nlohmann::json projectStats(const nlohmann::json &request);
  nlohmann::json databaseStats(const nlohmann::json &request);
  nlohmann::json cacheStats(const nlohmann::json &request);
  nlohmann::json cacheInvalidate(const nlohmann::json &request);

  // Default 50, clamped to [1, 1000].
  static int64_t readLimit(const nlohmann::json &request);
  // Default 0; negative values are a ValidationError.
  static int64_t readOffset(const nlohmann::json &request);

  QualityStatsCache &cache() { return cache_; }

private:
  struct ListingTarget {
    std::optional<int64_t> databaseId;
    std::string path;
  };

  using CountFn = std::function<int64_t(TargetDatabase &)>;
  using PageFn = std::function<nlohmann::json(TargetDatabase &, int64_t limit,
                                              int64_t offset)>;

  std::shared_ptr<NormalizationWorkerPool> pool_;
  std::shared_ptr<IProjectDatabaseLookup> lookup_;
  std::shared_ptr<ProjectQualityAggregator> aggregator_;
  QualityStatsCache cache_;

  NormalizationScope readScope(const nlohmann::json &request) const;
  std::vector<ListingTarget> listingTargets(const nlohmann::json &request);
  nlohmann::json listAcross(const nlohmann::json &request,
                            const std::string &table, const std::string &key,
                            const CountFn &count, const PageFn &page);
  std::string existingDatabasePath(const nlohmann::json &request) const;
  void invalidateFor(const std::string &path);
};

#endif
