#ifndef PROJECT_QUALITY_AGGREGATOR_H
#define PROJECT_QUALITY_AGGREGATOR_H

#include "concurrency/task_thread_pool.h"
#include "core/engine_config.h"
#include "quality/quality_models.h"
#include "storage/project_database_lookup.h"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct DatabaseQualityStats {
  ProjectDatabase database;
  QualityStats stats;
};

struct SkippedDatabase {
  ProjectDatabase database;
  std::string reason;
};

struct ProjectQualityStats {
  int64_t projectId = 0;
  QualityStats combined;
  std::vector<DatabaseQualityStats> databases;
  std::vector<SkippedDatabase> skipped;
  std::string computedAt;
};

void to_json(nlohmann::json &j, const DatabaseQualityStats &entry);
void to_json(nlohmann::json &j, const SkippedDatabase &entry);
void to_json(nlohmann::json &j, const ProjectQualityStats &stats);

// Computes project statistics by reading every active database of the project
// in parallel. Databases that fail or miss the deadline are reported as
// skipped; the call itself only fails when the project cannot be enumerated.
class ProjectQualityAggregator {
public:
  using DatabaseStatsLoader =
      std::function<QualityStats(const ProjectDatabase &)>;

  static constexpr std::chrono::seconds BASE_DEADLINE{30};
  static constexpr std::chrono::seconds PER_DATABASE_DEADLINE{5};
  static constexpr std::chrono::seconds MAX_DEADLINE{120};

  // A null loader reads each file with loadDatabaseStats().
  ProjectQualityAggregator(std::shared_ptr<IProjectDatabaseLookup> lookup,
                           size_t workers = EngineConfig::getAggregatorWorkers(),
                           DatabaseStatsLoader loader = nullptr);
  ~ProjectQualityAggregator();

  ProjectQualityAggregator(const ProjectQualityAggregator &) = delete;
  ProjectQualityAggregator &operator=(const ProjectQualityAggregator &) = delete;

  ProjectQualityStats getProjectStats(int64_t projectId);

  // Opens the database read-only. A database without normalized records
  // yields zero statistics; an unreadable file throws UpstreamError.
  static QualityStats loadDatabaseStats(const std::string &path);

  // Sums counts and weights averages by item count.
  static QualityStats combine(const std::vector<QualityStats> &parts);

  static std::chrono::milliseconds deadlineFor(size_t databaseCount);

  // Replaces the computed deadline; nullopt restores it.
  void setDeadline(std::optional<std::chrono::milliseconds> deadline);

private:
  std::shared_ptr<IProjectDatabaseLookup> lookup_;
  DatabaseStatsLoader loader_;
  std::unique_ptr<TaskThreadPool> pool_;
  std::mutex deadlineMutex_;
  std::optional<std::chrono::milliseconds> deadlineOverride_;
};

#endif
