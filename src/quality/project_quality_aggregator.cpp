#include "quality/project_quality_aggregator.h"
#include "core/errors.h"
#include "core/logger.h"
#include "storage/normalized_record_repository.h"
#include "storage/target_database.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <future>

namespace {
nlohmann::json databaseJson(const ProjectDatabase &database) {
  return nlohmann::json{{"database_id", database.id},
                        {"name", database.name},
                        {"file_path", database.filePath}};
}
} // namespace

void to_json(nlohmann::json &j, const DatabaseQualityStats &entry) {
  j = databaseJson(entry.database);
  j["stats"] = entry.stats;
}

void to_json(nlohmann::json &j, const SkippedDatabase &entry) {
  j = databaseJson(entry.database);
  j["reason"] = entry.reason;
}

void to_json(nlohmann::json &j, const ProjectQualityStats &stats) {
  j = stats.combined;
  j["project_id"] = stats.projectId;
  j["databases"] = stats.databases;
  j["skipped_databases"] = stats.skipped;
  j["computed_at"] = stats.computedAt;
}

ProjectQualityAggregator::ProjectQualityAggregator(
    std::shared_ptr<IProjectDatabaseLookup> lookup, size_t workers,
    DatabaseStatsLoader loader)
    : lookup_(std::move(lookup)), loader_(std::move(loader)),
      pool_(std::make_unique<TaskThreadPool>("quality-aggregator", workers)) {
  if (!lookup_) {
    throw std::invalid_argument("ProjectQualityAggregator requires a project "
                                "database lookup");
  }
  if (!loader_) {
    loader_ = [](const ProjectDatabase &database) {
      return loadDatabaseStats(database.filePath);
    };
  }
}

ProjectQualityAggregator::~ProjectQualityAggregator() { pool_->shutdown(); }

std::chrono::milliseconds
ProjectQualityAggregator::deadlineFor(size_t databaseCount) {
  auto deadline = BASE_DEADLINE +
                  PER_DATABASE_DEADLINE * static_cast<int64_t>(databaseCount);
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::min<std::chrono::seconds>(deadline, MAX_DEADLINE));
}

void ProjectQualityAggregator::setDeadline(
    std::optional<std::chrono::milliseconds> deadline) {
  std::lock_guard<std::mutex> lock(deadlineMutex_);
  deadlineOverride_ = deadline;
}

QualityStats ProjectQualityAggregator::loadDatabaseStats(const std::string &path) {
  TargetDatabase db(path, TargetDatabase::Mode::READ_ONLY);
  if (!db.hasTable("normalized_data")) {
    return QualityStats{};
  }
  return NormalizedRecordRepository(db).computeStats();
}

QualityStats
ProjectQualityAggregator::combine(const std::vector<QualityStats> &parts) {
  QualityStats combined;
  double qualitySum = 0.0;
  const ProcessingLevel levels[] = {ProcessingLevel::BASIC,
                                    ProcessingLevel::AI_ENHANCED,
                                    ProcessingLevel::BENCHMARK};

  for (ProcessingLevel level : levels) {
    LevelStats &target = combined.level(level);
    double levelSum = 0.0;
    for (const auto &part : parts) {
      const LevelStats &source = part.level(level);
      target.count += source.count;
      levelSum += source.avgQuality * static_cast<double>(source.count);
    }
    if (target.count > 0)
      target.avgQuality = levelSum / static_cast<double>(target.count);
    combined.totalItems += target.count;
    qualitySum += levelSum;
  }

  if (combined.totalItems > 0) {
    double total = static_cast<double>(combined.totalItems);
    for (ProcessingLevel level : levels) {
      LevelStats &target = combined.level(level);
      target.percentage = static_cast<double>(target.count) / total * 100.0;
    }
    combined.averageQuality = qualitySum / total;
  }
  combined.benchmarkCount = combined.benchmark.count;
  combined.benchmarkPercentage = combined.benchmark.percentage;
  return combined;
}

ProjectQualityStats ProjectQualityAggregator::getProjectStats(int64_t projectId) {
  std::vector<ProjectDatabase> databases = lookup_->activeDatabases(projectId);

  std::chrono::milliseconds budget = deadlineFor(databases.size());
  {
    std::lock_guard<std::mutex> lock(deadlineMutex_);
    if (deadlineOverride_)
      budget = *deadlineOverride_;
  }
  auto deadline = std::chrono::steady_clock::now() + budget;

  // Tasks own their promise, so a straggler that outlives the deadline only
  // writes into state nobody waits on any more.
  std::vector<std::future<QualityStats>> futures;
  std::vector<bool> submitted;
  for (const auto &database : databases) {
    auto promise = std::make_shared<std::promise<QualityStats>>();
    futures.push_back(promise->get_future());
    DatabaseStatsLoader loader = loader_;
    bool queued = pool_->submit(
        "stats " + database.filePath, [promise, loader, database]() {
          try {
            promise->set_value(loader(database));
          } catch (const std::exception &) {
            promise->set_exception(std::current_exception());
          }
        });
    submitted.push_back(queued);
  }

  ProjectQualityStats result;
  result.projectId = projectId;
  std::vector<QualityStats> parts;
  for (size_t i = 0; i < databases.size(); ++i) {
    const ProjectDatabase &database = databases[i];
    if (!submitted[i]) {
      result.skipped.push_back({database, "aggregator is shutting down"});
      continue;
    }
    if (futures[i].wait_until(deadline) != std::future_status::ready) {
      result.skipped.push_back({database, "deadline exceeded"});
      continue;
    }
    try {
      QualityStats stats = futures[i].get();
      parts.push_back(stats);
      result.databases.push_back({database, stats});
    } catch (const std::exception &e) {
      result.skipped.push_back({database, e.what()});
    }
  }

  for (const auto &skipped : result.skipped) {
    Logger::warning(LogCategory::QUALITY,
                    "ProjectQualityAggregator::getProjectStats",
                    "Skipping database " + std::to_string(skipped.database.id) +
                        " (" + skipped.database.filePath +
                        "): " + skipped.reason);
  }

  result.combined = combine(parts);
  result.computedAt = TimeUtils::nowIso8601Utc();
  Logger::info(LogCategory::QUALITY, "ProjectQualityAggregator::getProjectStats",
               "Project " + std::to_string(projectId) + ": " +
                   std::to_string(result.databases.size()) + "/" +
                   std::to_string(databases.size()) + " databases, " +
                   std::to_string(result.combined.totalItems) + " items");
  return result;
}
