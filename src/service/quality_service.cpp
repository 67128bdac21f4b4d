#include "service/quality_service.h"
#include "core/engine_config.h"
#include "core/errors.h"
#include "core/logger.h"
#include "quality/duplicate_detector.h"
#include "quality/suggestion_generator.h"
#include "quality/violation_engine.h"
#include "storage/duplicate_group_repository.h"
#include "storage/suggestion_repository.h"
#include "storage/violation_repository.h"
#include <algorithm>
#include <filesystem>
#include <map>
#include <system_error>

using json = nlohmann::json;

namespace {
std::optional<std::string> optionalString(const json &request, const char *key) {
  if (!request.contains(key) || request[key].is_null())
    return std::nullopt;
  if (!request[key].is_string())
    throw ValidationError(std::string(key) + " must be a string");
  return request[key].get<std::string>();
}

std::optional<int64_t> optionalInt(const json &request, const char *key) {
  if (!request.contains(key) || request[key].is_null())
    return std::nullopt;
  if (!request[key].is_number_integer())
    throw ValidationError(std::string(key) + " must be an integer");
  return request[key].get<int64_t>();
}

std::optional<bool> optionalBool(const json &request, const char *key) {
  if (!request.contains(key) || request[key].is_null())
    return std::nullopt;
  if (!request[key].is_boolean())
    throw ValidationError(std::string(key) + " must be a boolean");
  return request[key].get<bool>();
}

int64_t requireId(const json &request, const char *key) {
  std::optional<int64_t> value = optionalInt(request, key);
  if (!value)
    throw ValidationError(std::string(key) + " is required");
  if (*value <= 0)
    throw ValidationError(std::string(key) + " must be positive");
  return *value;
}

json errorResponse(const std::string &type, const std::string &message) {
  return json{{"success", false},
              {"error", {{"type", type}, {"message", message}}}};
}

using Handler = json (QualityService::*)(const json &);

const std::map<std::string, Handler> &handlers() {
  static const std::map<std::string, Handler> table = {
      {"start", &QualityService::start},
      {"stop", &QualityService::stop},
      {"status", &QualityService::status},
      {"analyze", &QualityService::analyze},
      {"list_duplicates", &QualityService::listDuplicates},
      {"merge_duplicate_group", &QualityService::mergeDuplicateGroup},
      {"list_violations", &QualityService::listViolations},
      {"resolve_violation", &QualityService::resolveViolation},
      {"list_suggestions", &QualityService::listSuggestions},
      {"apply_suggestion", &QualityService::applySuggestion},
      {"project_stats", &QualityService::projectStats},
      {"database_stats", &QualityService::databaseStats},
      {"cache_stats", &QualityService::cacheStats},
      {"cache_invalidate", &QualityService::cacheInvalidate}};
  return table;
}
} // namespace

QualityService::QualityService(
    std::shared_ptr<NormalizationWorkerPool> pool,
    std::shared_ptr<IProjectDatabaseLookup> lookup,
    std::shared_ptr<ProjectQualityAggregator> aggregator)
    : pool_(std::move(pool)), lookup_(std::move(lookup)),
      aggregator_(aggregator
                      ? std::move(aggregator)
                      : std::make_shared<ProjectQualityAggregator>(lookup_)),
      cache_([agg = aggregator_](int64_t projectId) {
        return agg->getProjectStats(projectId);
      }) {
  if (!pool_) {
    throw std::invalid_argument("QualityService requires a worker pool");
  }
  if (!lookup_) {
    throw std::invalid_argument("QualityService requires a project database "
                                "lookup");
  }
  // A finished run rewrites normalized data, so its project's stats are stale.
  pool_->setRunFinishedListener(
      [this](const std::string &path) { invalidateFor(path); });
}

QualityService::~QualityService() { pool_->setRunFinishedListener(nullptr); }

std::vector<std::string> QualityService::operations() {
  std::vector<std::string> names;
  for (const auto &entry : handlers()) {
    names.push_back(entry.first);
  }
  return names;
}

json QualityService::handle(const std::string &operation, const json &request) {
  try {
    auto it = handlers().find(operation);
    if (it == handlers().end()) {
      throw ValidationError("Unknown operation '" + operation + "'");
    }
    const json body = request.is_null() ? json::object() : request;
    if (!body.is_object()) {
      throw ValidationError("Request must be a JSON object");
    }
    return (this->*(it->second))(body);
  } catch (const QualityError &e) {
    bool clientError = e.type() == ErrorType::VALIDATION ||
                       e.type() == ErrorType::NOT_FOUND ||
                       e.type() == ErrorType::CONFLICT;
    Logger::log(clientError ? LogLevel::WARNING : LogLevel::ERROR,
                LogCategory::QUALITY, "QualityService::handle",
                operation + " failed (" + e.typeName() + "): " + e.what());
    return errorResponse(e.typeName(), e.what());
  } catch (const json::exception &e) {
    Logger::warning(LogCategory::VALIDATION, "QualityService::handle",
                    operation + " rejected: " + std::string(e.what()));
    return errorResponse(errorTypeToString(ErrorType::VALIDATION), e.what());
  } catch (const std::invalid_argument &e) {
    Logger::warning(LogCategory::VALIDATION, "QualityService::handle",
                    operation + " rejected: " + std::string(e.what()));
    return errorResponse(errorTypeToString(ErrorType::VALIDATION), e.what());
  } catch (const std::exception &e) {
    Logger::error(LogCategory::QUALITY, "QualityService::handle",
                  operation + " failed: " + std::string(e.what()));
    return errorResponse(errorTypeToString(ErrorType::INTERNAL), e.what());
  }
}

int64_t QualityService::readLimit(const json &request) {
  std::optional<int64_t> limit = optionalInt(request, "limit");
  if (!limit)
    return DEFAULT_LIMIT;
  return std::clamp<int64_t>(*limit, 1, MAX_LIMIT);
}

int64_t QualityService::readOffset(const json &request) {
  std::optional<int64_t> offset = optionalInt(request, "offset");
  if (!offset)
    return 0;
  if (*offset < 0)
    throw ValidationError("offset must not be negative");
  return *offset;
}

NormalizationScope QualityService::readScope(const json &request) const {
  NormalizationScope scope;
  scope.databasePath = optionalString(request, "database_path");
  scope.databaseId = optionalInt(request, "database_id");
  scope.projectId = optionalInt(request, "project_id");

  std::optional<bool> allActive = optionalBool(request, "all_active");
  if (allActive && *allActive && !scope.projectId) {
    throw ValidationError("all_active requires project_id");
  }
  if (scope.databasePath && scope.databasePath->empty()) {
    throw ValidationError("database_path must not be empty");
  }
  return scope;
}

std::string QualityService::existingDatabasePath(const json &request) const {
  std::optional<std::string> path = optionalString(request, "database_path");
  if (!path || path->empty()) {
    throw ValidationError("database_path is required");
  }
  std::string canonical = TargetDatabase::canonicalPath(*path);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(canonical, ec)) {
    throw NotFoundError("Database not found: " + *path);
  }
  return canonical;
}

void QualityService::invalidateFor(const std::string &path) {
  try {
    std::optional<ProjectDatabase> database = lookup_->findByPath(path);
    if (database) {
      cache_.invalidate(database->projectId);
    }
  } catch (const QualityError &e) {
    Logger::warning(LogCategory::CACHE, "QualityService::invalidateFor",
                    "Project lookup for " + path +
                        " failed, dropping all cached stats: " +
                        std::string(e.what()));
    cache_.invalidateAll();
  }
}

json QualityService::start(const json &request) {
  std::vector<int64_t> ids = pool_->start(readScope(request));
  return json{{"success", true},
              {"message", "Started " + std::to_string(ids.size()) +
                              " normalization session(s)"},
              {"session_ids", ids}};
}

json QualityService::stop(const json &request) {
  StopResult result = pool_->stop(readScope(request));
  std::string message =
      result.wasRunning
          ? "Stop requested for " + std::to_string(result.sessionsSignalled) +
                " session(s)"
          : std::string("No normalization running");
  return json{{"success", true},
              {"message", message},
              {"was_running", result.wasRunning}};
}

json QualityService::status(const json &request) {
  NormalizationScope scope = readScope(request);
  if (scope.databasePath && scope.projectId) {
    throw ValidationError("Specify either database_path or project_id, not "
                          "both");
  }
  return pool_->status(scope);
}

json QualityService::analyze(const json &request) {
  std::string path = existingDatabasePath(request);
  AnalysisResult result = pool_->analyze(path);
  invalidateFor(path);
  return json{{"success", !result.cancelled},
              {"cancelled", result.cancelled},
              {"duplicates_found", result.duplicatesFound},
              {"violations_found", result.violationsFound},
              {"suggestions_found", result.suggestionsFound}};
}

std::vector<QualityService::ListingTarget>
QualityService::listingTargets(const json &request) {
  std::optional<int64_t> projectId = optionalInt(request, "project_id");
  bool hasPath = request.contains("database_path") &&
                 !request["database_path"].is_null();
  if (projectId && hasPath) {
    throw ValidationError("Specify either database_path or project_id, not "
                          "both");
  }

  std::vector<ListingTarget> targets;
  if (projectId) {
    for (const auto &database : lookup_->activeDatabases(*projectId)) {
      targets.push_back(
          {database.id, TargetDatabase::canonicalPath(database.filePath)});
    }
    return targets;
  }
  if (!hasPath) {
    throw ValidationError("database_path or project_id is required");
  }
  targets.push_back(
      {optionalInt(request, "database_id"), existingDatabasePath(request)});
  return targets;
}

// Pages across the databases in id order as if their rows were one list
// sorted by (database_id, id).
json QualityService::listAcross(const json &request, const std::string &table,
                                const std::string &key, const CountFn &count,
                                const PageFn &page) {
  const int64_t limit = readLimit(request);
  const int64_t offset = readOffset(request);
  const bool projectScope = request.contains("project_id") &&
                            !request["project_id"].is_null();
  std::vector<ListingTarget> targets = listingTargets(request);

  json items = json::array();
  json skipped = json::array();
  int64_t total = 0;
  int64_t toSkip = offset;
  int64_t remaining = limit;

  for (const auto &target : targets) {
    try {
      TargetDatabase db(target.path, TargetDatabase::Mode::READ_ONLY);
      if (!db.hasTable(table))
        continue;
      int64_t available = count(db);
      total += available;
      if (remaining <= 0)
        continue;
      if (toSkip >= available) {
        toSkip -= available;
        continue;
      }
      json rows = page(db, remaining, toSkip);
      toSkip = 0;
      for (auto &row : rows) {
        if (target.databaseId)
          row["database_id"] = *target.databaseId;
        row["database_path"] = target.path;
        items.push_back(std::move(row));
        remaining--;
      }
    } catch (const UpstreamError &e) {
      if (!projectScope)
        throw;
      Logger::warning(LogCategory::QUALITY, "QualityService::listAcross",
                      "Skipping " + target.path + ": " + e.what());
      skipped.push_back(json{{"database_id", target.databaseId.value_or(0)},
                             {"file_path", target.path},
                             {"reason", e.what()}});
    }
  }

  json response{{key, items}, {"total", total}, {"limit", limit},
                {"offset", offset}};
  if (!skipped.empty())
    response["skipped_databases"] = skipped;
  return response;
}

json QualityService::listDuplicates(const json &request) {
  DuplicateFilter filter;
  filter.unmergedOnly = optionalBool(request, "unmerged").value_or(false);

  return listAcross(
      request, "quality_duplicate_groups", "groups",
      [&](TargetDatabase &db) {
        return DuplicateGroupRepository(db).count(filter);
      },
      [&](TargetDatabase &db, int64_t limit, int64_t offset) {
        return json(DuplicateGroupRepository(db).list(filter, limit, offset));
      });
}

json QualityService::mergeDuplicateGroup(const json &request) {
  std::string path = existingDatabasePath(request);
  int64_t groupId = requireId(request, "group_id");

  TargetDatabase db(path, TargetDatabase::Mode::READ_WRITE);
  DuplicateDetector().mergeGroup(db, groupId);
  invalidateFor(path);
  return json{{"success", true}};
}

json QualityService::listViolations(const json &request) {
  ViolationFilter filter;
  if (auto severity = optionalString(request, "severity"))
    filter.severity = severityFromString(*severity);
  if (auto category = optionalString(request, "category"))
    filter.category = violationCategoryFromString(*category);
  filter.showResolved = optionalBool(request, "show_resolved").value_or(false);
  filter.search = optionalString(request, "search").value_or("");

  return listAcross(
      request, "quality_violations", "violations",
      [&](TargetDatabase &db) { return ViolationRepository(db).count(filter); },
      [&](TargetDatabase &db, int64_t limit, int64_t offset) {
        return json(ViolationRepository(db).list(filter, limit, offset));
      });
}

json QualityService::resolveViolation(const json &request) {
  std::string path = existingDatabasePath(request);
  int64_t violationId = requireId(request, "id");
  std::string resolvedBy = optionalString(request, "resolved_by").value_or("");

  TargetDatabase db(path, TargetDatabase::Mode::READ_WRITE);
  ViolationEngine().resolveViolation(db, violationId, resolvedBy);
  return json{{"success", true}};
}

json QualityService::listSuggestions(const json &request) {
  SuggestionFilter filter;
  if (auto priority = optionalString(request, "priority"))
    filter.priority = priorityFromString(*priority);
  if (auto type = optionalString(request, "type"))
    filter.type = suggestionTypeFromString(*type);
  filter.applied = optionalBool(request, "applied");
  filter.autoApplyable = optionalBool(request, "auto_applyable");

  return listAcross(
      request, "quality_suggestions", "suggestions",
      [&](TargetDatabase &db) { return SuggestionRepository(db).count(filter); },
      [&](TargetDatabase &db, int64_t limit, int64_t offset) {
        return json(SuggestionRepository(db).list(filter, limit, offset));
      });
}

json QualityService::applySuggestion(const json &request) {
  std::string path = existingDatabasePath(request);
  int64_t suggestionId = requireId(request, "id");

  TargetDatabase db(path, TargetDatabase::Mode::READ_WRITE);
  SuggestionGenerator().applySuggestion(db, suggestionId);
  invalidateFor(path);
  return json{{"success", true}};
}

json QualityService::projectStats(const json &request) {
  int64_t projectId = requireId(request, "project_id");
  if (!EngineConfig::getCacheEnabled()) {
    return aggregator_->getProjectStats(projectId);
  }
  QualityStatsCache::Payload payload = cache_.get(projectId);
  return *payload;
}

json QualityService::databaseStats(const json &request) {
  std::string path = existingDatabasePath(request);
  json response = ProjectQualityAggregator::loadDatabaseStats(path);
  response["database_path"] = path;
  return response;
}

json QualityService::cacheStats(const json &) {
  return json{{"enabled", EngineConfig::getCacheEnabled()},
              {"stats", cache_.stats()}};
}

json QualityService::cacheInvalidate(const json &request) {
  std::optional<int64_t> projectId = optionalInt(request, "project_id");
  if (projectId) {
    cache_.invalidate(*projectId);
  } else {
    cache_.invalidateAll();
  }
  return json{{"success", true}};
}
