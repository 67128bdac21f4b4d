#include "normalization/normalization_worker_pool.h"
#include "core/errors.h"
#include "core/logger.h"
#include "storage/catalog_item_reader.h"
#include "storage/normalized_record_repository.h"
#include "storage/target_database.h"
#include <algorithm>
#include <set>

namespace {
// Releases the registry reservation of a path when the worker leaves.
class RunReservation {
  RunRegistry &registry_;
  std::string path_;

public:
  RunReservation(RunRegistry &registry, std::string path)
      : registry_(registry), path_(std::move(path)) {}
  ~RunReservation() { registry_.release(path_); }

  RunReservation(const RunReservation &) = delete;
  RunReservation &operator=(const RunReservation &) = delete;
};

NormalizationStatus summarize(std::vector<NormalizationSession> sessions) {
  NormalizationStatus status;
  if (sessions.empty())
    return status;

  bool allCompleted = true;
  std::string errors;
  const NormalizationSession *runningSession = nullptr;
  for (const auto &session : sessions) {
    status.processed += session.processed;
    status.total += session.total;
    status.failedItems += session.failedItems;
    status.duplicatesFound += session.duplicatesFound;
    status.violationsFound += session.violationsFound;
    status.suggestionsFound += session.suggestionsFound;
    if (session.status == SessionStatus::RUNNING) {
      status.isRunning = true;
      if (!runningSession)
        runningSession = &session;
    }
    if (session.status != SessionStatus::COMPLETED)
      allCompleted = false;
    if (!session.errorMessage.empty()) {
      if (!errors.empty())
        errors += "; ";
      errors += session.errorMessage;
    }
  }

  if (status.total > 0) {
    status.progress = std::min(100.0, static_cast<double>(status.processed) /
                                          static_cast<double>(status.total) *
                                          100.0);
  } else if (allCompleted) {
    status.progress = 100.0;
  }
  status.currentStep = runningSession ? runningSession->currentStep
                                      : sessions.back().currentStep;
  if (!errors.empty())
    status.error = errors;
  status.sessions = std::move(sessions);
  return status;
}
} // namespace

void to_json(nlohmann::json &j, const NormalizationStatus &status) {
  j = nlohmann::json{{"is_running", status.isRunning},
                     {"progress", status.progress},
                     {"processed", status.processed},
                     {"total", status.total},
                     {"failed_items", status.failedItems},
                     {"current_step", status.currentStep},
                     {"duplicates_found", status.duplicatesFound},
                     {"violations_found", status.violationsFound},
                     {"suggestions_found", status.suggestionsFound},
                     {"sessions", status.sessions}};
  if (status.error)
    j["error"] = *status.error;
}

NormalizationWorkerPool::NormalizationWorkerPool(
    std::shared_ptr<ISessionStore> store,
    std::shared_ptr<IProjectDatabaseLookup> lookup,
    std::shared_ptr<IConfidenceScorer> scorer, size_t maxWorkers)
    : store_(std::move(store)), lookup_(std::move(lookup)),
      normalizer_(std::move(scorer)),
      pool_(std::make_unique<TaskThreadPool>("normalization", maxWorkers)) {
  if (!store_) {
    throw std::invalid_argument("NormalizationWorkerPool requires a session "
                                "store");
  }
  try {
    store_->expireStaleSessions();
  } catch (const QualityError &e) {
    Logger::warning(LogCategory::NORMALIZATION, "NormalizationWorkerPool",
                    "Stale session check at startup failed: " +
                        std::string(e.what()));
  }
}

NormalizationWorkerPool::~NormalizationWorkerPool() { shutdown(); }

void NormalizationWorkerPool::shutdown() {
  size_t cancelled = registry_.cancelAll();
  if (cancelled > 0) {
    Logger::info(LogCategory::NORMALIZATION,
                 "NormalizationWorkerPool::shutdown",
                 "Cancelling " + std::to_string(cancelled) + " running session(s)");
  }
  pool_->shutdown();
}

bool NormalizationWorkerPool::waitForIdle(std::chrono::milliseconds timeout) {
  return registry_.waitUntilEmpty(timeout);
}

void NormalizationWorkerPool::expireStaleSessions() {
  store_->expireStaleSessions();
}

void NormalizationWorkerPool::markQueued(int64_t sessionId, bool queued) {
  std::lock_guard<std::mutex> lock(queuedMutex_);
  if (queued)
    queuedSessions_.insert(sessionId);
  else
    queuedSessions_.erase(sessionId);
}

void NormalizationWorkerPool::setRunFinishedListener(
    RunFinishedListener listener) {
  std::lock_guard<std::mutex> lock(listenerMutex_);
  runFinished_ = std::move(listener);
}

void NormalizationWorkerPool::notifyRunFinished(const std::string &path) {
  std::lock_guard<std::mutex> lock(listenerMutex_);
  if (!runFinished_)
    return;
  try {
    runFinished_(path);
  } catch (const std::exception &e) {
    Logger::warning(LogCategory::NORMALIZATION,
                    "NormalizationWorkerPool::notifyRunFinished",
                    "Run listener failed for " + path + ": " +
                        std::string(e.what()));
  }
}

// Returns false once the session has left the running state (expired or
// finished elsewhere); the worker must not write anything after that.
bool NormalizationWorkerPool::reportProgress(int64_t sessionId,
                                             const SessionProgress &progress) {
  if (!store_->updateProgress(sessionId, progress))
    return false;

  std::vector<int64_t> waiting;
  {
    std::lock_guard<std::mutex> lock(queuedMutex_);
    waiting.assign(queuedSessions_.begin(), queuedSessions_.end());
  }
  if (!waiting.empty()) {
    try {
      store_->touchSessions(waiting);
    } catch (const QualityError &e) {
      Logger::warning(LogCategory::NORMALIZATION,
                      "NormalizationWorkerPool::reportProgress",
                      "Cannot refresh " + std::to_string(waiting.size()) +
                          " queued session(s): " + std::string(e.what()));
    }
  }
  return true;
}

std::vector<SessionTarget>
NormalizationWorkerPool::resolveTargets(const NormalizationScope &scope) {
  std::vector<SessionTarget> targets;

  if (scope.projectId) {
    if (!lookup_) {
      throw InternalError("No project database lookup configured");
    }
    std::set<std::string> seen;
    for (const auto &database : lookup_->activeDatabases(*scope.projectId)) {
      std::string path = TargetDatabase::canonicalPath(database.filePath);
      if (!seen.insert(path).second)
        continue;
      targets.push_back(SessionTarget{database.id, database.projectId, path});
    }
    if (targets.empty()) {
      throw ValidationError("Project " + std::to_string(*scope.projectId) +
                            " has no active databases");
    }
    return targets;
  }

  SessionTarget target;
  target.databasePath = TargetDatabase::canonicalPath(*scope.databasePath);
  target.databaseId = scope.databaseId;
  if (lookup_) {
    std::optional<ProjectDatabase> known = lookup_->findByPath(target.databasePath);
    if (known) {
      if (!target.databaseId)
        target.databaseId = known->id;
      target.projectId = known->projectId;
    }
  }
  targets.push_back(target);
  return targets;
}

std::vector<int64_t>
NormalizationWorkerPool::start(const NormalizationScope &scope) {
  if (scope.databasePath && scope.projectId) {
    throw ValidationError("Specify either database_path or project_id, not "
                          "both");
  }
  if (scope.isGlobal()) {
    throw ValidationError("Start requires database_path or project_id");
  }
  if (scope.databasePath && scope.databasePath->empty()) {
    throw ValidationError("database_path must not be empty");
  }

  expireStaleSessions();
  std::vector<SessionTarget> targets = resolveTargets(scope);
  std::vector<std::string> paths;
  for (const auto &target : targets) {
    paths.push_back(target.databasePath);
  }

  std::optional<std::string> busy = registry_.reserve(
      paths, scope.projectId ? scope.projectId : targets.front().projectId);
  if (busy) {
    throw ConflictError("Normalization already running for " + *busy);
  }

  std::vector<NormalizationSession> sessions;
  try {
    sessions = store_->createSessions(
        targets,
        static_cast<int64_t>(EngineConfig::getSessionTimeoutSeconds()));
  } catch (const std::exception &) {
    registry_.release(paths);
    throw;
  }

  std::vector<int64_t> ids;
  for (const auto &session : sessions) {
    std::shared_ptr<CancellationToken> token =
        registry_.attach(session.databasePath, session.id);
    ids.push_back(session.id);
    markQueued(session.id, true);

    bool queued = pool_->submit(
        "normalize " + session.databasePath,
        [this, path = session.databasePath, id = session.id, token]() {
          runSession(path, id, token);
        });
    if (!queued) {
      markQueued(session.id, false);
      registry_.release(session.databasePath);
      try {
        store_->finishSession(session.id, SessionStatus::FAILED,
                              "Worker pool is shutting down");
      } catch (const std::exception &e) {
        Logger::error(LogCategory::NORMALIZATION,
                      "NormalizationWorkerPool::start",
                      "Cannot mark session " + std::to_string(session.id) +
                          " failed: " + std::string(e.what()));
      }
    }
  }

  Logger::info(LogCategory::NORMALIZATION, "NormalizationWorkerPool::start",
               "Started " + std::to_string(ids.size()) +
                   " normalization session(s)");
  return ids;
}

StopResult NormalizationWorkerPool::stop(const NormalizationScope &scope) {
  StopResult result;
  if (scope.databasePath) {
    result.sessionsSignalled =
        registry_.cancel(TargetDatabase::canonicalPath(*scope.databasePath));
  } else if (scope.projectId) {
    result.sessionsSignalled = registry_.cancelProject(*scope.projectId);
  } else {
    result.sessionsSignalled = registry_.cancelAll();
  }
  result.wasRunning = result.sessionsSignalled > 0;

  if (result.wasRunning) {
    Logger::info(LogCategory::NORMALIZATION, "NormalizationWorkerPool::stop",
                 "Stop requested for " +
                     std::to_string(result.sessionsSignalled) + " session(s)");
  }
  return result;
}

NormalizationStatus
NormalizationWorkerPool::status(const NormalizationScope &scope) {
  expireStaleSessions();

  std::vector<NormalizationSession> sessions;
  if (scope.databasePath) {
    std::string path = TargetDatabase::canonicalPath(*scope.databasePath);
    std::optional<RunEntry> live = registry_.find(path);
    std::optional<NormalizationSession> session =
        (live && live->sessionId > 0) ? store_->getSession(live->sessionId)
                                      : store_->latestForDatabase(path);
    if (session)
      sessions.push_back(*session);
  } else if (scope.projectId) {
    sessions = store_->latestForProject(*scope.projectId);
  } else {
    for (const auto &run : registry_.allRuns()) {
      if (run.sessionId <= 0)
        continue;
      std::optional<NormalizationSession> session =
          store_->getSession(run.sessionId);
      if (session)
        sessions.push_back(*session);
    }
    if (sessions.empty()) {
      std::optional<NormalizationSession> latest = store_->latestSession();
      if (latest)
        sessions.push_back(*latest);
    }
  }
  return summarize(std::move(sessions));
}

AnalysisResult NormalizationWorkerPool::analyze(const std::string &databasePath) {
  if (databasePath.empty()) {
    throw ValidationError("database_path must not be empty");
  }
  std::string path = TargetDatabase::canonicalPath(databasePath);
  std::optional<std::string> busy = registry_.reserve({path}, std::nullopt);
  if (busy) {
    throw ConflictError("Normalization already running for " + *busy);
  }
  RunReservation reservation(registry_, path);
  LogContextScope logContext(0, path);
  std::shared_ptr<CancellationToken> token = registry_.attach(path, 0);

  TargetDatabase db(path, TargetDatabase::Mode::READ_WRITE);
  AnalysisResult result = analyzer_.analyze(db, token.get());
  Logger::info(LogCategory::QUALITY, "NormalizationWorkerPool::analyze",
               "Analyzed " + path + ": " +
                   std::to_string(result.duplicatesFound) + " duplicates, " +
                   std::to_string(result.violationsFound) + " violations, " +
                   std::to_string(result.suggestionsFound) + " suggestions");
  return result;
}

void NormalizationWorkerPool::runSession(
    const std::string &path, int64_t sessionId,
    std::shared_ptr<CancellationToken> token) {
  RunReservation reservation(registry_, path);
  LogContextScope logContext(sessionId, path);
  markQueued(sessionId, false);
  SessionProgress progress;
  progress.currentStep = "opening";
  bool lost = false;

  try {
    if (!reportProgress(sessionId, progress)) {
      Logger::warning(LogCategory::NORMALIZATION,
                      "NormalizationWorkerPool::runSession",
                      "Session " + std::to_string(sessionId) +
                          " is no longer running, skipping " + path);
      return;
    }

    TargetDatabase db(path, TargetDatabase::Mode::READ_WRITE);
    CatalogItemReader reader(db);
    NormalizedRecordRepository records(db);

    progress.total = reader.countItems();
    progress.currentStep = "normalizing";
    lost = !reportProgress(sessionId, progress);

    const size_t batchSize = EngineConfig::getBatchSize();
    int64_t lastRowId = 0;
    bool stopped = false;

    while (!lost) {
      if (token->isCancelled()) {
        stopped = true;
        break;
      }
      std::vector<RawCatalogItem> batch = reader.fetchBatch(lastRowId, batchSize);
      if (batch.empty())
        break;

      SqliteTransaction txn(db);
      for (const auto &item : batch) {
        try {
          records.upsert(normalizer_.normalize(item));
        } catch (const std::exception &e) {
          progress.failedItems++;
          Logger::warning(LogCategory::NORMALIZATION,
                          "NormalizationWorkerPool::runSession",
                          "Skipping item '" + item.reference + "' in " + path +
                              ": " + std::string(e.what()));
        }
      }
      txn.commit();

      lastRowId = batch.back().rowId;
      progress.processed += static_cast<int64_t>(batch.size());
      lost = !reportProgress(sessionId, progress);
    }

    if (!stopped && !lost) {
      AnalysisResult analysis = analyzer_.analyze(
          db, token.get(),
          [&](const std::string &step, const AnalysisResult &partial) {
            progress.currentStep = step;
            progress.duplicatesFound =
                static_cast<int64_t>(partial.duplicatesFound);
            progress.violationsFound =
                static_cast<int64_t>(partial.violationsFound);
            progress.suggestionsFound =
                static_cast<int64_t>(partial.suggestionsFound);
            if (!reportProgress(sessionId, progress)) {
              lost = true;
              token->cancel();
            }
          });
      stopped = analysis.cancelled;
    }

    if (!lost) {
      progress.currentStep = stopped ? "stopped" : "completed";
      lost = !reportProgress(sessionId, progress);
    }
    if (lost) {
      Logger::warning(LogCategory::NORMALIZATION,
                      "NormalizationWorkerPool::runSession",
                      "Session " + std::to_string(sessionId) +
                          " expired while running; abandoned after " +
                          std::to_string(progress.processed) + "/" +
                          std::to_string(progress.total) + " items");
    } else {
      store_->finishSession(sessionId,
                            stopped ? SessionStatus::STOPPED
                                    : SessionStatus::COMPLETED,
                            "");

      Logger::info(LogCategory::NORMALIZATION,
                   "NormalizationWorkerPool::runSession",
                   "Session " + std::to_string(sessionId) + " " +
                       progress.currentStep + ": " +
                       std::to_string(progress.processed) + "/" +
                       std::to_string(progress.total) + " items, " +
                       std::to_string(progress.failedItems) + " failed");
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::NORMALIZATION,
                  "NormalizationWorkerPool::runSession",
                  "Session " + std::to_string(sessionId) + " on " + path +
                      " failed: " + std::string(e.what()));
    try {
      store_->finishSession(sessionId, SessionStatus::FAILED, e.what());
    } catch (const std::exception &finishError) {
      Logger::error(LogCategory::NORMALIZATION,
                    "NormalizationWorkerPool::runSession",
                    "Cannot mark session " + std::to_string(sessionId) +
                        " failed: " + std::string(finishError.what()));
    }
  }

  notifyRunFinished(path);
}
