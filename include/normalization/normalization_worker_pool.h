#ifndef NORMALIZATION_WORKER_POOL_H
#define NORMALIZATION_WORKER_POOL_H

#include "concurrency/run_registry.h"
#include "concurrency/task_thread_pool.h"
#include "core/engine_config.h"
#include "normalization/catalog_normalizer.h"
#include "quality/quality_analyzer.h"
#include "storage/project_database_lookup.h"
#include "storage/session_store.h"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Target of start/stop/status: one database, all active databases of a
// project, or (stop and status only) everything.
struct NormalizationScope {
  std::optional<std::string> databasePath;
  std::optional<int64_t> databaseId;
  std::optional<int64_t> projectId;

  bool isGlobal() const { return !databasePath && !projectId; }
};

struct NormalizationStatus {
  bool isRunning = false;
  double progress = 0.0;
  int64_t processed = 0;
  int64_t total = 0;
  int64_t failedItems = 0;
  std::string currentStep = "idle";
  int64_t duplicatesFound = 0;
  int64_t violationsFound = 0;
  int64_t suggestionsFound = 0;
  std::optional<std::string> error;
  std::vector<NormalizationSession> sessions;
};

void to_json(nlohmann::json &j, const NormalizationStatus &status);

struct StopResult {
  bool wasRunning = false;
  size_t sessionsSignalled = 0;
};

// Runs normalization passes over target databases on a bounded pool. Each
// database gets one session and one worker task; a worker streams raw items in
// batches, writes every batch in one transaction, reports progress after each
// batch and then runs the quality analysis on the same database.
class NormalizationWorkerPool {
public:
  // Called on the worker thread after a run that touched its database ends,
  // whatever its final status.
  using RunFinishedListener = std::function<void(const std::string &path)>;

private:
  std::shared_ptr<ISessionStore> store_;
  std::shared_ptr<IProjectDatabaseLookup> lookup_;
  CatalogNormalizer normalizer_;
  QualityAnalyzer analyzer_;
  RunRegistry registry_;
  std::unique_ptr<TaskThreadPool> pool_;

  // Sessions created but not yet picked up by a worker. Their heartbeat is
  // refreshed whenever a worker reports progress so they are not expired
  // while waiting for a free slot.
  std::mutex queuedMutex_;
  std::set<int64_t> queuedSessions_;

  std::mutex listenerMutex_;
  RunFinishedListener runFinished_;

  std::vector<SessionTarget> resolveTargets(const NormalizationScope &scope);
  void runSession(const std::string &path, int64_t sessionId,
                  std::shared_ptr<CancellationToken> token);
  bool reportProgress(int64_t sessionId, const SessionProgress &progress);
  void markQueued(int64_t sessionId, bool queued);
  void notifyRunFinished(const std::string &path);
  void expireStaleSessions();

public:
  NormalizationWorkerPool(std::shared_ptr<ISessionStore> store,
                          std::shared_ptr<IProjectDatabaseLookup> lookup,
                          std::shared_ptr<IConfidenceScorer> scorer = nullptr,
                          size_t maxWorkers = EngineConfig::getMaxWorkers());
  ~NormalizationWorkerPool();

  NormalizationWorkerPool(const NormalizationWorkerPool &) = delete;
  NormalizationWorkerPool &operator=(const NormalizationWorkerPool &) = delete;

  // Creates the sessions and queues one task per database; returns their ids
  // without waiting. A project start is all-or-nothing: ConflictError when any
  // target already runs, and then no session is created.
  std::vector<int64_t> start(const NormalizationScope &scope);

  // Signals the matching runs. Nothing running is a successful no-op.
  StopResult stop(const NormalizationScope &scope);

  // Live runs are read back from the session store; without one the last
  // persisted session of the scope is reported.
  NormalizationStatus status(const NormalizationScope &scope);

  // Runs the analysis steps synchronously on one database without
  // normalizing. ConflictError while a normalization run holds the database.
  AnalysisResult analyze(const std::string &databasePath);

  // Replaces the listener; an empty one disables notification. Returns once
  // no call to the previous listener is in progress.
  void setRunFinishedListener(RunFinishedListener listener);

  bool waitForIdle(std::chrono::milliseconds timeout);
  size_t activeRuns() const { return registry_.size(); }

  // Cancels every run and joins the workers.
  void shutdown();
};

#endif
