#include "../support/mock_project_lookup.h"
#include "../support/mock_session_store.h"
#include "../support/temp_database.h"
#include "../support/test_runner.h"
#include "core/engine_config.h"
#include "normalization/normalization_worker_pool.h"
#include <future>

using namespace std::chrono_literals;

// Blocks the first scored item until release() so a test can act while a
// batch is in flight.
class GateScorer : public IConfidenceScorer {
  std::promise<void> entered_;
  std::promise<void> release_;
  std::shared_future<void> released_;
  std::atomic<bool> first_{true};

public:
  GateScorer() : released_(release_.get_future().share()) {}

  std::optional<double> score(const NormalizedRecord &) override {
    if (first_.exchange(false)) {
      entered_.set_value();
      released_.wait();
    }
    return std::nullopt;
  }

  std::future<void> entered() { return entered_.get_future(); }
  void release() { release_.set_value(); }
};

void fillItems(const std::string &path, int count) {
  TargetDatabase db(path);
  SqliteTransaction txn(db);
  for (int i = 0; i < count; ++i) {
    insertCatalogItem(db, "REF-" + std::to_string(i),
                      "C-" + std::to_string(i), "Болт М" + std::to_string(i),
                      "");
  }
  txn.commit();
}

NormalizationScope databaseScope(const std::string &path) {
  NormalizationScope scope;
  scope.databasePath = path;
  return scope;
}

NormalizationScope projectScope(int64_t projectId) {
  NormalizationScope scope;
  scope.projectId = projectId;
  return scope;
}

int main() {
  TestRunner runner;
  EngineConfig::resetToDefaults();

  runner.runTest("Single database run normalizes every item", [&]() {
    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "a.db");
    fillItems(path, 3);
    auto store = std::make_shared<MockSessionStore>();
    auto lookup = std::make_shared<MockProjectLookup>();
    int64_t databaseId = lookup->addDatabase(1, path);
    NormalizationWorkerPool pool(store, lookup, nullptr, 2);

    std::vector<int64_t> ids = pool.start(databaseScope(path));
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(ids.size()),
                        "one session");
    runner.assertTrue(pool.waitForIdle(10s), "run finished");

    NormalizationStatus status = pool.status(databaseScope(path));
    runner.assertFalse(status.isRunning, "not running");
    runner.assertEquals(int64_t{3}, status.processed, "processed");
    runner.assertEquals(int64_t{3}, status.total, "total");
    runner.assertEquals(int64_t{0}, status.failedItems, "no failures");
    runner.assertNear(100.0, status.progress, 1e-9, "progress");
    runner.assertEquals("completed", status.currentStep, "final step");
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(status.sessions.size()),
                        "one session reported");
    runner.assertEquals("completed", toString(status.sessions[0].status),
                        "session completed");
    runner.assertTrue(status.sessions[0].databaseId.has_value() &&
                          *status.sessions[0].databaseId == databaseId,
                      "database id resolved from the lookup");

    TargetDatabase db(path, TargetDatabase::Mode::READ_ONLY);
    runner.assertEquals(
        int64_t{3},
        static_cast<int64_t>(NormalizedRecordRepository(db).loadActive().size()),
        "records written");
  });

  runner.runTest("Start rejects malformed scopes", [&]() {
    auto store = std::make_shared<MockSessionStore>();
    auto lookup = std::make_shared<MockProjectLookup>();
    lookup->addProject(5);
    lookup->addDatabase(6, "/tmp/inactive.db", false);
    NormalizationWorkerPool pool(store, lookup, nullptr, 1);

    NormalizationScope both;
    both.databasePath = "/tmp/x.db";
    both.projectId = 1;
    runner.assertThrows<ValidationError>([&]() { pool.start(both); },
                                         "path and project together");
    runner.assertThrows<ValidationError>(
        [&]() { pool.start(NormalizationScope{}); }, "global start");
    runner.assertThrows<ValidationError>(
        [&]() { pool.start(databaseScope("")); }, "empty path");
    runner.assertThrows<NotFoundError>([&]() { pool.start(projectScope(99)); },
                                       "unknown project");
    runner.assertThrows<ValidationError>([&]() { pool.start(projectScope(5)); },
                                         "project without databases");
    runner.assertThrows<ValidationError>([&]() { pool.start(projectScope(6)); },
                                         "project with inactive databases only");
    runner.assertEquals(int64_t{0},
                        static_cast<int64_t>(store->snapshot().size()),
                        "no session created");
  });

  runner.runTest("Items that cannot be normalized are counted as failed",
                 [&]() {
                   TempDirectory dir;
                   std::string path = createTargetDatabase(dir, "b.db");
                   {
                     TargetDatabase db(path);
                     insertCatalogItem(db, "REF-OK", "A-1", "Болт М8");
                     insertCatalogItem(db, "", "A-2", "Гайка");
                     insertCatalogItem(db, "REF-EMPTY", "", "");
                   }
                   auto store = std::make_shared<MockSessionStore>();
                   NormalizationWorkerPool pool(store, nullptr, nullptr, 1);
                   pool.start(databaseScope(path));
                   runner.assertTrue(pool.waitForIdle(10s), "run finished");

                   NormalizationStatus status = pool.status(databaseScope(path));
                   runner.assertEquals(int64_t{3}, status.processed,
                                       "all rows processed");
                   runner.assertEquals(int64_t{2}, status.failedItems,
                                       "two failures");
                   runner.assertEquals("completed",
                                       toString(status.sessions[0].status),
                                       "session still completes");
                 });

  runner.runTest("Stop takes effect at the next batch boundary", [&]() {
    EngineConfig::setBatchSize(10);
    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "c.db");
    fillItems(path, 25);
    auto store = std::make_shared<MockSessionStore>();
    auto scorer = std::make_shared<GateScorer>();
    std::future<void> entered = scorer->entered();
    NormalizationWorkerPool pool(store, nullptr, scorer, 1);

    pool.start(databaseScope(path));
    runner.assertTrue(entered.wait_for(10s) == std::future_status::ready,
                      "first batch in flight");

    runner.assertThrows<ConflictError>([&]() { pool.start(databaseScope(path)); },
                                       "second start conflicts");
    runner.assertThrows<ConflictError>([&]() { pool.analyze(path); },
                                       "analysis conflicts with the run");
    NormalizationStatus live = pool.status(databaseScope(path));
    runner.assertTrue(live.isRunning, "reported as running");

    StopResult stopped = pool.stop(databaseScope(path));
    runner.assertTrue(stopped.wasRunning, "stop found the run");
    scorer->release();
    runner.assertTrue(pool.waitForIdle(10s), "run finished");

    NormalizationStatus status = pool.status(databaseScope(path));
    runner.assertEquals("stopped", toString(status.sessions[0].status),
                        "session stopped");
    runner.assertEquals(int64_t{10}, status.processed,
                        "only the first batch was written");
    runner.assertEquals(int64_t{25}, status.total, "total known");
    EngineConfig::resetToDefaults();
  });

  runner.runTest("Stop with nothing running is a no-op", [&]() {
    auto store = std::make_shared<MockSessionStore>();
    NormalizationWorkerPool pool(store, nullptr, nullptr, 1);
    StopResult result = pool.stop(NormalizationScope{});
    runner.assertFalse(result.wasRunning, "nothing was running");
    runner.assertEquals(int64_t{0},
                        static_cast<int64_t>(result.sessionsSignalled),
                        "no session signalled");
  });

  runner.runTest("Project start is all or nothing", [&]() {
    TempDirectory dir;
    std::string pathA = createTargetDatabase(dir, "p1.db");
    std::string pathB = createTargetDatabase(dir, "p2.db");
    fillItems(pathA, 2);
    fillItems(pathB, 2);
    auto store = std::make_shared<MockSessionStore>();
    auto lookup = std::make_shared<MockProjectLookup>();
    lookup->addDatabase(1, pathA);
    lookup->addDatabase(1, pathB);
    int64_t orphan = store->insertOrphan(pathB);
    NormalizationWorkerPool pool(store, lookup, nullptr, 2);

    runner.assertThrows<ConflictError>([&]() { pool.start(projectScope(1)); },
                                       "one database is busy");
    runner.assertEquals(int64_t{1},
                        static_cast<int64_t>(store->snapshot().size()),
                        "no session created for the free database");
    runner.assertEquals(int64_t{0}, static_cast<int64_t>(pool.activeRuns()),
                        "reservations released");

    store->finishSession(orphan, SessionStatus::FAILED, "gone");
    std::vector<int64_t> ids = pool.start(projectScope(1));
    runner.assertEquals(int64_t{2}, static_cast<int64_t>(ids.size()),
                        "both databases started");
    runner.assertTrue(pool.waitForIdle(10s), "runs finished");

    NormalizationStatus status = pool.status(projectScope(1));
    runner.assertEquals(int64_t{2}, static_cast<int64_t>(status.sessions.size()),
                        "latest session per database");
    runner.assertEquals(int64_t{4}, status.processed, "items of both databases");
  });

  runner.runTest("Duplicate paths in a project start once", [&]() {
    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "dup.db");
    fillItems(path, 1);
    auto store = std::make_shared<MockSessionStore>();
    auto lookup = std::make_shared<MockProjectLookup>();
    lookup->addDatabase(3, path);
    lookup->addDatabase(3, dir.file("./dup.db"));
    NormalizationWorkerPool pool(store, lookup, nullptr, 2);

    std::vector<int64_t> ids = pool.start(projectScope(3));
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(ids.size()),
                        "one session for the shared file");
    runner.assertTrue(pool.waitForIdle(10s), "run finished");
  });

  runner.runTest("Stale sessions are expired before status and start", [&]() {
    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "stale.db");
    auto store = std::make_shared<MockSessionStore>();
    NormalizationWorkerPool pool(store, nullptr, nullptr, 1);
    int64_t orphan = store->insertOrphan(path);
    store->markStale(orphan);

    NormalizationStatus status = pool.status(databaseScope(path));
    runner.assertFalse(status.isRunning, "expired session is not running");
    runner.assertEquals("failed", toString(status.sessions[0].status),
                        "expired session failed");
    runner.assertTrue(status.error.has_value(), "timeout reported");

    pool.start(databaseScope(path));
    runner.assertTrue(pool.waitForIdle(10s), "new run finished");
  });

  runner.runTest("Queued session expired behind a busy worker writes nothing",
                 [&]() {
    EngineConfig::setBatchSize(10);
    TempDirectory dir;
    std::string busyPath = createTargetDatabase(dir, "busy.db");
    std::string waitingPath = createTargetDatabase(dir, "waiting.db");
    fillItems(busyPath, 15);
    fillItems(waitingPath, 5);
    auto store = std::make_shared<MockSessionStore>();
    auto scorer = std::make_shared<GateScorer>();
    std::future<void> entered = scorer->entered();
    NormalizationWorkerPool pool(store, nullptr, scorer, 1);

    int64_t busyId = pool.start(databaseScope(busyPath)).front();
    runner.assertTrue(entered.wait_for(10s) == std::future_status::ready,
                      "only worker is busy");
    int64_t waitingId = pool.start(databaseScope(waitingPath)).front();

    store->markStale(waitingId);
    NormalizationStatus expired = pool.status(databaseScope(waitingPath));
    runner.assertEquals("failed", toString(expired.sessions[0].status),
                        "queued session expired");

    scorer->release();
    runner.assertTrue(pool.waitForIdle(10s), "both tasks finished");

    std::optional<NormalizationSession> waiting = store->getSession(waitingId);
    runner.assertEquals("failed", toString(waiting->status),
                        "expired session stays failed");
    runner.assertEquals(int64_t{0}, waiting->processed, "no progress recorded");
    runner.assertEquals(int64_t{0}, store->progressWrites(waitingId),
                        "no progress write accepted");
    runner.assertTrue(store->wasTouched(waitingId),
                      "busy worker refreshed the queued heartbeat");
    {
      TargetDatabase db(waitingPath, TargetDatabase::Mode::READ_ONLY);
      runner.assertEquals(
          int64_t{0},
          static_cast<int64_t>(NormalizedRecordRepository(db).loadActive().size()),
          "no record written after expiry");
    }

    std::optional<NormalizationSession> busy = store->getSession(busyId);
    runner.assertEquals("completed", toString(busy->status),
                        "busy session completed");
    runner.assertEquals(int64_t{15}, busy->processed, "busy items processed");
    EngineConfig::resetToDefaults();
  });

  runner.runTest("Heartbeat keeps a queued session alive", [&]() {
    EngineConfig::setBatchSize(10);
    TempDirectory dir;
    std::string busyPath = createTargetDatabase(dir, "busy2.db");
    std::string waitingPath = createTargetDatabase(dir, "waiting2.db");
    fillItems(busyPath, 15);
    fillItems(waitingPath, 3);
    auto store = std::make_shared<MockSessionStore>();
    auto scorer = std::make_shared<GateScorer>();
    std::future<void> entered = scorer->entered();
    NormalizationWorkerPool pool(store, nullptr, scorer, 1);

    pool.start(databaseScope(busyPath));
    runner.assertTrue(entered.wait_for(10s) == std::future_status::ready,
                      "only worker is busy");
    int64_t waitingId = pool.start(databaseScope(waitingPath)).front();
    store->markStale(waitingId);

    scorer->release();
    runner.assertTrue(pool.waitForIdle(10s), "both tasks finished");
    NormalizationStatus status = pool.status(databaseScope(waitingPath));
    runner.assertEquals("completed", toString(status.sessions[0].status),
                        "refreshed session ran to completion");
    runner.assertEquals(int64_t{3}, status.processed, "items processed");
    EngineConfig::resetToDefaults();
  });

  runner.runTest("Unreadable database fails its session", [&]() {
    TempDirectory dir;
    std::string path = dir.file("missing.db");
    auto store = std::make_shared<MockSessionStore>();
    NormalizationWorkerPool pool(store, nullptr, nullptr, 1);
    pool.start(databaseScope(path));
    runner.assertTrue(pool.waitForIdle(10s), "run finished");

    NormalizationStatus status = pool.status(databaseScope(path));
    runner.assertEquals("failed", toString(status.sessions[0].status),
                        "session failed");
    runner.assertTrue(status.error.has_value(), "error message kept");
  });

  runner.runTest("Analyze runs the quality steps on an idle database", [&]() {
    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "analyze.db");
    {
      TargetDatabase db(path);
      insertRecord(db, makeRecord("R1", "CODE001", "Болт М8", 0.8));
      insertRecord(db, makeRecord("R2", "CODE001", "Болт М8 оцинк", 0.6));
      insertRecord(db, makeRecord("R3", "CODE002", "Xy", 0.3));
    }
    auto store = std::make_shared<MockSessionStore>();
    NormalizationWorkerPool pool(store, nullptr, nullptr, 1);

    AnalysisResult result = pool.analyze(path);
    runner.assertFalse(result.cancelled, "not cancelled");
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(result.duplicatesFound),
                        "one duplicate group");
    runner.assertGreaterOrEqual(1, static_cast<int64_t>(result.violationsFound),
                                "short name flagged");
    runner.assertEquals(int64_t{0}, static_cast<int64_t>(pool.activeRuns()),
                        "reservation released");
    runner.assertThrows<ValidationError>([&]() { pool.analyze(""); },
                                         "empty path");
  });

  runner.printSummary();
  return 0;
}
