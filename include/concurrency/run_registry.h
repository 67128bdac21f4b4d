#ifndef RUN_REGISTRY_H
#define RUN_REGISTRY_H

#include "concurrency/cancellation_token.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct RunEntry {
  int64_t sessionId = 0;
  std::optional<int64_t> projectId;
  std::shared_ptr<CancellationToken> token;
};

// In-process table of normalization runs keyed by canonical database path.
// A path is reserved before its session is created and released when its
// worker exits, so two runs never target the same database.
class RunRegistry {
private:
  mutable std::mutex mutex_;
  std::condition_variable released_;
  std::map<std::string, RunEntry> runs_;

public:
  // Reserves every path or none. Returns the first already reserved path when
  // the reservation fails.
  std::optional<std::string> reserve(const std::vector<std::string> &paths,
                                     std::optional<int64_t> projectId);

  // Binds the session created for a reserved path and returns its token.
  std::shared_ptr<CancellationToken> attach(const std::string &path,
                                            int64_t sessionId);

  void release(const std::string &path);
  void release(const std::vector<std::string> &paths);

  // Each returns the number of runs signalled.
  size_t cancel(const std::string &path);
  size_t cancelProject(int64_t projectId);
  size_t cancelAll();

  bool isRunning(const std::string &path) const;
  std::optional<RunEntry> find(const std::string &path) const;
  std::vector<RunEntry> runsForProject(int64_t projectId) const;
  std::vector<RunEntry> allRuns() const;
  size_t size() const;

  // Blocks until no run is registered or the timeout expires.
  bool waitUntilEmpty(std::chrono::milliseconds timeout);
};

#endif
