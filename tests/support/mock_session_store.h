#ifndef MOCK_SESSION_STORE_H
#define MOCK_SESSION_STORE_H

#include "core/errors.h"
#include "storage/session_store.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <map>
#include <mutex>
#include <set>

// In-memory session store with the same conflict and terminal-state rules as
// the PostgreSQL one. markStale() lets tests simulate a dead heartbeat until
// the next touchSessions() for that session.
class MockSessionStore : public ISessionStore {
private:
  mutable std::mutex mutex_;
  std::map<int64_t, NormalizationSession> sessions_;
  std::set<int64_t> stale_;
  std::set<int64_t> touched_;
  std::map<int64_t, int64_t> progressWrites_;
  int64_t nextId_ = 1;

public:
  std::vector<NormalizationSession>
  createSessions(const std::vector<SessionTarget> &targets,
                 int64_t timeoutSeconds) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &target : targets) {
      for (const auto &entry : sessions_) {
        if (entry.second.status == SessionStatus::RUNNING &&
            entry.second.databasePath == target.databasePath) {
          throw ConflictError("Session already running for " +
                              target.databasePath);
        }
      }
    }
    std::vector<NormalizationSession> created;
    for (const auto &target : targets) {
      NormalizationSession session;
      session.id = nextId_++;
      session.databaseId = target.databaseId;
      session.projectId = target.projectId;
      session.databasePath = target.databasePath;
      session.currentStep = "starting";
      session.startedAt = TimeUtils::nowIso8601Utc();
      session.lastActivityAt = session.startedAt;
      session.timeoutSeconds = timeoutSeconds;
      sessions_[session.id] = session;
      created.push_back(session);
    }
    return created;
  }

  bool updateProgress(int64_t sessionId,
                      const SessionProgress &progress) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end() || it->second.status != SessionStatus::RUNNING)
      return false;
    NormalizationSession &session = it->second;
    session.processed = progress.processed;
    session.total = progress.total;
    session.failedItems = progress.failedItems;
    session.currentStep = progress.currentStep;
    session.duplicatesFound = progress.duplicatesFound;
    session.violationsFound = progress.violationsFound;
    session.suggestionsFound = progress.suggestionsFound;
    session.lastActivityAt = TimeUtils::nowIso8601Utc();
    progressWrites_[sessionId]++;
    return true;
  }

  void touchSessions(const std::vector<int64_t> &sessionIds) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int64_t id : sessionIds) {
      touched_.insert(id);
      stale_.erase(id);
      auto it = sessions_.find(id);
      if (it == sessions_.end() || it->second.status != SessionStatus::RUNNING)
        continue;
      it->second.lastActivityAt = TimeUtils::nowIso8601Utc();
    }
  }

  void finishSession(int64_t sessionId, SessionStatus status,
                     const std::string &errorMessage) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end() || it->second.status != SessionStatus::RUNNING)
      return;
    it->second.status = status;
    it->second.errorMessage = errorMessage;
    it->second.endedAt = TimeUtils::nowIso8601Utc();
  }

  std::optional<NormalizationSession> getSession(int64_t sessionId) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end())
      return std::nullopt;
    return it->second;
  }

  std::optional<NormalizationSession>
  latestForDatabase(const std::string &databasePath) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.rbegin(); it != sessions_.rend(); ++it) {
      if (it->second.databasePath == databasePath)
        return it->second;
    }
    return std::nullopt;
  }

  std::vector<NormalizationSession> latestForProject(int64_t projectId) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, NormalizationSession> latest;
    for (const auto &entry : sessions_) {
      if (entry.second.projectId && *entry.second.projectId == projectId)
        latest[entry.second.databasePath] = entry.second;
    }
    std::vector<NormalizationSession> result;
    for (const auto &entry : latest)
      result.push_back(entry.second);
    std::sort(result.begin(), result.end(),
              [](const NormalizationSession &a, const NormalizationSession &b) {
                return a.id < b.id;
              });
    return result;
  }

  std::optional<NormalizationSession> latestSession() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.empty())
      return std::nullopt;
    return sessions_.rbegin()->second;
  }

  size_t expireStaleSessions() override {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t expired = 0;
    for (int64_t id : stale_) {
      auto it = sessions_.find(id);
      if (it == sessions_.end() || it->second.status != SessionStatus::RUNNING)
        continue;
      it->second.status = SessionStatus::FAILED;
      it->second.errorMessage = "Session timed out";
      it->second.endedAt = TimeUtils::nowIso8601Utc();
      expired++;
    }
    stale_.clear();
    return expired;
  }

  void markStale(int64_t sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    stale_.insert(sessionId);
  }

  // Running session inserted directly, as left behind by a crashed process.
  int64_t insertOrphan(const std::string &databasePath) {
    std::lock_guard<std::mutex> lock(mutex_);
    NormalizationSession session;
    session.id = nextId_++;
    session.databasePath = databasePath;
    session.currentStep = "normalizing";
    session.startedAt = TimeUtils::nowIso8601Utc();
    session.lastActivityAt = session.startedAt;
    sessions_[session.id] = session;
    return session.id;
  }

  // Number of accepted progress writes for a session.
  int64_t progressWrites(int64_t sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = progressWrites_.find(sessionId);
    return it == progressWrites_.end() ? 0 : it->second;
  }

  bool wasTouched(int64_t sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return touched_.count(sessionId) > 0;
  }

  std::vector<NormalizationSession> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NormalizationSession> result;
    for (const auto &entry : sessions_)
      result.push_back(entry.second);
    return result;
  }
};

#endif
