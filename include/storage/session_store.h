#ifndef SESSION_STORE_H
#define SESSION_STORE_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class SessionStatus { RUNNING, STOPPED, COMPLETED, FAILED };

std::string toString(SessionStatus status);
SessionStatus sessionStatusFromString(const std::string &value);

struct NormalizationSession {
  int64_t id = 0;
  std::optional<int64_t> databaseId;
  std::optional<int64_t> projectId;
  std::string databasePath;
  SessionStatus status = SessionStatus::RUNNING;
  int64_t processed = 0;
  int64_t total = 0;
  int64_t failedItems = 0;
  std::string currentStep;
  int64_t duplicatesFound = 0;
  int64_t violationsFound = 0;
  int64_t suggestionsFound = 0;
  std::string errorMessage;
  std::string startedAt;
  std::optional<std::string> endedAt;
  std::string lastActivityAt;
  int64_t timeoutSeconds = 3600;
};

struct SessionTarget {
  std::optional<int64_t> databaseId;
  std::optional<int64_t> projectId;
  std::string databasePath;
};

struct SessionProgress {
  int64_t processed = 0;
  int64_t total = 0;
  int64_t failedItems = 0;
  std::string currentStep;
  int64_t duplicatesFound = 0;
  int64_t violationsFound = 0;
  int64_t suggestionsFound = 0;
};

void to_json(nlohmann::json &j, const NormalizationSession &session);

// Persistent run state of normalization sessions. Implementations must be
// safe for concurrent use by the worker threads.
class ISessionStore {
public:
  virtual ~ISessionStore() = default;

  // Creates one running session per target in a single transaction. Throws
  // ConflictError when any target already has a running session; in that case
  // no session is created.
  virtual std::vector<NormalizationSession>
  createSessions(const std::vector<SessionTarget> &targets,
                 int64_t timeoutSeconds) = 0;

  // Writes counters and refreshes the heartbeat of a running session.
  // Returns false when the session is no longer running, in which case
  // nothing is written and the caller must stop working on it.
  virtual bool updateProgress(int64_t sessionId,
                              const SessionProgress &progress) = 0;

  // Refreshes the heartbeat of sessions that are still running without
  // touching their counters. Used for sessions queued behind busy workers.
  virtual void touchSessions(const std::vector<int64_t> &sessionIds) = 0;

  // Moves a running session to a terminal status. A session that is no longer
  // running (e.g. expired) is left untouched.
  virtual void finishSession(int64_t sessionId, SessionStatus status,
                             const std::string &errorMessage) = 0;

  virtual std::optional<NormalizationSession> getSession(int64_t sessionId) = 0;
  virtual std::optional<NormalizationSession>
  latestForDatabase(const std::string &databasePath) = 0;
  // Latest session per database of the project.
  virtual std::vector<NormalizationSession>
  latestForProject(int64_t projectId) = 0;
  virtual std::optional<NormalizationSession> latestSession() = 0;

  // Fails running sessions whose heartbeat is older than their timeout.
  // Returns the number of sessions expired.
  virtual size_t expireStaleSessions() = 0;
};

#endif
