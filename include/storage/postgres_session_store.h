#ifndef POSTGRES_SESSION_STORE_H
#define POSTGRES_SESSION_STORE_H

#include "storage/session_store.h"
#include <pqxx/pqxx>
#include <string>

// Session store backed by metadata.normalization_sessions. A partial unique
// index on database_path WHERE status = 'running' guarantees at most one
// running session per target database across processes.
class PostgresSessionStore : public ISessionStore {
  std::string connectionString_;

  pqxx::connection getConnection();
  static NormalizationSession readRow(const pqxx::row &row);

public:
  explicit PostgresSessionStore(std::string connectionString);

  // Creates the metadata schema, table and indexes if missing.
  void initializeSchema();

  std::vector<NormalizationSession>
  createSessions(const std::vector<SessionTarget> &targets,
                 int64_t timeoutSeconds) override;
  bool updateProgress(int64_t sessionId,
                      const SessionProgress &progress) override;
  void touchSessions(const std::vector<int64_t> &sessionIds) override;
  void finishSession(int64_t sessionId, SessionStatus status,
                     const std::string &errorMessage) override;
  std::optional<NormalizationSession> getSession(int64_t sessionId) override;
  std::optional<NormalizationSession>
  latestForDatabase(const std::string &databasePath) override;
  std::vector<NormalizationSession>
  latestForProject(int64_t projectId) override;
  std::optional<NormalizationSession> latestSession() override;
  size_t expireStaleSessions() override;
};

#endif
