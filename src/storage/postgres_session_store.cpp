#include "storage/postgres_session_store.h"
#include "core/errors.h"
#include "core/logger.h"

namespace {
const char *const SELECT_COLUMNS =
    "SELECT id, database_id, project_id, database_path, status, processed, "
    "total, failed_items, current_step, duplicates_found, violations_found, "
    "suggestions_found, error_message, "
    "to_char(started_at AT TIME ZONE 'UTC', "
    "'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"'), "
    "to_char(ended_at AT TIME ZONE 'UTC', "
    "'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"'), "
    "to_char(last_activity_at AT TIME ZONE 'UTC', "
    "'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"'), "
    "timeout_seconds FROM metadata.normalization_sessions ";

std::optional<int64_t> optionalInt(const pqxx::field &field) {
  if (field.is_null())
    return std::nullopt;
  return field.as<int64_t>();
}

std::string textOrEmpty(const pqxx::field &field) {
  return field.is_null() ? std::string() : field.as<std::string>();
}
} // namespace

PostgresSessionStore::PostgresSessionStore(std::string connectionString)
    : connectionString_(std::move(connectionString)) {}

pqxx::connection PostgresSessionStore::getConnection() {
  return pqxx::connection(connectionString_);
}

NormalizationSession PostgresSessionStore::readRow(const pqxx::row &row) {
  NormalizationSession session;
  session.id = row[0].as<int64_t>();
  session.databaseId = optionalInt(row[1]);
  session.projectId = optionalInt(row[2]);
  session.databasePath = row[3].as<std::string>();
  session.status = sessionStatusFromString(row[4].as<std::string>());
  session.processed = row[5].as<int64_t>();
  session.total = row[6].as<int64_t>();
  session.failedItems = row[7].as<int64_t>();
  session.currentStep = textOrEmpty(row[8]);
  session.duplicatesFound = row[9].as<int64_t>();
  session.violationsFound = row[10].as<int64_t>();
  session.suggestionsFound = row[11].as<int64_t>();
  session.errorMessage = textOrEmpty(row[12]);
  session.startedAt = textOrEmpty(row[13]);
  if (!row[14].is_null())
    session.endedAt = row[14].as<std::string>();
  session.lastActivityAt = textOrEmpty(row[15]);
  session.timeoutSeconds = row[16].as<int64_t>();
  return session;
}

void PostgresSessionStore::initializeSchema() {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    txn.exec("CREATE SCHEMA IF NOT EXISTS metadata");
    txn.exec("CREATE TABLE IF NOT EXISTS metadata.normalization_sessions ("
             "id BIGSERIAL PRIMARY KEY,"
             "database_id BIGINT,"
             "project_id BIGINT,"
             "database_path TEXT NOT NULL,"
             "status VARCHAR(20) NOT NULL CHECK (status IN "
             "('running','stopped','completed','failed')),"
             "processed BIGINT NOT NULL DEFAULT 0,"
             "total BIGINT NOT NULL DEFAULT 0,"
             "failed_items BIGINT NOT NULL DEFAULT 0,"
             "current_step VARCHAR(64),"
             "duplicates_found BIGINT NOT NULL DEFAULT 0,"
             "violations_found BIGINT NOT NULL DEFAULT 0,"
             "suggestions_found BIGINT NOT NULL DEFAULT 0,"
             "error_message TEXT,"
             "started_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
             "ended_at TIMESTAMPTZ,"
             "last_activity_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
             "timeout_seconds INTEGER NOT NULL DEFAULT 3600)");
    txn.exec("CREATE UNIQUE INDEX IF NOT EXISTS "
             "uq_normalization_sessions_running "
             "ON metadata.normalization_sessions (database_path) "
             "WHERE status = 'running'");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_normalization_sessions_project "
             "ON metadata.normalization_sessions (project_id, id DESC)");
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostgresSessionStore",
                  "Error creating session schema: " + std::string(e.what()));
    throw UpstreamError("Cannot initialize session schema: " +
                        std::string(e.what()));
  }
}

std::vector<NormalizationSession>
PostgresSessionStore::createSessions(const std::vector<SessionTarget> &targets,
                                     int64_t timeoutSeconds) {
  std::vector<NormalizationSession> sessions;
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    for (const auto &target : targets) {
      auto result = txn.exec_params(
          "INSERT INTO metadata.normalization_sessions "
          "(database_id, project_id, database_path, status, current_step, "
          "timeout_seconds) VALUES ($1, $2, $3, 'running', 'queued', $4) "
          "RETURNING id",
          target.databaseId, target.projectId, target.databasePath,
          timeoutSeconds);
      int64_t id = result[0][0].as<int64_t>();
      auto row = txn.exec_params(std::string(SELECT_COLUMNS) + "WHERE id = $1",
                                 id);
      sessions.push_back(readRow(row[0]));
    }
    txn.commit();
  } catch (const pqxx::unique_violation &) {
    throw ConflictError("Normalization already running for one of the "
                        "requested databases");
  } catch (const pqxx::sql_error &e) {
    Logger::error(LogCategory::DATABASE, "PostgresSessionStore",
                  "Error creating sessions: " + std::string(e.what()));
    throw UpstreamError("Cannot create sessions: " + std::string(e.what()));
  } catch (const pqxx::broken_connection &e) {
    throw UpstreamError("Session store unavailable: " + std::string(e.what()));
  } catch (const QualityError &) {
    throw;
  } catch (const std::exception &e) {
    throw UpstreamError("Cannot create sessions: " + std::string(e.what()));
  }
  return sessions;
}

bool PostgresSessionStore::updateProgress(int64_t sessionId,
                                          const SessionProgress &progress) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "UPDATE metadata.normalization_sessions SET processed = $2, "
        "total = $3, failed_items = $4, current_step = $5, "
        "duplicates_found = $6, violations_found = $7, "
        "suggestions_found = $8, last_activity_at = NOW() "
        "WHERE id = $1 AND status = 'running'",
        sessionId, progress.processed, progress.total, progress.failedItems,
        progress.currentStep, progress.duplicatesFound,
        progress.violationsFound, progress.suggestionsFound);
    txn.commit();
    return result.affected_rows() > 0;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostgresSessionStore",
                  "Error updating session " + std::to_string(sessionId) +
                      ": " + std::string(e.what()));
    throw UpstreamError("Cannot update session progress: " +
                        std::string(e.what()));
  }
}

void PostgresSessionStore::touchSessions(
    const std::vector<int64_t> &sessionIds) {
  if (sessionIds.empty())
    return;
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    for (int64_t id : sessionIds) {
      txn.exec_params("UPDATE metadata.normalization_sessions SET "
                      "last_activity_at = NOW() "
                      "WHERE id = $1 AND status = 'running'",
                      id);
    }
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostgresSessionStore",
                  "Error refreshing queued sessions: " +
                      std::string(e.what()));
    throw UpstreamError("Cannot refresh session heartbeat: " +
                        std::string(e.what()));
  }
}

void PostgresSessionStore::finishSession(int64_t sessionId,
                                         SessionStatus status,
                                         const std::string &errorMessage) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    txn.exec_params(
        "UPDATE metadata.normalization_sessions SET status = $2, "
        "error_message = NULLIF($3, ''), ended_at = NOW(), "
        "last_activity_at = NOW() WHERE id = $1 AND status = 'running'",
        sessionId, toString(status), errorMessage);
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostgresSessionStore",
                  "Error finishing session " + std::to_string(sessionId) +
                      ": " + std::string(e.what()));
    throw UpstreamError("Cannot finish session: " + std::string(e.what()));
  }
}

std::optional<NormalizationSession>
PostgresSessionStore::getSession(int64_t sessionId) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        std::string(SELECT_COLUMNS) + "WHERE id = $1", sessionId);
    txn.commit();
    if (result.empty())
      return std::nullopt;
    return readRow(result[0]);
  } catch (const std::exception &e) {
    throw UpstreamError("Cannot read session: " + std::string(e.what()));
  }
}

std::optional<NormalizationSession>
PostgresSessionStore::latestForDatabase(const std::string &databasePath) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(std::string(SELECT_COLUMNS) +
                                      "WHERE database_path = $1 "
                                      "ORDER BY id DESC LIMIT 1",
                                  databasePath);
    txn.commit();
    if (result.empty())
      return std::nullopt;
    return readRow(result[0]);
  } catch (const std::exception &e) {
    throw UpstreamError("Cannot read session: " + std::string(e.what()));
  }
}

std::vector<NormalizationSession>
PostgresSessionStore::latestForProject(int64_t projectId) {
  std::vector<NormalizationSession> sessions;
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        std::string(SELECT_COLUMNS) +
            "WHERE id IN (SELECT max(id) FROM metadata.normalization_sessions "
            "WHERE project_id = $1 GROUP BY database_path) ORDER BY id",
        projectId);
    txn.commit();
    for (const auto &row : result) {
      sessions.push_back(readRow(row));
    }
  } catch (const std::exception &e) {
    throw UpstreamError("Cannot read sessions: " + std::string(e.what()));
  }
  return sessions;
}

std::optional<NormalizationSession> PostgresSessionStore::latestSession() {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto result = txn.exec(std::string(SELECT_COLUMNS) +
                           "ORDER BY id DESC LIMIT 1");
    txn.commit();
    if (result.empty())
      return std::nullopt;
    return readRow(result[0]);
  } catch (const std::exception &e) {
    throw UpstreamError("Cannot read session: " + std::string(e.what()));
  }
}

size_t PostgresSessionStore::expireStaleSessions() {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto result = txn.exec(
        "UPDATE metadata.normalization_sessions SET status = 'failed', "
        "ended_at = NOW(), error_message = 'Session expired: no activity "
        "for ' || timeout_seconds || ' seconds' "
        "WHERE status = 'running' AND last_activity_at + "
        "make_interval(secs => timeout_seconds) < NOW()");
    txn.commit();
    size_t expired = static_cast<size_t>(result.affected_rows());
    if (expired > 0) {
      Logger::warning(LogCategory::NORMALIZATION,
                      "PostgresSessionStore::expireStaleSessions",
                      "Expired " + std::to_string(expired) +
                          " stale normalization session(s)");
    }
    return expired;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "PostgresSessionStore",
                  "Error expiring stale sessions: " + std::string(e.what()));
    throw UpstreamError("Cannot expire stale sessions: " +
                        std::string(e.what()));
  }
}
