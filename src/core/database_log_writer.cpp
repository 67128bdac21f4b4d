#include "core/database_log_writer.h"
#include <iostream>
#include <optional>

namespace {
constexpr size_t MAX_LEVEL_LENGTH = 50;
constexpr size_t MAX_FUNCTION_LENGTH = 255;
constexpr size_t MAX_MESSAGE_LENGTH = 10000;

// Drops byte sequences that are not valid UTF-8 so PostgreSQL does not reject
// the insert. Catalog names arrive from external systems in mixed encodings.
std::string sanitizeUTF8(const std::string &input) {
  std::string result;
  result.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    size_t length = 0;
    if (c < 0x80) {
      length = 1;
    } else if ((c & 0xE0) == 0xC0) {
      length = 2;
    } else if ((c & 0xF0) == 0xE0) {
      length = 3;
    } else if ((c & 0xF8) == 0xF0) {
      length = 4;
    }

    bool valid = length > 0 && i + length <= input.size();
    for (size_t k = 1; valid && k < length; ++k) {
      valid = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
    }

    if (valid) {
      if (length > 1 || c >= 0x20 || c == '\n' || c == '\t') {
        result.append(input, i, length);
      }
      i += length;
    } else {
      ++i;
    }
  }
  return result;
}
} // namespace

DatabaseLogWriter::DatabaseLogWriter(const std::string &connectionString) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    conn_ = std::make_unique<pqxx::connection>(connectionString);
    ensureSchemaUnlocked();
    conn_->prepare("log_insert",
                   "INSERT INTO metadata.logs (ts, level, category, function, "
                   "message, session_id, database_path) "
                   "VALUES (NOW(), $1, $2, $3, $4, $5, $6)");
    enabled_ = true;
  } catch (const std::exception &e) {
    disableUnlocked("cannot open service database: " + std::string(e.what()));
  }
}

void DatabaseLogWriter::ensureSchemaUnlocked() {
  pqxx::work txn(*conn_);
  txn.exec("CREATE SCHEMA IF NOT EXISTS metadata");
  txn.exec("CREATE TABLE IF NOT EXISTS metadata.logs ("
           "id BIGSERIAL PRIMARY KEY,"
           "ts TIMESTAMP NOT NULL DEFAULT NOW(),"
           "level VARCHAR(50) NOT NULL,"
           "category VARCHAR(50) NOT NULL,"
           "function VARCHAR(255),"
           "message TEXT NOT NULL)");
  txn.exec("ALTER TABLE metadata.logs "
           "ADD COLUMN IF NOT EXISTS session_id BIGINT, "
           "ADD COLUMN IF NOT EXISTS database_path TEXT");
  txn.exec("CREATE INDEX IF NOT EXISTS idx_logs_session "
           "ON metadata.logs (session_id) WHERE session_id IS NOT NULL");
  txn.commit();
}

void DatabaseLogWriter::disableUnlocked(const std::string &reason) {
  enabled_ = false;
  conn_.reset();
  std::cerr << "DatabaseLogWriter: " << reason
            << "; database logging disabled" << std::endl;
}

bool DatabaseLogWriter::write(const LogEntry &entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enabled_ || !conn_ || !conn_->is_open())
    return false;

  if (entry.level.length() > MAX_LEVEL_LENGTH ||
      entry.category.length() > MAX_LEVEL_LENGTH)
    return false;

  std::string function = entry.function.substr(0, MAX_FUNCTION_LENGTH);
  std::string message = entry.message.substr(0, MAX_MESSAGE_LENGTH);
  std::optional<int64_t> sessionId;
  std::optional<std::string> databasePath;
  if (entry.hasSession())
    sessionId = entry.sessionId;
  if (!entry.databasePath.empty())
    databasePath = sanitizeUTF8(entry.databasePath);

  try {
    pqxx::work txn(*conn_);
    txn.exec_prepared("log_insert", entry.level, entry.category,
                      sanitizeUTF8(function), sanitizeUTF8(message), sessionId,
                      databasePath);
    txn.commit();
    return true;
  } catch (const pqxx::broken_connection &e) {
    disableUnlocked("connection broken: " + std::string(e.what()));
    return false;
  } catch (const pqxx::sql_error &e) {
    std::cerr << "DatabaseLogWriter: SQL error writing log entry: " << e.what()
              << std::endl;
    return false;
  }
}

void DatabaseLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_.reset();
  enabled_ = false;
}

bool DatabaseLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_ && conn_ && conn_->is_open();
}
