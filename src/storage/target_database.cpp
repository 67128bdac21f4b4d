#include "storage/target_database.h"
#include "core/errors.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <filesystem>
#include <system_error>

namespace {
constexpr int BUSY_TIMEOUT_MS = 30000;

const char *const SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS catalog_items (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  reference TEXT NOT NULL,
  code TEXT,
  name TEXT,
  payload TEXT,
  created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ','now'))
);

CREATE TABLE IF NOT EXISTS normalized_data (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  source_reference TEXT NOT NULL UNIQUE,
  code TEXT NOT NULL DEFAULT '',
  name TEXT NOT NULL DEFAULT '',
  normalized_name TEXT NOT NULL DEFAULT '',
  category TEXT NOT NULL DEFAULT '',
  inn TEXT NOT NULL DEFAULT '',
  kpp TEXT NOT NULL DEFAULT '',
  unit TEXT NOT NULL DEFAULT '',
  attributes TEXT NOT NULL DEFAULT '{}',
  processing_level TEXT NOT NULL DEFAULT 'basic'
    CHECK (processing_level IN ('basic','ai_enhanced','benchmark')),
  quality_score REAL NOT NULL DEFAULT 0
    CHECK (quality_score >= 0 AND quality_score <= 1),
  ai_confidence REAL NOT NULL DEFAULT 0
    CHECK (ai_confidence >= 0 AND ai_confidence <= 1),
  is_active INTEGER NOT NULL DEFAULT 1,
  merged_count INTEGER NOT NULL DEFAULT 0,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_normalized_data_level
  ON normalized_data(processing_level, is_active);

CREATE TABLE IF NOT EXISTS quality_duplicate_groups (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  detection_method TEXT NOT NULL,
  similarity_score REAL NOT NULL
    CHECK (similarity_score >= 0 AND similarity_score <= 1),
  suggested_master_id INTEGER NOT NULL,
  item_count INTEGER NOT NULL,
  member_key TEXT NOT NULL,
  merged INTEGER NOT NULL DEFAULT 0,
  merged_at TEXT,
  created_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_duplicate_groups_key
  ON quality_duplicate_groups(member_key, merged);

CREATE TABLE IF NOT EXISTS quality_duplicate_members (
  group_id INTEGER NOT NULL
    REFERENCES quality_duplicate_groups(id) ON DELETE CASCADE,
  normalized_item_id INTEGER NOT NULL,
  PRIMARY KEY (group_id, normalized_item_id)
);

CREATE TABLE IF NOT EXISTS quality_violations (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  normalized_item_id INTEGER NOT NULL,
  rule_name TEXT NOT NULL,
  category TEXT NOT NULL,
  severity TEXT NOT NULL,
  message TEXT NOT NULL,
  recommendation TEXT NOT NULL DEFAULT '',
  field_name TEXT NOT NULL DEFAULT '',
  current_value TEXT NOT NULL DEFAULT '',
  resolved INTEGER NOT NULL DEFAULT 0,
  resolved_by TEXT,
  resolved_at TEXT,
  created_at TEXT NOT NULL,
  UNIQUE (normalized_item_id, rule_name)
);

CREATE TABLE IF NOT EXISTS quality_suggestions (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  normalized_item_id INTEGER NOT NULL,
  type TEXT NOT NULL,
  priority TEXT NOT NULL,
  field TEXT NOT NULL DEFAULT '',
  current_value TEXT NOT NULL DEFAULT '',
  suggested_value TEXT NOT NULL DEFAULT '',
  confidence REAL NOT NULL CHECK (confidence >= 0 AND confidence <= 1),
  reasoning TEXT NOT NULL DEFAULT '',
  auto_applyable INTEGER NOT NULL DEFAULT 0,
  applied INTEGER NOT NULL DEFAULT 0,
  applied_at TEXT,
  created_at TEXT NOT NULL
);
CREATE UNIQUE INDEX IF NOT EXISTS uq_quality_suggestions_open
  ON quality_suggestions(normalized_item_id, type, field, suggested_value)
  WHERE applied = 0;
)SQL";

// utf8_lower(text): lower-cases ASCII and Cyrillic, unlike SQLite's lower().
void utf8LowerFunction(sqlite3_context *ctx, int, sqlite3_value **argv) {
  if (sqlite3_value_type(argv[0]) == SQLITE_NULL) {
    sqlite3_result_null(ctx);
    return;
  }
  const unsigned char *text = sqlite3_value_text(argv[0]);
  std::string lowered = StringUtils::utf8ToLower(
      std::string(reinterpret_cast<const char *>(text),
                  static_cast<size_t>(sqlite3_value_bytes(argv[0]))));
  sqlite3_result_text(ctx, lowered.c_str(), static_cast<int>(lowered.size()),
                      SQLITE_TRANSIENT);
}
} // namespace

TargetDatabase::TargetDatabase(const std::string &path, Mode mode)
    : db_(nullptr), path_(path) {
  int flags = SQLITE_OPEN_NOMUTEX;
  switch (mode) {
  case Mode::READ_ONLY:
    flags |= SQLITE_OPEN_READONLY;
    break;
  case Mode::READ_WRITE:
    flags |= SQLITE_OPEN_READWRITE;
    break;
  case Mode::CREATE:
    flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    break;
  }

  int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw UpstreamError("Cannot open database '" + path_ + "': " + message);
  }

  sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);
  rc = sqlite3_create_function(db_, "utf8_lower", 1,
                               SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr,
                               utf8LowerFunction, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    std::string message = sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw UpstreamError("Cannot register functions on '" + path_ +
                        "': " + message);
  }

  try {
    exec("PRAGMA foreign_keys = ON");
    if (mode != Mode::READ_ONLY) {
      exec("PRAGMA journal_mode = WAL");
      applySchema();
    } else {
      // Forces SQLite to read the header so a corrupt file fails here.
      exec("SELECT count(*) FROM sqlite_master");
    }
  } catch (const UpstreamError &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

TargetDatabase::~TargetDatabase() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void TargetDatabase::applySchema() { exec(SCHEMA_SQL); }

void TargetDatabase::exec(const std::string &sql) {
  char *errMsg = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
  if (rc != SQLITE_OK) {
    std::string message = errMsg ? errMsg : sqlite3_errmsg(db_);
    sqlite3_free(errMsg);
    throw UpstreamError("SQL error on '" + path_ + "': " + message);
  }
}

SqliteStatement TargetDatabase::prepare(const std::string &sql) {
  return SqliteStatement(db_, sql);
}

int64_t TargetDatabase::lastInsertId() const {
  return sqlite3_last_insert_rowid(db_);
}

int TargetDatabase::changes() const { return sqlite3_changes(db_); }

bool TargetDatabase::hasTable(const std::string &tableName) {
  SqliteStatement stmt = prepare(
      "SELECT count(*) FROM sqlite_master WHERE type = 'table' AND name = ?1");
  stmt.bindText(1, tableName);
  return stmt.step() && stmt.columnInt64(0) > 0;
}

std::string TargetDatabase::canonicalPath(const std::string &path) {
  if (path.empty()) {
    return path;
  }
  std::error_code ec;
  std::filesystem::path absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return std::filesystem::path(path).lexically_normal().string();
  }
  std::filesystem::path canonical =
      std::filesystem::weakly_canonical(absolute, ec);
  if (ec) {
    return absolute.lexically_normal().string();
  }
  return canonical.string();
}

SqliteTransaction::SqliteTransaction(TargetDatabase &db)
    : db_(db), done_(false) {
  db_.exec("BEGIN IMMEDIATE");
}

SqliteTransaction::~SqliteTransaction() {
  if (!done_) {
    char *errMsg = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, &errMsg) !=
        SQLITE_OK) {
      Logger::error(LogCategory::DATABASE, "SqliteTransaction",
                    "Rollback failed on '" + db_.path() +
                        "': " + (errMsg ? errMsg : "unknown error"));
    }
    sqlite3_free(errMsg);
  }
}

void SqliteTransaction::commit() {
  db_.exec("COMMIT");
  done_ = true;
}
