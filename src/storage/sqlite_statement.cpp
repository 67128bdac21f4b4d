#include "storage/sqlite_statement.h"
#include "core/errors.h"

SqliteStatement::SqliteStatement(sqlite3 *db, const std::string &sql)
    : db_(db), stmt_(nullptr) {
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    std::string message = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw UpstreamError("SQLite prepare failed: " + message);
  }
}

SqliteStatement::~SqliteStatement() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
}

SqliteStatement::SqliteStatement(SqliteStatement &&other) noexcept
    : db_(other.db_), stmt_(other.stmt_) {
  other.stmt_ = nullptr;
}

SqliteStatement &SqliteStatement::operator=(SqliteStatement &&other) noexcept {
  if (this != &other) {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
    db_ = other.db_;
    stmt_ = other.stmt_;
    other.stmt_ = nullptr;
  }
  return *this;
}

void SqliteStatement::check(int rc, const char *what) const {
  if (rc != SQLITE_OK) {
    throw UpstreamError(std::string("SQLite ") + what +
                        " failed: " + sqlite3_errmsg(db_));
  }
}

SqliteStatement &SqliteStatement::bindInt64(int index, int64_t value) {
  check(sqlite3_bind_int64(stmt_, index, value), "bind");
  return *this;
}

SqliteStatement &SqliteStatement::bindDouble(int index, double value) {
  check(sqlite3_bind_double(stmt_, index, value), "bind");
  return *this;
}

SqliteStatement &SqliteStatement::bindText(int index,
                                           const std::string &value) {
  check(sqlite3_bind_text(stmt_, index, value.c_str(),
                          static_cast<int>(value.size()), SQLITE_TRANSIENT),
        "bind");
  return *this;
}

SqliteStatement &
SqliteStatement::bindOptionalText(int index,
                                  const std::optional<std::string> &value) {
  return value ? bindText(index, *value) : bindNull(index);
}

SqliteStatement &SqliteStatement::bindNull(int index) {
  check(sqlite3_bind_null(stmt_, index), "bind");
  return *this;
}

bool SqliteStatement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW)
    return true;
  if (rc == SQLITE_DONE)
    return false;
  throw UpstreamError(std::string("SQLite step failed: ") +
                      sqlite3_errmsg(db_));
}

void SqliteStatement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

int64_t SqliteStatement::columnInt64(int column) const {
  return sqlite3_column_int64(stmt_, column);
}

double SqliteStatement::columnDouble(int column) const {
  return sqlite3_column_double(stmt_, column);
}

std::string SqliteStatement::columnText(int column) const {
  const unsigned char *text = sqlite3_column_text(stmt_, column);
  if (!text)
    return "";
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::optional<std::string>
SqliteStatement::columnOptionalText(int column) const {
  if (columnIsNull(column))
    return std::nullopt;
  return columnText(column);
}

bool SqliteStatement::columnIsNull(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}
