#ifndef SQLITE_STATEMENT_H
#define SQLITE_STATEMENT_H

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>

// Owns one prepared statement. Every failure is raised as UpstreamError with
// the SQLite error message; bind indexes are 1-based, column indexes 0-based.
class SqliteStatement {
private:
  sqlite3 *db_;
  sqlite3_stmt *stmt_;

  void check(int rc, const char *what) const;

public:
  SqliteStatement(sqlite3 *db, const std::string &sql);
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement &) = delete;
  SqliteStatement &operator=(const SqliteStatement &) = delete;
  SqliteStatement(SqliteStatement &&other) noexcept;
  SqliteStatement &operator=(SqliteStatement &&other) noexcept;

  SqliteStatement &bindInt64(int index, int64_t value);
  SqliteStatement &bindDouble(int index, double value);
  SqliteStatement &bindText(int index, const std::string &value);
  SqliteStatement &bindOptionalText(int index,
                                    const std::optional<std::string> &value);
  SqliteStatement &bindNull(int index);

  // Returns true while a row is available, false once the statement is done.
  bool step();
  void reset();

  int64_t columnInt64(int column) const;
  double columnDouble(int column) const;
  std::string columnText(int column) const;
  std::optional<std::string> columnOptionalText(int column) const;
  bool columnIsNull(int column) const;
};

#endif
