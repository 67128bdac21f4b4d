#ifndef TARGET_DATABASE_H
#define TARGET_DATABASE_H

#include "storage/sqlite_statement.h"
#include <sqlite3.h>
#include <string>

// One project database: a SQLite file holding the raw catalog items, the
// normalized records and the quality artefacts that reference them.
//
// READ_WRITE and CREATE apply the schema on open. READ_ONLY never writes;
// callers check hasTable() before querying.
class TargetDatabase {
public:
  enum class Mode { READ_ONLY, READ_WRITE, CREATE };

  explicit TargetDatabase(const std::string &path,
                          Mode mode = Mode::READ_WRITE);
  ~TargetDatabase();

  TargetDatabase(const TargetDatabase &) = delete;
  TargetDatabase &operator=(const TargetDatabase &) = delete;

  const std::string &path() const { return path_; }
  sqlite3 *handle() { return db_; }

  void exec(const std::string &sql);
  SqliteStatement prepare(const std::string &sql);
  int64_t lastInsertId() const;
  int changes() const;
  bool hasTable(const std::string &tableName);

  // Canonical form of a database path used as the session/run identity:
  // absolute and lexically normalized, symlinks resolved when the file exists.
  static std::string canonicalPath(const std::string &path);

private:
  sqlite3 *db_;
  std::string path_;

  void applySchema();
};

// BEGIN IMMEDIATE ... COMMIT guard. Taking the write lock up front serializes
// merge/resolve/apply per database; the destructor rolls back when commit()
// was not reached.
class SqliteTransaction {
public:
  explicit SqliteTransaction(TargetDatabase &db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction &) = delete;
  SqliteTransaction &operator=(const SqliteTransaction &) = delete;

  void commit();

private:
  TargetDatabase &db_;
  bool done_;
};

#endif
