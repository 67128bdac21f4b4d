#ifndef DATABASE_LOG_WRITER_H
#define DATABASE_LOG_WRITER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

// Inserts entries into metadata.logs of the service database, keyed by the
// normalization session when one is active so a run's log can be pulled with
// one query. A broken connection disables the writer for the rest of the
// process.
class DatabaseLogWriter : public ILogWriter {
private:
  std::unique_ptr<pqxx::connection> conn_;
  bool enabled_ = false;
  mutable std::mutex mutex_;

public:
  explicit DatabaseLogWriter(const std::string &connectionString);
  ~DatabaseLogWriter() override { close(); }

  bool write(const LogEntry &entry) override;
  void flush() override {}
  void close() override;
  bool isOpen() const override;
  std::string name() const override { return "metadata.logs"; }

private:
  void ensureSchemaUnlocked();
  void disableUnlocked(const std::string &reason);
};

#endif
