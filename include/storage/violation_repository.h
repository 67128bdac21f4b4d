#ifndef VIOLATION_REPOSITORY_H
#define VIOLATION_REPOSITORY_H

#include "quality/quality_models.h"
#include "storage/target_database.h"
#include <optional>
#include <vector>

class ViolationRepository {
private:
  TargetDatabase &db_;

  static Violation readRow(const SqliteStatement &stmt);

public:
  explicit ViolationRepository(TargetDatabase &db) : db_(db) {}

  // Inserts unless a violation of the same rule already exists for the record,
  // resolved or not. Returns true when a row was created.
  bool insertIfAbsent(const Violation &violation);

  std::optional<Violation> findById(int64_t id);
  std::vector<Violation> findUnresolved();

  // Conditional update; returns false when the violation was already resolved.
  bool markResolved(int64_t id, const std::string &resolvedBy,
                    const std::string &resolvedAt);

  int64_t count(const ViolationFilter &filter);
  std::vector<Violation> list(const ViolationFilter &filter, int64_t limit,
                              int64_t offset);
};

#endif
