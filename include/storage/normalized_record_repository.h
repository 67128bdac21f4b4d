#ifndef NORMALIZED_RECORD_REPOSITORY_H
#define NORMALIZED_RECORD_REPOSITORY_H

#include "quality/quality_models.h"
#include "storage/target_database.h"
#include <optional>
#include <string>
#include <vector>

// Access to normalized_data. Write methods expect the caller to hold a
// SqliteTransaction when several writes must be atomic.
class NormalizedRecordRepository {
private:
  TargetDatabase &db_;

  static NormalizedRecord readRow(const SqliteStatement &stmt);

public:
  explicit NormalizedRecordRepository(TargetDatabase &db) : db_(db) {}

  // Inserts or refreshes the record keyed by source_reference. Activity and
  // merge bookkeeping of an existing record are preserved. Returns the id.
  int64_t upsert(const NormalizedRecord &record);

  std::optional<NormalizedRecord> findById(int64_t id);
  std::vector<NormalizedRecord> loadActive();

  bool deactivate(int64_t id);
  void addMergedCount(int64_t id, int64_t count);

  // Writes one whitelisted field (name, normalized_name, code, category, inn,
  // kpp, unit, processing_level). Throws ValidationError for other fields.
  bool updateField(int64_t id, const std::string &field,
                   const std::string &value);

  static bool isWritableField(const std::string &field);

  // Per-level counts and averages over active records.
  QualityStats computeStats();
};

#endif
