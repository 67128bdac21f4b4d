#include "storage/normalized_record_repository.h"
#include "core/errors.h"
#include "utils/time_utils.h"
#include <array>

namespace {
const char *const SELECT_COLUMNS =
    "SELECT id, source_reference, code, name, normalized_name, category, inn, "
    "kpp, unit, attributes, processing_level, quality_score, ai_confidence, "
    "is_active, merged_count, created_at, updated_at FROM normalized_data ";

const std::array<const char *, 8> WRITABLE_FIELDS = {
    "name", "normalized_name", "code", "category",
    "inn",  "kpp",             "unit", "processing_level"};
} // namespace

NormalizedRecord NormalizedRecordRepository::readRow(const SqliteStatement &stmt) {
  NormalizedRecord record;
  record.id = stmt.columnInt64(0);
  record.sourceReference = stmt.columnText(1);
  record.code = stmt.columnText(2);
  record.name = stmt.columnText(3);
  record.normalizedName = stmt.columnText(4);
  record.category = stmt.columnText(5);
  record.inn = stmt.columnText(6);
  record.kpp = stmt.columnText(7);
  record.unit = stmt.columnText(8);
  record.attributes = stmt.columnText(9);
  record.processingLevel = processingLevelFromString(stmt.columnText(10));
  record.qualityScore = stmt.columnDouble(11);
  record.aiConfidence = stmt.columnDouble(12);
  record.isActive = stmt.columnInt64(13) != 0;
  record.mergedCount = stmt.columnInt64(14);
  record.createdAt = stmt.columnText(15);
  record.updatedAt = stmt.columnText(16);
  return record;
}

int64_t NormalizedRecordRepository::upsert(const NormalizedRecord &record) {
  std::string now = TimeUtils::nowIso8601Utc();
  SqliteStatement stmt = db_.prepare(
      "INSERT INTO normalized_data (source_reference, code, name, "
      "normalized_name, category, inn, kpp, unit, attributes, "
      "processing_level, quality_score, ai_confidence, created_at, "
      "updated_at) "
      "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?13) "
      "ON CONFLICT(source_reference) DO UPDATE SET "
      "code = excluded.code, name = excluded.name, "
      "normalized_name = excluded.normalized_name, "
      "category = excluded.category, inn = excluded.inn, kpp = excluded.kpp, "
      "unit = excluded.unit, attributes = excluded.attributes, "
      "processing_level = excluded.processing_level, "
      "quality_score = excluded.quality_score, "
      "ai_confidence = excluded.ai_confidence, "
      "updated_at = excluded.updated_at "
      "RETURNING id");
  stmt.bindText(1, record.sourceReference)
      .bindText(2, record.code)
      .bindText(3, record.name)
      .bindText(4, record.normalizedName)
      .bindText(5, record.category)
      .bindText(6, record.inn)
      .bindText(7, record.kpp)
      .bindText(8, record.unit)
      .bindText(9, record.attributes)
      .bindText(10, toString(record.processingLevel))
      .bindDouble(11, clampUnit(record.qualityScore))
      .bindDouble(12, clampUnit(record.aiConfidence))
      .bindText(13, now);

  if (!stmt.step()) {
    throw UpstreamError("Upsert of '" + record.sourceReference +
                        "' returned no id");
  }
  int64_t id = stmt.columnInt64(0);
  // RETURNING rows are only final once the statement has run to completion.
  while (stmt.step()) {
  }
  return id;
}

std::optional<NormalizedRecord>
NormalizedRecordRepository::findById(int64_t id) {
  SqliteStatement stmt = db_.prepare(std::string(SELECT_COLUMNS) +
                                     "WHERE id = ?1");
  stmt.bindInt64(1, id);
  if (!stmt.step())
    return std::nullopt;
  return readRow(stmt);
}

std::vector<NormalizedRecord> NormalizedRecordRepository::loadActive() {
  std::vector<NormalizedRecord> records;
  SqliteStatement stmt = db_.prepare(std::string(SELECT_COLUMNS) +
                                     "WHERE is_active = 1 ORDER BY id");
  while (stmt.step()) {
    records.push_back(readRow(stmt));
  }
  return records;
}

bool NormalizedRecordRepository::deactivate(int64_t id) {
  SqliteStatement stmt =
      db_.prepare("UPDATE normalized_data SET is_active = 0, updated_at = ?2 "
                  "WHERE id = ?1 AND is_active = 1");
  stmt.bindInt64(1, id).bindText(2, TimeUtils::nowIso8601Utc());
  stmt.step();
  return db_.changes() > 0;
}

void NormalizedRecordRepository::addMergedCount(int64_t id, int64_t count) {
  SqliteStatement stmt = db_.prepare(
      "UPDATE normalized_data SET merged_count = merged_count + ?2, "
      "updated_at = ?3 WHERE id = ?1");
  stmt.bindInt64(1, id).bindInt64(2, count).bindText(
      3, TimeUtils::nowIso8601Utc());
  stmt.step();
  if (db_.changes() == 0) {
    throw NotFoundError("Record " + std::to_string(id) + " not found");
  }
}

bool NormalizedRecordRepository::isWritableField(const std::string &field) {
  for (const char *candidate : WRITABLE_FIELDS) {
    if (field == candidate)
      return true;
  }
  return false;
}

bool NormalizedRecordRepository::updateField(int64_t id,
                                             const std::string &field,
                                             const std::string &value) {
  if (!isWritableField(field)) {
    throw ValidationError("Field '" + field + "' cannot be written");
  }
  if (field == "processing_level") {
    processingLevelFromString(value);
  }

  // field is one of the whitelisted column names above.
  SqliteStatement stmt = db_.prepare("UPDATE normalized_data SET " + field +
                                     " = ?2, updated_at = ?3 WHERE id = ?1");
  stmt.bindInt64(1, id).bindText(2, value).bindText(
      3, TimeUtils::nowIso8601Utc());
  stmt.step();
  return db_.changes() > 0;
}

QualityStats NormalizedRecordRepository::computeStats() {
  QualityStats stats;
  SqliteStatement stmt = db_.prepare(
      "SELECT processing_level, count(*), avg(quality_score) "
      "FROM normalized_data WHERE is_active = 1 GROUP BY processing_level");

  double qualitySum = 0.0;
  while (stmt.step()) {
    ProcessingLevel level = processingLevelFromString(stmt.columnText(0));
    LevelStats &bucket = stats.level(level);
    bucket.count = stmt.columnInt64(1);
    bucket.avgQuality = stmt.columnDouble(2);
    stats.totalItems += bucket.count;
    qualitySum += bucket.avgQuality * static_cast<double>(bucket.count);
  }

  if (stats.totalItems > 0) {
    double total = static_cast<double>(stats.totalItems);
    for (ProcessingLevel level :
         {ProcessingLevel::BASIC, ProcessingLevel::AI_ENHANCED,
          ProcessingLevel::BENCHMARK}) {
      LevelStats &bucket = stats.level(level);
      bucket.percentage = static_cast<double>(bucket.count) / total * 100.0;
    }
    stats.averageQuality = qualitySum / total;
  }
  stats.benchmarkCount = stats.benchmark.count;
  stats.benchmarkPercentage = stats.benchmark.percentage;
  return stats;
}
