#ifndef TEMP_DATABASE_H
#define TEMP_DATABASE_H

#include "normalization/text_normalizer.h"
#include "quality/quality_models.h"
#include "storage/normalized_record_repository.h"
#include "storage/target_database.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>

// Scratch directory removed with everything in it when the object dies.
class TempDirectory {
private:
  std::filesystem::path path_;

public:
  TempDirectory() {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("cq_test_" + std::to_string(::getpid()) + "_" +
             std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }

  ~TempDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDirectory(const TempDirectory &) = delete;
  TempDirectory &operator=(const TempDirectory &) = delete;

  std::string file(const std::string &name) const {
    return (path_ / name).string();
  }
};

// Creates the file with the full schema and returns its canonical path.
inline std::string createTargetDatabase(const TempDirectory &dir,
                                        const std::string &name) {
  std::string path = dir.file(name);
  TargetDatabase db(path, TargetDatabase::Mode::CREATE);
  return TargetDatabase::canonicalPath(path);
}

inline void insertCatalogItem(TargetDatabase &db, const std::string &reference,
                              const std::string &code, const std::string &name,
                              const std::string &payload = "") {
  SqliteStatement stmt = db.prepare(
      "INSERT INTO catalog_items (reference, code, name, payload) "
      "VALUES (?1, ?2, ?3, ?4)");
  stmt.bindText(1, reference).bindText(2, code).bindText(3, name).bindText(
      4, payload);
  stmt.step();
}

inline NormalizedRecord makeRecord(const std::string &reference,
                                   const std::string &code,
                                   const std::string &name,
                                   double qualityScore,
                                   ProcessingLevel level = ProcessingLevel::BASIC) {
  NormalizedRecord record;
  record.sourceReference = reference;
  record.code = code;
  record.name = name;
  record.normalizedName = TextNormalizer::normalizeName(name);
  record.category = "Крепеж";
  record.qualityScore = qualityScore;
  record.processingLevel = level;
  return record;
}

inline int64_t insertRecord(TargetDatabase &db, const NormalizedRecord &record) {
  return NormalizedRecordRepository(db).upsert(record);
}

#endif
