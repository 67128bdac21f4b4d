#ifndef CATALOG_ITEM_READER_H
#define CATALOG_ITEM_READER_H

#include "storage/target_database.h"
#include <cstdint>
#include <string>
#include <vector>

// Raw tuple written by the ingestion step into catalog_items.
struct RawCatalogItem {
  int64_t rowId = 0;
  std::string reference;
  std::string code;
  std::string name;
  std::string payload;
};

// Keyset cursor over catalog_items ordered by row id.
class CatalogItemReader {
private:
  TargetDatabase &db_;

public:
  explicit CatalogItemReader(TargetDatabase &db) : db_(db) {}

  int64_t countItems();
  std::vector<RawCatalogItem> fetchBatch(int64_t afterRowId, size_t limit);
};

#endif
