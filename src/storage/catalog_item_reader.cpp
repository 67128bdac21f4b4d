#include "storage/catalog_item_reader.h"

int64_t CatalogItemReader::countItems() {
  SqliteStatement stmt = db_.prepare("SELECT count(*) FROM catalog_items");
  return stmt.step() ? stmt.columnInt64(0) : 0;
}

std::vector<RawCatalogItem> CatalogItemReader::fetchBatch(int64_t afterRowId,
                                                          size_t limit) {
  std::vector<RawCatalogItem> items;
  items.reserve(limit);

  SqliteStatement stmt =
      db_.prepare("SELECT id, reference, code, name, payload "
                  "FROM catalog_items WHERE id > ?1 ORDER BY id LIMIT ?2");
  stmt.bindInt64(1, afterRowId);
  stmt.bindInt64(2, static_cast<int64_t>(limit));

  while (stmt.step()) {
    RawCatalogItem item;
    item.rowId = stmt.columnInt64(0);
    item.reference = stmt.columnText(1);
    item.code = stmt.columnText(2);
    item.name = stmt.columnText(3);
    item.payload = stmt.columnText(4);
    items.push_back(std::move(item));
  }
  return items;
}
