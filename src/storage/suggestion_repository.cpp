#include "storage/suggestion_repository.h"

namespace {
const char *const SELECT_COLUMNS =
    "SELECT id, normalized_item_id, type, priority, field, current_value, "
    "suggested_value, confidence, reasoning, auto_applyable, applied, "
    "applied_at, created_at FROM quality_suggestions ";

// Filter parameters are numbered from ?1 in bindFilter() order; LIMIT/OFFSET
// use ?100/?101.
std::string whereClause(const SuggestionFilter &filter) {
  std::string where = "WHERE 1 = 1";
  int param = 1;
  if (filter.priority)
    where += " AND priority = ?" + std::to_string(param++);
  if (filter.type)
    where += " AND type = ?" + std::to_string(param++);
  if (filter.applied)
    where += " AND applied = ?" + std::to_string(param++);
  if (filter.autoApplyable)
    where += " AND auto_applyable = ?" + std::to_string(param++);
  return where + " ";
}

void bindFilter(SqliteStatement &stmt, const SuggestionFilter &filter) {
  int param = 1;
  if (filter.priority)
    stmt.bindText(param++, toString(*filter.priority));
  if (filter.type)
    stmt.bindText(param++, toString(*filter.type));
  if (filter.applied)
    stmt.bindInt64(param++, *filter.applied ? 1 : 0);
  if (filter.autoApplyable)
    stmt.bindInt64(param++, *filter.autoApplyable ? 1 : 0);
}
} // namespace

Suggestion SuggestionRepository::readRow(const SqliteStatement &stmt) {
  Suggestion s;
  s.id = stmt.columnInt64(0);
  s.normalizedItemId = stmt.columnInt64(1);
  s.type = suggestionTypeFromString(stmt.columnText(2));
  s.priority = priorityFromString(stmt.columnText(3));
  s.field = stmt.columnText(4);
  s.currentValue = stmt.columnText(5);
  s.suggestedValue = stmt.columnText(6);
  s.confidence = stmt.columnDouble(7);
  s.reasoning = stmt.columnText(8);
  s.autoApplyable = stmt.columnInt64(9) != 0;
  s.applied = stmt.columnInt64(10) != 0;
  s.appliedAt = stmt.columnOptionalText(11);
  s.createdAt = stmt.columnText(12);
  return s;
}

bool SuggestionRepository::insertIfAbsent(const Suggestion &suggestion) {
  SqliteStatement stmt = db_.prepare(
      "INSERT OR IGNORE INTO quality_suggestions (normalized_item_id, type, "
      "priority, field, current_value, suggested_value, confidence, "
      "reasoning, auto_applyable, created_at) "
      "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)");
  stmt.bindInt64(1, suggestion.normalizedItemId)
      .bindText(2, toString(suggestion.type))
      .bindText(3, toString(suggestion.priority))
      .bindText(4, suggestion.field)
      .bindText(5, suggestion.currentValue)
      .bindText(6, suggestion.suggestedValue)
      .bindDouble(7, clampUnit(suggestion.confidence))
      .bindText(8, suggestion.reasoning)
      .bindInt64(9, suggestion.autoApplyable ? 1 : 0)
      .bindText(10, suggestion.createdAt);
  stmt.step();
  return db_.changes() > 0;
}

std::optional<Suggestion> SuggestionRepository::findById(int64_t id) {
  SqliteStatement stmt =
      db_.prepare(std::string(SELECT_COLUMNS) + "WHERE id = ?1");
  stmt.bindInt64(1, id);
  if (!stmt.step())
    return std::nullopt;
  return readRow(stmt);
}

bool SuggestionRepository::markApplied(int64_t id,
                                       const std::string &appliedAt) {
  SqliteStatement stmt =
      db_.prepare("UPDATE quality_suggestions SET applied = 1, "
                  "applied_at = ?2 WHERE id = ?1 AND applied = 0");
  stmt.bindInt64(1, id).bindText(2, appliedAt);
  stmt.step();
  return db_.changes() > 0;
}

int64_t SuggestionRepository::markMergesApplied(int64_t normalizedItemId,
                                                const std::string &appliedAt) {
  SqliteStatement stmt = db_.prepare(
      "UPDATE quality_suggestions SET applied = 1, applied_at = ?3 "
      "WHERE normalized_item_id = ?1 AND type = ?2 AND applied = 0");
  stmt.bindInt64(1, normalizedItemId)
      .bindText(2, toString(SuggestionType::MERGE))
      .bindText(3, appliedAt);
  stmt.step();
  return static_cast<int64_t>(db_.changes());
}

int64_t SuggestionRepository::count(const SuggestionFilter &filter) {
  SqliteStatement stmt = db_.prepare(
      "SELECT count(*) FROM quality_suggestions " + whereClause(filter));
  bindFilter(stmt, filter);
  return stmt.step() ? stmt.columnInt64(0) : 0;
}

std::vector<Suggestion>
SuggestionRepository::list(const SuggestionFilter &filter, int64_t limit,
                           int64_t offset) {
  std::vector<Suggestion> suggestions;
  SqliteStatement stmt = db_.prepare(std::string(SELECT_COLUMNS) +
                                     whereClause(filter) +
                                     "ORDER BY id LIMIT ?100 OFFSET ?101");
  bindFilter(stmt, filter);
  stmt.bindInt64(100, limit).bindInt64(101, offset);
  while (stmt.step()) {
    suggestions.push_back(readRow(stmt));
  }
  return suggestions;
}
