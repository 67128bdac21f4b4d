#include "storage/violation_repository.h"
#include "utils/string_utils.h"

namespace {
const char *const SELECT_COLUMNS =
    "SELECT id, normalized_item_id, rule_name, category, severity, message, "
    "recommendation, field_name, current_value, resolved, resolved_by, "
    "resolved_at, created_at FROM quality_violations ";

// Filter parameters are numbered from ?1 in the order bindFilter() binds
// them; LIMIT/OFFSET use ?100/?101.
// utf8_lower() is registered on every TargetDatabase connection.
std::string whereClause(const ViolationFilter &filter) {
  std::string where = "WHERE 1 = 1";
  int param = 1;
  if (!filter.showResolved)
    where += " AND resolved = 0";
  if (filter.severity)
    where += " AND severity = ?" + std::to_string(param++);
  if (filter.category)
    where += " AND category = ?" + std::to_string(param++);
  if (!filter.search.empty()) {
    std::string p = "?" + std::to_string(param++);
    where += " AND (instr(utf8_lower(message), " + p +
             ") > 0 OR instr(utf8_lower(rule_name), " + p +
             ") > 0 OR instr(utf8_lower(current_value), " + p + ") > 0)";
  }
  return where + " ";
}

void bindFilter(SqliteStatement &stmt, const ViolationFilter &filter) {
  int param = 1;
  if (filter.severity)
    stmt.bindText(param++, toString(*filter.severity));
  if (filter.category)
    stmt.bindText(param++, toString(*filter.category));
  if (!filter.search.empty())
    stmt.bindText(param++, StringUtils::utf8ToLower(filter.search));
}
} // namespace

Violation ViolationRepository::readRow(const SqliteStatement &stmt) {
  Violation v;
  v.id = stmt.columnInt64(0);
  v.normalizedItemId = stmt.columnInt64(1);
  v.ruleName = stmt.columnText(2);
  v.category = violationCategoryFromString(stmt.columnText(3));
  v.severity = severityFromString(stmt.columnText(4));
  v.message = stmt.columnText(5);
  v.recommendation = stmt.columnText(6);
  v.fieldName = stmt.columnText(7);
  v.currentValue = stmt.columnText(8);
  v.resolved = stmt.columnInt64(9) != 0;
  v.resolvedBy = stmt.columnOptionalText(10);
  v.resolvedAt = stmt.columnOptionalText(11);
  v.createdAt = stmt.columnText(12);
  return v;
}

bool ViolationRepository::insertIfAbsent(const Violation &violation) {
  SqliteStatement stmt = db_.prepare(
      "INSERT OR IGNORE INTO quality_violations (normalized_item_id, "
      "rule_name, category, severity, message, recommendation, field_name, "
      "current_value, created_at) "
      "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)");
  stmt.bindInt64(1, violation.normalizedItemId)
      .bindText(2, violation.ruleName)
      .bindText(3, toString(violation.category))
      .bindText(4, toString(violation.severity))
      .bindText(5, violation.message)
      .bindText(6, violation.recommendation)
      .bindText(7, violation.fieldName)
      .bindText(8, violation.currentValue)
      .bindText(9, violation.createdAt);
  stmt.step();
  return db_.changes() > 0;
}

std::optional<Violation> ViolationRepository::findById(int64_t id) {
  SqliteStatement stmt =
      db_.prepare(std::string(SELECT_COLUMNS) + "WHERE id = ?1");
  stmt.bindInt64(1, id);
  if (!stmt.step())
    return std::nullopt;
  return readRow(stmt);
}

std::vector<Violation> ViolationRepository::findUnresolved() {
  return list(ViolationFilter{}, -1, 0);
}

bool ViolationRepository::markResolved(int64_t id,
                                       const std::string &resolvedBy,
                                       const std::string &resolvedAt) {
  SqliteStatement stmt = db_.prepare(
      "UPDATE quality_violations SET resolved = 1, resolved_by = ?2, "
      "resolved_at = ?3 WHERE id = ?1 AND resolved = 0");
  stmt.bindInt64(1, id).bindText(2, resolvedBy).bindText(3, resolvedAt);
  stmt.step();
  return db_.changes() > 0;
}

int64_t ViolationRepository::count(const ViolationFilter &filter) {
  SqliteStatement stmt = db_.prepare("SELECT count(*) FROM quality_violations " +
                                     whereClause(filter));
  bindFilter(stmt, filter);
  return stmt.step() ? stmt.columnInt64(0) : 0;
}

std::vector<Violation> ViolationRepository::list(const ViolationFilter &filter,
                                                 int64_t limit,
                                                 int64_t offset) {
  std::vector<Violation> violations;
  SqliteStatement stmt = db_.prepare(std::string(SELECT_COLUMNS) +
                                     whereClause(filter) +
                                     "ORDER BY id LIMIT ?100 OFFSET ?101");
  bindFilter(stmt, filter);
  stmt.bindInt64(100, limit).bindInt64(101, offset);
  while (stmt.step()) {
    violations.push_back(readRow(stmt));
  }
  return violations;
}
