#include "storage/duplicate_group_repository.h"
#include <algorithm>

namespace {
const char *const SELECT_COLUMNS =
    "SELECT id, detection_method, similarity_score, suggested_master_id, "
    "item_count, merged, merged_at, created_at "
    "FROM quality_duplicate_groups ";

std::string whereClause(const DuplicateFilter &filter) {
  return filter.unmergedOnly ? "WHERE merged = 0 " : "";
}
} // namespace

DuplicateGroup DuplicateGroupRepository::readRow(const SqliteStatement &stmt) {
  DuplicateGroup group;
  group.id = stmt.columnInt64(0);
  group.detectionMethod = detectionMethodFromString(stmt.columnText(1));
  group.similarityScore = stmt.columnDouble(2);
  group.suggestedMasterId = stmt.columnInt64(3);
  group.itemCount = stmt.columnInt64(4);
  group.merged = stmt.columnInt64(5) != 0;
  group.mergedAt = stmt.columnOptionalText(6);
  group.createdAt = stmt.columnText(7);
  return group;
}

void DuplicateGroupRepository::loadMembers(DuplicateGroup &group) {
  SqliteStatement stmt = db_.prepare(
      "SELECT normalized_item_id FROM quality_duplicate_members "
      "WHERE group_id = ?1 ORDER BY normalized_item_id");
  stmt.bindInt64(1, group.id);
  group.memberIds.clear();
  while (stmt.step()) {
    group.memberIds.push_back(stmt.columnInt64(0));
  }
}

std::string DuplicateGroupRepository::memberKey(std::vector<int64_t> memberIds) {
  std::sort(memberIds.begin(), memberIds.end());
  std::string key;
  for (size_t i = 0; i < memberIds.size(); ++i) {
    if (i > 0)
      key += ',';
    key += std::to_string(memberIds[i]);
  }
  return key;
}

int64_t DuplicateGroupRepository::insert(const DuplicateGroup &group) {
  SqliteStatement stmt = db_.prepare(
      "INSERT INTO quality_duplicate_groups (detection_method, "
      "similarity_score, suggested_master_id, item_count, member_key, "
      "created_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
  stmt.bindText(1, toString(group.detectionMethod))
      .bindDouble(2, clampUnit(group.similarityScore))
      .bindInt64(3, group.suggestedMasterId)
      .bindInt64(4, static_cast<int64_t>(group.memberIds.size()))
      .bindText(5, memberKey(group.memberIds))
      .bindText(6, group.createdAt);
  stmt.step();
  int64_t groupId = db_.lastInsertId();

  SqliteStatement member =
      db_.prepare("INSERT INTO quality_duplicate_members (group_id, "
                  "normalized_item_id) VALUES (?1, ?2)");
  for (int64_t itemId : group.memberIds) {
    member.reset();
    member.bindInt64(1, groupId).bindInt64(2, itemId);
    member.step();
  }
  return groupId;
}

void DuplicateGroupRepository::remove(int64_t id) {
  SqliteStatement members = db_.prepare(
      "DELETE FROM quality_duplicate_members WHERE group_id = ?1");
  members.bindInt64(1, id);
  members.step();

  SqliteStatement group =
      db_.prepare("DELETE FROM quality_duplicate_groups WHERE id = ?1");
  group.bindInt64(1, id);
  group.step();
}

std::optional<DuplicateGroup> DuplicateGroupRepository::findById(int64_t id) {
  SqliteStatement stmt =
      db_.prepare(std::string(SELECT_COLUMNS) + "WHERE id = ?1");
  stmt.bindInt64(1, id);
  if (!stmt.step())
    return std::nullopt;
  DuplicateGroup group = readRow(stmt);
  loadMembers(group);
  return group;
}

std::vector<DuplicateGroup> DuplicateGroupRepository::findUnmerged() {
  DuplicateFilter filter;
  filter.unmergedOnly = true;
  return list(filter, -1, 0);
}

bool DuplicateGroupRepository::markMerged(int64_t id,
                                          const std::string &mergedAt) {
  SqliteStatement stmt =
      db_.prepare("UPDATE quality_duplicate_groups SET merged = 1, "
                  "merged_at = ?2 WHERE id = ?1 AND merged = 0");
  stmt.bindInt64(1, id).bindText(2, mergedAt);
  stmt.step();
  return db_.changes() > 0;
}

int64_t DuplicateGroupRepository::count(const DuplicateFilter &filter) {
  SqliteStatement stmt = db_.prepare(
      "SELECT count(*) FROM quality_duplicate_groups " + whereClause(filter));
  return stmt.step() ? stmt.columnInt64(0) : 0;
}

// A negative limit returns every matching group (SQLite LIMIT -1).
std::vector<DuplicateGroup>
DuplicateGroupRepository::list(const DuplicateFilter &filter, int64_t limit,
                               int64_t offset) {
  std::vector<DuplicateGroup> groups;
  SqliteStatement stmt =
      db_.prepare(std::string(SELECT_COLUMNS) + whereClause(filter) +
                  "ORDER BY id LIMIT ?1 OFFSET ?2");
  stmt.bindInt64(1, limit).bindInt64(2, offset);
  while (stmt.step()) {
    groups.push_back(readRow(stmt));
  }
  for (auto &group : groups) {
    loadMembers(group);
  }
  return groups;
}
