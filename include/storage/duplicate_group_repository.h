#ifndef DUPLICATE_GROUP_REPOSITORY_H
#define DUPLICATE_GROUP_REPOSITORY_H

#include "quality/quality_models.h"
#include "storage/target_database.h"
#include <optional>
#include <string>
#include <vector>

// Access to quality_duplicate_groups and their member rows. A group's
// member_key is the comma-joined ascending list of member ids; it identifies
// the member set independently of detection order.
class DuplicateGroupRepository {
private:
  TargetDatabase &db_;

  static DuplicateGroup readRow(const SqliteStatement &stmt);
  void loadMembers(DuplicateGroup &group);

public:
  explicit DuplicateGroupRepository(TargetDatabase &db) : db_(db) {}

  static std::string memberKey(std::vector<int64_t> memberIds);

  int64_t insert(const DuplicateGroup &group);
  void remove(int64_t id);

  std::optional<DuplicateGroup> findById(int64_t id);
  std::vector<DuplicateGroup> findUnmerged();

  // Conditional update; returns false when the group was already merged.
  bool markMerged(int64_t id, const std::string &mergedAt);

  int64_t count(const DuplicateFilter &filter);
  std::vector<DuplicateGroup> list(const DuplicateFilter &filter,
                                   int64_t limit, int64_t offset);
};

#endif
