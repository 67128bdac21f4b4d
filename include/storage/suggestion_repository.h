#ifndef SUGGESTION_REPOSITORY_H
#define SUGGESTION_REPOSITORY_H

#include "quality/quality_models.h"
#include "storage/target_database.h"
#include <optional>
#include <vector>

class SuggestionRepository {
private:
  TargetDatabase &db_;

  static Suggestion readRow(const SqliteStatement &stmt);

public:
  explicit SuggestionRepository(TargetDatabase &db) : db_(db) {}

  // Skips the insert when an unapplied suggestion with the same record, type,
  // field and value exists. Returns true when a row was created.
  bool insertIfAbsent(const Suggestion &suggestion);

  std::optional<Suggestion> findById(int64_t id);

  // Conditional update; returns false when the suggestion was already applied.
  bool markApplied(int64_t id, const std::string &appliedAt);

  // Closes the open merge suggestions of a record folded into its master.
  // Returns the number of suggestions closed.
  int64_t markMergesApplied(int64_t normalizedItemId,
                            const std::string &appliedAt);

  int64_t count(const SuggestionFilter &filter);
  std::vector<Suggestion> list(const SuggestionFilter &filter, int64_t limit,
                               int64_t offset);
};

#endif
