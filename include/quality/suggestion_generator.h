#ifndef SUGGESTION_GENERATOR_H
#define SUGGESTION_GENERATOR_H

#include "quality/quality_models.h"
#include "storage/target_database.h"
#include <optional>
#include <vector>

struct SuggestionGenerationSummary {
  size_t suggestionsFound = 0;
  size_t suggestionsCreated = 0;
};

class SuggestionGenerator {
public:
  static bool isAutoApplyable(SuggestionType type, double confidence);
  static Priority priorityFor(Severity severity);

  // Proposal for one violation computed from the record's current values, or
  // nullopt when the record already holds the proposed value.
  std::optional<Suggestion> fromViolation(const Violation &violation,
                                          const NormalizedRecord &record) const;

  // One merge suggestion per non-master member of the group.
  std::vector<Suggestion> fromDuplicateGroup(const DuplicateGroup &group) const;

  // Derives suggestions from the unresolved violations and unmerged duplicate
  // groups of the database. An identical unapplied suggestion is not stored
  // twice.
  SuggestionGenerationSummary generateSuggestions(TargetDatabase &db) const;

  // Writes the suggested value and marks the suggestion applied in one
  // transaction. NotFoundError for an unknown id or record, ConflictError when
  // already applied, ValidationError for suggestions without a writable value.
  void applySuggestion(TargetDatabase &db, int64_t suggestionId) const;
};

#endif
