#include "quality/suggestion_generator.h"
#include "core/errors.h"
#include "core/logger.h"
#include "normalization/field_extractor.h"
#include "normalization/text_normalizer.h"
#include "storage/duplicate_group_repository.h"
#include "storage/normalized_record_repository.h"
#include "storage/suggestion_repository.h"
#include "storage/violation_repository.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <sstream>
#include <unordered_map>

namespace {
constexpr double TRIM_CONFIDENCE = 0.98;
constexpr double CODE_FORMAT_CONFIDENCE = 0.95;
constexpr double IDENTIFIER_CLEANUP_CONFIDENCE = 0.95;
constexpr double CASE_CONFIDENCE = 0.70;
constexpr double CATEGORY_GUESS_CONFIDENCE = 0.75;
constexpr double REPROCESS_CONFIDENCE = 0.80;
constexpr double REVIEW_CONFIDENCE = 0.50;
constexpr double HIGH_PRIORITY_MERGE_SIMILARITY = 0.95;

std::string sentenceCase(const std::string &text) {
  std::u32string cps = StringUtils::decodeUtf8(text);
  bool first = true;
  for (char32_t &cp : cps) {
    if (first && StringUtils::isLetterCodePoint(cp)) {
      cp = StringUtils::toUpperCodePoint(cp);
      first = false;
    } else {
      cp = StringUtils::toLowerCodePoint(cp);
    }
  }
  return StringUtils::encodeUtf8(cps);
}

std::string formatSimilarity(double value) {
  std::ostringstream out;
  out.precision(2);
  out << std::fixed << value;
  return out.str();
}
} // namespace

bool SuggestionGenerator::isAutoApplyable(SuggestionType type,
                                          double confidence) {
  return (type == SuggestionType::SET_VALUE ||
          type == SuggestionType::CORRECT_FORMAT) &&
         confidence >= AUTO_APPLY_CONFIDENCE;
}

Priority SuggestionGenerator::priorityFor(Severity severity) {
  switch (severity) {
  case Severity::CRITICAL:
    return Priority::CRITICAL;
  case Severity::ERROR:
    return Priority::HIGH;
  case Severity::WARNING:
    return Priority::MEDIUM;
  case Severity::INFO:
    return Priority::LOW;
  }
  return Priority::LOW;
}

std::optional<Suggestion>
SuggestionGenerator::fromViolation(const Violation &violation,
                                   const NormalizedRecord &record) const {
  Suggestion suggestion;
  suggestion.normalizedItemId = record.id;
  suggestion.priority = priorityFor(violation.severity);
  suggestion.reasoning = violation.message + " (" + violation.ruleName + ")";

  auto review = [&](const std::string &field, const std::string &current) {
    suggestion.type = SuggestionType::REVIEW;
    suggestion.field = field;
    suggestion.currentValue = current;
    suggestion.suggestedValue.clear();
    suggestion.confidence = REVIEW_CONFIDENCE;
  };
  auto propose = [&](SuggestionType type, const std::string &field,
                     const std::string &current, const std::string &value,
                     double confidence) {
    suggestion.type = type;
    suggestion.field = field;
    suggestion.currentValue = current;
    suggestion.suggestedValue = value;
    suggestion.confidence = confidence;
  };

  const std::string &rule = violation.ruleName;
  if (rule == "name_required" || rule == "name_too_short") {
    review("name", record.name);
  } else if (rule == "code_required") {
    review("code", record.code);
  } else if (rule == "name_not_trimmed") {
    propose(SuggestionType::CORRECT_FORMAT, "name", record.name,
            TextNormalizer::cleanName(record.name), TRIM_CONFIDENCE);
  } else if (rule == "name_all_caps") {
    propose(SuggestionType::CORRECT_FORMAT, "name", record.name,
            sentenceCase(TextNormalizer::cleanName(record.name)),
            CASE_CONFIDENCE);
  } else if (rule == "code_format") {
    std::string canonical = TextNormalizer::normalizeCode(record.code);
    if (canonical.empty()) {
      review("code", record.code);
    } else {
      propose(SuggestionType::CORRECT_FORMAT, "code", record.code, canonical,
              CODE_FORMAT_CONFIDENCE);
    }
  } else if (rule == "category_missing") {
    std::string guess = FieldExtractor::guessCategory(record.normalizedName);
    if (guess.empty()) {
      review("category", record.category);
    } else {
      propose(SuggestionType::SET_VALUE, "category", record.category, guess,
              CATEGORY_GUESS_CONFIDENCE);
    }
  } else if (rule == "inn_invalid" || rule == "kpp_invalid") {
    bool isInn = rule == "inn_invalid";
    const std::string &current = isInn ? record.inn : record.kpp;
    std::string cleaned = FieldExtractor::cleanIdentifier(current);
    bool cleanedValid = isInn ? FieldExtractor::isValidInn(cleaned)
                              : FieldExtractor::isValidKpp(cleaned);
    if (cleaned != current && cleanedValid) {
      propose(SuggestionType::CORRECT_FORMAT, isInn ? "inn" : "kpp", current,
              cleaned, IDENTIFIER_CLEANUP_CONFIDENCE);
    } else {
      review(isInn ? "inn" : "kpp", current);
    }
  } else if (rule == "low_quality_score" || rule == "low_ai_confidence" ||
             rule == "benchmark_inconsistent") {
    // Reprocessing a basic record would leave it where it is.
    if (record.processingLevel == ProcessingLevel::BASIC) {
      review(violation.fieldName, violation.currentValue);
    } else {
      propose(SuggestionType::REPROCESS, "processing_level",
              toString(record.processingLevel),
              toString(ProcessingLevel::BASIC), REPROCESS_CONFIDENCE);
    }
  } else {
    review(violation.fieldName, violation.currentValue);
  }

  if ((suggestion.type == SuggestionType::SET_VALUE ||
       suggestion.type == SuggestionType::CORRECT_FORMAT ||
       suggestion.type == SuggestionType::REPROCESS) &&
      suggestion.suggestedValue == suggestion.currentValue) {
    return std::nullopt;
  }
  suggestion.autoApplyable =
      isAutoApplyable(suggestion.type, suggestion.confidence);
  return suggestion;
}

std::vector<Suggestion>
SuggestionGenerator::fromDuplicateGroup(const DuplicateGroup &group) const {
  std::vector<Suggestion> suggestions;
  if (group.merged)
    return suggestions;

  for (int64_t member : group.memberIds) {
    if (member == group.suggestedMasterId)
      continue;
    Suggestion suggestion;
    suggestion.normalizedItemId = member;
    suggestion.type = SuggestionType::MERGE;
    suggestion.priority = group.similarityScore >= HIGH_PRIORITY_MERGE_SIMILARITY
                              ? Priority::HIGH
                              : Priority::MEDIUM;
    suggestion.field = "id";
    suggestion.currentValue = std::to_string(member);
    suggestion.suggestedValue = std::to_string(group.suggestedMasterId);
    suggestion.confidence = clampUnit(group.similarityScore);
    suggestion.reasoning = "Duplicate of record " +
                           std::to_string(group.suggestedMasterId) +
                           " in group " + std::to_string(group.id) + " (" +
                           toString(group.detectionMethod) + ", similarity " +
                           formatSimilarity(group.similarityScore) + ")";
    suggestion.autoApplyable = false;
    suggestions.push_back(std::move(suggestion));
  }
  return suggestions;
}

SuggestionGenerationSummary
SuggestionGenerator::generateSuggestions(TargetDatabase &db) const {
  NormalizedRecordRepository records(db);
  ViolationRepository violations(db);
  DuplicateGroupRepository groups(db);
  SuggestionRepository suggestions(db);
  SuggestionGenerationSummary summary;

  std::unordered_map<int64_t, NormalizedRecord> active;
  for (auto &record : records.loadActive()) {
    int64_t id = record.id;
    active.emplace(id, std::move(record));
  }

  std::vector<Suggestion> candidates;
  for (const auto &violation : violations.findUnresolved()) {
    auto it = active.find(violation.normalizedItemId);
    if (it == active.end())
      continue;
    std::optional<Suggestion> suggestion = fromViolation(violation, it->second);
    if (suggestion)
      candidates.push_back(std::move(*suggestion));
  }
  for (const auto &group : groups.findUnmerged()) {
    for (auto &suggestion : fromDuplicateGroup(group)) {
      candidates.push_back(std::move(suggestion));
    }
  }

  std::string now = TimeUtils::nowIso8601Utc();
  SqliteTransaction txn(db);
  for (auto &suggestion : candidates) {
    summary.suggestionsFound++;
    suggestion.createdAt = now;
    if (suggestions.insertIfAbsent(suggestion))
      summary.suggestionsCreated++;
  }
  txn.commit();

  Logger::info(LogCategory::QUALITY, "SuggestionGenerator::generateSuggestions",
               db.path() + ": " + std::to_string(summary.suggestionsFound) +
                   " suggestions, " +
                   std::to_string(summary.suggestionsCreated) + " new");
  return summary;
}

void SuggestionGenerator::applySuggestion(TargetDatabase &db,
                                          int64_t suggestionId) const {
  NormalizedRecordRepository records(db);
  SuggestionRepository suggestions(db);

  SqliteTransaction txn(db);
  std::optional<Suggestion> suggestion = suggestions.findById(suggestionId);
  if (!suggestion) {
    throw NotFoundError("Suggestion " + std::to_string(suggestionId) +
                        " not found");
  }
  if (suggestion->applied) {
    throw ConflictError("Suggestion " + std::to_string(suggestionId) +
                        " is already applied");
  }
  if (suggestion->type == SuggestionType::MERGE) {
    throw ValidationError("Merge suggestions are applied by merging their "
                          "duplicate group");
  }
  if (suggestion->suggestedValue.empty() ||
      !NormalizedRecordRepository::isWritableField(suggestion->field)) {
    throw ValidationError("Suggestion " + std::to_string(suggestionId) +
                          " has no value to apply");
  }

  if (!records.updateField(suggestion->normalizedItemId, suggestion->field,
                           suggestion->suggestedValue)) {
    throw NotFoundError("Record " +
                        std::to_string(suggestion->normalizedItemId) +
                        " of suggestion " + std::to_string(suggestionId) +
                        " not found");
  }
  if (suggestion->field == "name" &&
      !records.updateField(
          suggestion->normalizedItemId, "normalized_name",
          TextNormalizer::normalizeName(suggestion->suggestedValue))) {
    throw NotFoundError("Record " +
                        std::to_string(suggestion->normalizedItemId) +
                        " not found");
  }
  if (!suggestions.markApplied(suggestionId, TimeUtils::nowIso8601Utc())) {
    throw ConflictError("Suggestion " + std::to_string(suggestionId) +
                        " is already applied");
  }
  txn.commit();

  Logger::info(LogCategory::QUALITY, "SuggestionGenerator::applySuggestion",
               "Applied suggestion " + std::to_string(suggestionId) + " to " +
                   suggestion->field + " of record " +
                   std::to_string(suggestion->normalizedItemId));
}
