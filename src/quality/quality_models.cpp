#include "quality/quality_models.h"
#include "core/errors.h"
#include <cmath>

using json = nlohmann::json;

namespace {
json optionalString(const std::optional<std::string> &value) {
  return value ? json(*value) : json(nullptr);
}
} // namespace

std::string toString(ProcessingLevel level) {
  switch (level) {
  case ProcessingLevel::BASIC:
    return "basic";
  case ProcessingLevel::AI_ENHANCED:
    return "ai_enhanced";
  case ProcessingLevel::BENCHMARK:
    return "benchmark";
  }
  return "basic";
}

std::string toString(DetectionMethod method) {
  switch (method) {
  case DetectionMethod::EXACT_CODE:
    return "exact_code";
  case DetectionMethod::EXACT_NAME:
    return "exact_name";
  case DetectionMethod::SEMANTIC:
    return "semantic";
  case DetectionMethod::PHONETIC:
    return "phonetic";
  case DetectionMethod::WORD_BASED:
    return "word_based";
  case DetectionMethod::MIXED:
    return "mixed";
  }
  return "mixed";
}

std::string toString(ViolationCategory category) {
  switch (category) {
  case ViolationCategory::COMPLETENESS:
    return "completeness";
  case ViolationCategory::ACCURACY:
    return "accuracy";
  case ViolationCategory::CONSISTENCY:
    return "consistency";
  case ViolationCategory::FORMAT:
    return "format";
  }
  return "completeness";
}

std::string toString(Severity severity) {
  switch (severity) {
  case Severity::INFO:
    return "info";
  case Severity::WARNING:
    return "warning";
  case Severity::ERROR:
    return "error";
  case Severity::CRITICAL:
    return "critical";
  }
  return "info";
}

std::string toString(SuggestionType type) {
  switch (type) {
  case SuggestionType::SET_VALUE:
    return "set_value";
  case SuggestionType::CORRECT_FORMAT:
    return "correct_format";
  case SuggestionType::REPROCESS:
    return "reprocess";
  case SuggestionType::MERGE:
    return "merge";
  case SuggestionType::REVIEW:
    return "review";
  }
  return "review";
}

std::string toString(Priority priority) {
  switch (priority) {
  case Priority::LOW:
    return "low";
  case Priority::MEDIUM:
    return "medium";
  case Priority::HIGH:
    return "high";
  case Priority::CRITICAL:
    return "critical";
  }
  return "low";
}

ProcessingLevel processingLevelFromString(const std::string &value) {
  if (value == "basic")
    return ProcessingLevel::BASIC;
  if (value == "ai_enhanced")
    return ProcessingLevel::AI_ENHANCED;
  if (value == "benchmark")
    return ProcessingLevel::BENCHMARK;
  throw ValidationError("Unknown processing level: " + value);
}

DetectionMethod detectionMethodFromString(const std::string &value) {
  if (value == "exact_code")
    return DetectionMethod::EXACT_CODE;
  if (value == "exact_name")
    return DetectionMethod::EXACT_NAME;
  if (value == "semantic")
    return DetectionMethod::SEMANTIC;
  if (value == "phonetic")
    return DetectionMethod::PHONETIC;
  if (value == "word_based")
    return DetectionMethod::WORD_BASED;
  if (value == "mixed")
    return DetectionMethod::MIXED;
  throw ValidationError("Unknown detection method: " + value);
}

ViolationCategory violationCategoryFromString(const std::string &value) {
  if (value == "completeness")
    return ViolationCategory::COMPLETENESS;
  if (value == "accuracy")
    return ViolationCategory::ACCURACY;
  if (value == "consistency")
    return ViolationCategory::CONSISTENCY;
  if (value == "format")
    return ViolationCategory::FORMAT;
  throw ValidationError("Unknown violation category: " + value);
}

Severity severityFromString(const std::string &value) {
  if (value == "info")
    return Severity::INFO;
  if (value == "warning")
    return Severity::WARNING;
  if (value == "error")
    return Severity::ERROR;
  if (value == "critical")
    return Severity::CRITICAL;
  throw ValidationError("Unknown severity: " + value);
}

SuggestionType suggestionTypeFromString(const std::string &value) {
  if (value == "set_value")
    return SuggestionType::SET_VALUE;
  if (value == "correct_format")
    return SuggestionType::CORRECT_FORMAT;
  if (value == "reprocess")
    return SuggestionType::REPROCESS;
  if (value == "merge")
    return SuggestionType::MERGE;
  if (value == "review")
    return SuggestionType::REVIEW;
  throw ValidationError("Unknown suggestion type: " + value);
}

Priority priorityFromString(const std::string &value) {
  if (value == "low")
    return Priority::LOW;
  if (value == "medium")
    return Priority::MEDIUM;
  if (value == "high")
    return Priority::HIGH;
  if (value == "critical")
    return Priority::CRITICAL;
  throw ValidationError("Unknown priority: " + value);
}

double clampUnit(double value) {
  if (std::isnan(value) || value < 0.0)
    return 0.0;
  if (value > 1.0)
    return 1.0;
  return value;
}

LevelStats &QualityStats::level(ProcessingLevel lvl) {
  switch (lvl) {
  case ProcessingLevel::AI_ENHANCED:
    return aiEnhanced;
  case ProcessingLevel::BENCHMARK:
    return benchmark;
  case ProcessingLevel::BASIC:
    break;
  }
  return basic;
}

const LevelStats &QualityStats::level(ProcessingLevel lvl) const {
  switch (lvl) {
  case ProcessingLevel::AI_ENHANCED:
    return aiEnhanced;
  case ProcessingLevel::BENCHMARK:
    return benchmark;
  case ProcessingLevel::BASIC:
    break;
  }
  return basic;
}

void to_json(json &j, const NormalizedRecord &record) {
  j = json{{"id", record.id},
           {"source_reference", record.sourceReference},
           {"code", record.code},
           {"name", record.name},
           {"normalized_name", record.normalizedName},
           {"category", record.category},
           {"inn", record.inn},
           {"kpp", record.kpp},
           {"unit", record.unit},
           {"processing_level", toString(record.processingLevel)},
           {"quality_score", record.qualityScore},
           {"ai_confidence", record.aiConfidence},
           {"is_active", record.isActive},
           {"merged_count", record.mergedCount},
           {"created_at", record.createdAt},
           {"updated_at", record.updatedAt}};
  json attributes = json::parse(record.attributes, nullptr, false);
  j["attributes"] = attributes.is_discarded() ? json::object() : attributes;
}

void to_json(json &j, const DuplicateGroup &group) {
  j = json{{"id", group.id},
           {"detection_method", toString(group.detectionMethod)},
           {"similarity_score", group.similarityScore},
           {"suggested_master_id", group.suggestedMasterId},
           {"item_count", group.itemCount},
           {"merged", group.merged},
           {"merged_at", optionalString(group.mergedAt)},
           {"created_at", group.createdAt},
           {"item_ids", group.memberIds}};
}

void to_json(json &j, const Violation &violation) {
  j = json{{"id", violation.id},
           {"normalized_item_id", violation.normalizedItemId},
           {"rule_name", violation.ruleName},
           {"category", toString(violation.category)},
           {"severity", toString(violation.severity)},
           {"message", violation.message},
           {"recommendation", violation.recommendation},
           {"field_name", violation.fieldName},
           {"current_value", violation.currentValue},
           {"resolved", violation.resolved},
           {"resolved_by", optionalString(violation.resolvedBy)},
           {"resolved_at", optionalString(violation.resolvedAt)},
           {"created_at", violation.createdAt}};
}

void to_json(json &j, const Suggestion &suggestion) {
  j = json{{"id", suggestion.id},
           {"normalized_item_id", suggestion.normalizedItemId},
           {"type", toString(suggestion.type)},
           {"priority", toString(suggestion.priority)},
           {"field", suggestion.field},
           {"current_value", suggestion.currentValue},
           {"suggested_value", suggestion.suggestedValue},
           {"confidence", suggestion.confidence},
           {"reasoning", suggestion.reasoning},
           {"auto_applyable", suggestion.autoApplyable},
           {"applied", suggestion.applied},
           {"applied_at", optionalString(suggestion.appliedAt)},
           {"created_at", suggestion.createdAt}};
}

void to_json(json &j, const LevelStats &stats) {
  j = json{{"count", stats.count},
           {"avg_quality", stats.avgQuality},
           {"percentage", stats.percentage}};
}

void to_json(json &j, const QualityStats &stats) {
  j = json{{"total_items", stats.totalItems},
           {"by_level",
            {{"basic", stats.basic},
             {"ai_enhanced", stats.aiEnhanced},
             {"benchmark", stats.benchmark}}},
           {"average_quality", stats.averageQuality},
           {"benchmark_count", stats.benchmarkCount},
           {"benchmark_percentage", stats.benchmarkPercentage}};
}
