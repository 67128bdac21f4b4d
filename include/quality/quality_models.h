#ifndef QUALITY_MODELS_H
#define QUALITY_MODELS_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class ProcessingLevel { BASIC, AI_ENHANCED, BENCHMARK };

enum class DetectionMethod {
  EXACT_CODE,
  EXACT_NAME,
  SEMANTIC,
  PHONETIC,
  WORD_BASED,
  MIXED
};

enum class ViolationCategory { COMPLETENESS, ACCURACY, CONSISTENCY, FORMAT };

enum class Severity { INFO, WARNING, ERROR, CRITICAL };

enum class SuggestionType { SET_VALUE, CORRECT_FORMAT, REPROCESS, MERGE, REVIEW };

enum class Priority { LOW, MEDIUM, HIGH, CRITICAL };

constexpr double BENCHMARK_THRESHOLD = 0.9;
constexpr double AUTO_APPLY_CONFIDENCE = 0.9;

// Converts between enum values and their stored/wire names. The fromString
// variants throw ValidationError for unknown names.
std::string toString(ProcessingLevel level);
std::string toString(DetectionMethod method);
std::string toString(ViolationCategory category);
std::string toString(Severity severity);
std::string toString(SuggestionType type);
std::string toString(Priority priority);

ProcessingLevel processingLevelFromString(const std::string &value);
DetectionMethod detectionMethodFromString(const std::string &value);
ViolationCategory violationCategoryFromString(const std::string &value);
Severity severityFromString(const std::string &value);
SuggestionType suggestionTypeFromString(const std::string &value);
Priority priorityFromString(const std::string &value);

// Clamps to [0, 1]; NaN becomes 0.
double clampUnit(double value);

struct NormalizedRecord {
  int64_t id = 0;
  std::string sourceReference;
  std::string code;
  std::string name;
  std::string normalizedName;
  std::string category;
  std::string inn;
  std::string kpp;
  std::string unit;
  std::string attributes = "{}";
  ProcessingLevel processingLevel = ProcessingLevel::BASIC;
  double qualityScore = 0.0;
  double aiConfidence = 0.0;
  bool isActive = true;
  int64_t mergedCount = 0;
  std::string createdAt;
  std::string updatedAt;
};

struct DuplicateGroup {
  int64_t id = 0;
  DetectionMethod detectionMethod = DetectionMethod::EXACT_CODE;
  double similarityScore = 0.0;
  int64_t suggestedMasterId = 0;
  int64_t itemCount = 0;
  bool merged = false;
  std::optional<std::string> mergedAt;
  std::string createdAt;
  std::vector<int64_t> memberIds;
};

struct Violation {
  int64_t id = 0;
  int64_t normalizedItemId = 0;
  std::string ruleName;
  ViolationCategory category = ViolationCategory::COMPLETENESS;
  Severity severity = Severity::INFO;
  std::string message;
  std::string recommendation;
  std::string fieldName;
  std::string currentValue;
  bool resolved = false;
  std::optional<std::string> resolvedBy;
  std::optional<std::string> resolvedAt;
  std::string createdAt;
};

struct Suggestion {
  int64_t id = 0;
  int64_t normalizedItemId = 0;
  SuggestionType type = SuggestionType::REVIEW;
  Priority priority = Priority::LOW;
  std::string field;
  std::string currentValue;
  std::string suggestedValue;
  double confidence = 0.0;
  std::string reasoning;
  bool autoApplyable = false;
  bool applied = false;
  std::optional<std::string> appliedAt;
  std::string createdAt;
};

struct DuplicateFilter {
  bool unmergedOnly = false;
};

struct ViolationFilter {
  std::optional<Severity> severity;
  std::optional<ViolationCategory> category;
  bool showResolved = false;
  std::string search;
};

struct SuggestionFilter {
  std::optional<Priority> priority;
  std::optional<SuggestionType> type;
  std::optional<bool> applied;
  std::optional<bool> autoApplyable;
};

template <typename T> struct ListPage {
  std::vector<T> items;
  int64_t total = 0;
};

struct LevelStats {
  int64_t count = 0;
  double avgQuality = 0.0;
  double percentage = 0.0;
};

// Statistics of one target database or, after reduction, of a project.
struct QualityStats {
  int64_t totalItems = 0;
  LevelStats basic;
  LevelStats aiEnhanced;
  LevelStats benchmark;
  double averageQuality = 0.0;
  int64_t benchmarkCount = 0;
  double benchmarkPercentage = 0.0;

  LevelStats &level(ProcessingLevel level);
  const LevelStats &level(ProcessingLevel level) const;
};

void to_json(nlohmann::json &j, const NormalizedRecord &record);
void to_json(nlohmann::json &j, const DuplicateGroup &group);
void to_json(nlohmann::json &j, const Violation &violation);
void to_json(nlohmann::json &j, const Suggestion &suggestion);
void to_json(nlohmann::json &j, const LevelStats &stats);
void to_json(nlohmann::json &j, const QualityStats &stats);

#endif
