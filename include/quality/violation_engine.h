#ifndef VIOLATION_ENGINE_H
#define VIOLATION_ENGINE_H

#include "quality/quality_models.h"
#include "storage/target_database.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

// One entry of the fixed rule catalog. check() returns the offending value
// when the record violates the rule.
struct QualityRule {
  std::string name;
  ViolationCategory category;
  Severity severity;
  std::string field;
  std::string message;
  std::string recommendation;
  std::function<std::optional<std::string>(const NormalizedRecord &)> check;
};

struct ViolationDetectionSummary {
  size_t recordsChecked = 0;
  size_t violationsFound = 0;
  size_t violationsCreated = 0;
};

class ViolationEngine {
public:
  static constexpr double LOW_QUALITY_THRESHOLD = 0.5;
  static constexpr double LOW_AI_CONFIDENCE_THRESHOLD = 0.7;
  static constexpr size_t MIN_NAME_LENGTH = 3;

  static const std::vector<QualityRule> &rules();
  static const QualityRule *findRule(const std::string &name);

  // Violations of one record, not yet persisted.
  std::vector<Violation> evaluate(const NormalizedRecord &record) const;

  // Stores a violation per (record, rule) pair not already recorded.
  // Resolved violations are never recreated or modified.
  ViolationDetectionSummary detectViolations(TargetDatabase &db) const;

  // Idempotent: the first call stamps resolved_by/resolved_at, later calls
  // succeed without changes. Throws NotFoundError for an unknown id.
  void resolveViolation(TargetDatabase &db, int64_t violationId,
                        const std::string &resolvedBy) const;
};

#endif
