#ifndef QUALITY_ANALYZER_H
#define QUALITY_ANALYZER_H

#include "concurrency/cancellation_token.h"
#include "quality/duplicate_detector.h"
#include "quality/suggestion_generator.h"
#include "quality/violation_engine.h"
#include "storage/target_database.h"
#include <functional>
#include <string>

struct AnalysisResult {
  size_t duplicatesFound = 0;
  size_t violationsFound = 0;
  size_t suggestionsFound = 0;
  bool cancelled = false;
};

// Runs duplicate detection, violation detection and suggestion generation in
// that order against one database.
class QualityAnalyzer {
public:
  static constexpr const char *STEP_DUPLICATES = "detecting_duplicates";
  static constexpr const char *STEP_VIOLATIONS = "detecting_violations";
  static constexpr const char *STEP_SUGGESTIONS = "generating_suggestions";

  // Invoked before each step starts and once more after the last one.
  using StepCallback =
      std::function<void(const std::string &step, const AnalysisResult &)>;

  // The token is checked between steps; a cancelled run returns with
  // cancelled set and the remaining steps skipped.
  AnalysisResult analyze(TargetDatabase &db,
                         const CancellationToken *token = nullptr,
                         const StepCallback &onStep = nullptr) const;

  const DuplicateDetector &duplicates() const { return duplicates_; }
  const ViolationEngine &violations() const { return violations_; }
  const SuggestionGenerator &suggestions() const { return suggestions_; }

private:
  DuplicateDetector duplicates_;
  ViolationEngine violations_;
  SuggestionGenerator suggestions_;
};

#endif
