#include "quality/quality_analyzer.h"
#include "core/logger.h"

AnalysisResult QualityAnalyzer::analyze(TargetDatabase &db,
                                        const CancellationToken *token,
                                        const StepCallback &onStep) const {
  AnalysisResult result;
  auto stopRequested = [&]() {
    if (token && token->isCancelled()) {
      result.cancelled = true;
      Logger::info(LogCategory::QUALITY, "QualityAnalyzer::analyze",
                   "Analysis of " + db.path() + " cancelled");
      return true;
    }
    return false;
  };
  auto enterStep = [&](const char *step) {
    if (onStep)
      onStep(step, result);
  };

  if (stopRequested())
    return result;
  enterStep(STEP_DUPLICATES);
  result.duplicatesFound = duplicates_.detectDuplicates(db).clustersFound;

  if (stopRequested())
    return result;
  enterStep(STEP_VIOLATIONS);
  result.violationsFound = violations_.detectViolations(db).violationsFound;

  if (stopRequested())
    return result;
  enterStep(STEP_SUGGESTIONS);
  result.suggestionsFound = suggestions_.generateSuggestions(db).suggestionsFound;

  enterStep("analysis_completed");
  return result;
}
