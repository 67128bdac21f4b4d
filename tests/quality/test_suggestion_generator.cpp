#include "../support/temp_database.h"
#include "../support/test_runner.h"
#include "core/errors.h"
#include "quality/duplicate_detector.h"
#include "quality/suggestion_generator.h"
#include "quality/violation_engine.h"
#include "storage/suggestion_repository.h"

Violation violationFor(const ViolationEngine &engine,
                       const NormalizedRecord &record,
                       const std::string &rule) {
  for (auto &violation : engine.evaluate(record)) {
    if (violation.ruleName == rule)
      return violation;
  }
  throw std::runtime_error("rule " + rule + " did not fire");
}

int main() {
  TestRunner runner;
  ViolationEngine engine;
  SuggestionGenerator generator;

  runner.runTest("Priority follows violation severity", [&]() {
    runner.assertEquals("critical",
                        toString(SuggestionGenerator::priorityFor(Severity::CRITICAL)),
                        "critical");
    runner.assertEquals("high",
                        toString(SuggestionGenerator::priorityFor(Severity::ERROR)),
                        "error");
    runner.assertEquals("medium",
                        toString(SuggestionGenerator::priorityFor(Severity::WARNING)),
                        "warning");
    runner.assertEquals("low",
                        toString(SuggestionGenerator::priorityFor(Severity::INFO)),
                        "info");
  });

  runner.runTest("Only confident value fixes are auto-applyable", [&]() {
    runner.assertTrue(
        SuggestionGenerator::isAutoApplyable(SuggestionType::SET_VALUE, 0.9),
        "set value at threshold");
    runner.assertFalse(
        SuggestionGenerator::isAutoApplyable(SuggestionType::CORRECT_FORMAT, 0.7),
        "format below threshold");
    runner.assertFalse(
        SuggestionGenerator::isAutoApplyable(SuggestionType::MERGE, 1.0),
        "merge never");
    runner.assertFalse(
        SuggestionGenerator::isAutoApplyable(SuggestionType::REPROCESS, 0.95),
        "reprocess never");
  });

  runner.runTest("Format violations propose corrected values", [&]() {
    NormalizedRecord record = makeRecord("R1", "ab 1", "  БОЛТ  М8 ", 0.6);
    record.id = 11;

    std::optional<Suggestion> trim = generator.fromViolation(
        violationFor(engine, record, "name_not_trimmed"), record);
    runner.assertTrue(trim.has_value(), "trim proposed");
    runner.assertEquals("correct_format", toString(trim->type), "type");
    runner.assertEquals("БОЛТ М8", trim->suggestedValue, "trimmed value");
    runner.assertNear(0.98, trim->confidence, 1e-9, "confidence");
    runner.assertTrue(trim->autoApplyable, "auto-applyable");
    runner.assertEquals("low", toString(trim->priority), "info priority");
    runner.assertEquals(int64_t{11}, trim->normalizedItemId, "record id");

    std::optional<Suggestion> caps = generator.fromViolation(
        violationFor(engine, record, "name_all_caps"), record);
    runner.assertEquals("Болт м8", caps->suggestedValue, "sentence case");
    runner.assertFalse(caps->autoApplyable, "case change needs review");

    std::optional<Suggestion> code = generator.fromViolation(
        violationFor(engine, record, "code_format"), record);
    runner.assertEquals("AB1", code->suggestedValue, "canonical code");
    runner.assertEquals("medium", toString(code->priority), "warning priority");
    runner.assertTrue(code->autoApplyable, "code fix auto-applyable");
  });

  runner.runTest("Missing data gets a guess or a review", [&]() {
    NormalizedRecord cable = makeRecord("R2", "K-1", "Кабель ВВГ", 0.6);
    cable.category = "";
    std::optional<Suggestion> category = generator.fromViolation(
        violationFor(engine, cable, "category_missing"), cable);
    runner.assertEquals("set_value", toString(category->type), "set value");
    runner.assertEquals("Кабельная продукция", category->suggestedValue,
                        "guessed category");
    runner.assertNear(0.75, category->confidence, 1e-9, "guess confidence");

    NormalizedRecord shortName = makeRecord("R3", "K-2", "Xy", 0.6);
    std::optional<Suggestion> review = generator.fromViolation(
        violationFor(engine, shortName, "name_too_short"), shortName);
    runner.assertEquals("review", toString(review->type), "review");
    runner.assertEquals("", review->suggestedValue, "no value");
    runner.assertNear(0.5, review->confidence, 1e-9, "review confidence");

    NormalizedRecord weak =
        makeRecord("R4", "K-3", "Болт", 0.3, ProcessingLevel::AI_ENHANCED);
    std::optional<Suggestion> reprocess = generator.fromViolation(
        violationFor(engine, weak, "low_quality_score"), weak);
    runner.assertEquals("reprocess", toString(reprocess->type), "reprocess");
    runner.assertEquals("ai_enhanced", reprocess->currentValue, "current level");
    runner.assertEquals("basic", reprocess->suggestedValue, "target level");
    runner.assertNear(0.8, reprocess->confidence, 1e-9, "reprocess confidence");
  });

  runner.runTest("Weak basic records are reviewed, not reprocessed", [&]() {
    NormalizedRecord weak = makeRecord("R5", "K-4", "Болт", 0.3);
    std::optional<Suggestion> suggestion = generator.fromViolation(
        violationFor(engine, weak, "low_quality_score"), weak);
    runner.assertTrue(suggestion.has_value(), "still reported");
    runner.assertEquals("review", toString(suggestion->type), "review");
    runner.assertEquals("quality_score", suggestion->field, "field");
    runner.assertEquals("", suggestion->suggestedValue, "no value");

    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "weak.db");
    TargetDatabase db(path);
    insertRecord(db, makeRecord("R5", "K-4", "Болт крепежный", 0.3));
    engine.detectViolations(db);
    generator.generateSuggestions(db);

    SuggestionRepository repository(db);
    SuggestionFilter reprocessFilter;
    reprocessFilter.type = SuggestionType::REPROCESS;
    runner.assertEquals(int64_t{0}, repository.count(reprocessFilter),
                        "no reprocess to the current level");
    SuggestionGenerationSummary again = generator.generateSuggestions(db);
    runner.assertEquals(int64_t{0},
                        static_cast<int64_t>(again.suggestionsCreated),
                        "nothing new on the next pass");
  });

  runner.runTest("Duplicate groups yield merge suggestions", [&]() {
    DuplicateGroup group;
    group.id = 5;
    group.detectionMethod = DetectionMethod::EXACT_CODE;
    group.similarityScore = 1.0;
    group.suggestedMasterId = 2;
    group.memberIds = {1, 2, 3};
    std::vector<Suggestion> merges = generator.fromDuplicateGroup(group);
    runner.assertEquals(int64_t{2}, static_cast<int64_t>(merges.size()),
                        "one per non-master member");
    runner.assertEquals("merge", toString(merges[0].type), "type");
    runner.assertEquals("id", merges[0].field, "field");
    runner.assertEquals("2", merges[0].suggestedValue, "master id");
    runner.assertEquals("high", toString(merges[0].priority), "high priority");
    runner.assertFalse(merges[0].autoApplyable, "never automatic");

    group.similarityScore = 0.92;
    runner.assertEquals("medium",
                        toString(generator.fromDuplicateGroup(group)[0].priority),
                        "weaker match");
    group.merged = true;
    runner.assertEquals(int64_t{0},
                        static_cast<int64_t>(generator.fromDuplicateGroup(group).size()),
                        "merged group yields nothing");
  });

  runner.runTest("Applying a suggestion updates the record once", [&]() {
    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "apply.db");
    TargetDatabase db(path);
    int64_t recordId =
        insertRecord(db, makeRecord("R1", "A-1", "  Болт  М8 ", 0.9));
    engine.detectViolations(db);
    SuggestionGenerationSummary summary = generator.generateSuggestions(db);
    runner.assertEquals(int64_t{1},
                        static_cast<int64_t>(summary.suggestionsCreated),
                        "trim suggestion stored");

    SuggestionRepository repository(db);
    std::vector<Suggestion> open = repository.list(SuggestionFilter{}, 10, 0);
    int64_t id = open[0].id;
    generator.applySuggestion(db, id);

    std::optional<NormalizedRecord> record =
        NormalizedRecordRepository(db).findById(recordId);
    runner.assertEquals("Болт М8", record->name, "name written");
    runner.assertEquals("болт м8", record->normalizedName,
                        "normalized name follows");
    std::optional<Suggestion> applied = repository.findById(id);
    runner.assertTrue(applied->applied, "marked applied");
    runner.assertTrue(applied->appliedAt.has_value(), "time stamped");

    runner.assertThrows<ConflictError>(
        [&]() { generator.applySuggestion(db, id); }, "second apply");
    runner.assertThrows<NotFoundError>(
        [&]() { generator.applySuggestion(db, id + 100); }, "unknown id");

    SuggestionGenerationSummary again = generator.generateSuggestions(db);
    runner.assertEquals(int64_t{0},
                        static_cast<int64_t>(again.suggestionsCreated),
                        "fixed value is not proposed again");
  });

  runner.runTest("Merge and review suggestions cannot be applied", [&]() {
    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "noapply.db");
    TargetDatabase db(path);
    insertRecord(db, makeRecord("R1", "CODE001", "Болт М8", 0.6));
    insertRecord(db, makeRecord("R2", "CODE001", "Гайка", 0.9));
    insertRecord(db, makeRecord("R3", "CODE002", "Xy", 0.6));
    DuplicateDetector().detectDuplicates(db);
    engine.detectViolations(db);
    generator.generateSuggestions(db);

    SuggestionRepository repository(db);
    SuggestionFilter merges;
    merges.type = SuggestionType::MERGE;
    std::vector<Suggestion> mergeList = repository.list(merges, 10, 0);
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(mergeList.size()),
                        "one merge suggestion");
    runner.assertThrows<ValidationError>(
        [&]() { generator.applySuggestion(db, mergeList[0].id); },
        "merge suggestion");

    SuggestionFilter reviews;
    reviews.type = SuggestionType::REVIEW;
    std::vector<Suggestion> reviewList = repository.list(reviews, 10, 0);
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(reviewList.size()),
                        "review for the short name");
    runner.assertThrows<ValidationError>(
        [&]() { generator.applySuggestion(db, reviewList[0].id); },
        "nothing to write");
  });

  runner.printSummary();
  return 0;
}
