#include "../support/temp_database.h"
#include "../support/test_runner.h"
#include "core/errors.h"
#include "quality/violation_engine.h"
#include "storage/violation_repository.h"
#include <algorithm>

bool hasRule(const std::vector<Violation> &violations, const std::string &rule) {
  return std::any_of(violations.begin(), violations.end(),
                     [&](const Violation &v) { return v.ruleName == rule; });
}

const Violation *findRule(const std::vector<Violation> &violations,
                          const std::string &rule) {
  for (const auto &v : violations) {
    if (v.ruleName == rule)
      return &v;
  }
  return nullptr;
}

int main() {
  TestRunner runner;
  ViolationEngine engine;

  runner.runTest("Rule catalog is fixed", [&]() {
    runner.assertEquals(int64_t{12},
                        static_cast<int64_t>(ViolationEngine::rules().size()),
                        "twelve rules");
    const QualityRule *rule = ViolationEngine::findRule("inn_invalid");
    runner.assertTrue(rule != nullptr, "inn rule present");
    runner.assertEquals("accuracy", toString(rule->category), "category");
    runner.assertEquals("error", toString(rule->severity), "severity");
    runner.assertTrue(ViolationEngine::findRule("no_such_rule") == nullptr,
                      "unknown rule");
  });

  runner.runTest("Clean record has no violations", [&]() {
    NormalizedRecord record =
        makeRecord("R1", "A-1", "Болт М8", 0.95, ProcessingLevel::BENCHMARK);
    runner.assertEquals(int64_t{0},
                        static_cast<int64_t>(engine.evaluate(record).size()),
                        "no violations");
  });

  runner.runTest("Format and accuracy rules fire on a messy record", [&]() {
    NormalizedRecord record = makeRecord("R2", "ab 1", "  БОЛТ  М8  ", 0.4);
    record.category = "";
    record.inn = "123";
    record.kpp = "12";
    std::vector<Violation> found = engine.evaluate(record);

    runner.assertTrue(hasRule(found, "name_not_trimmed"), "untrimmed name");
    runner.assertTrue(hasRule(found, "name_all_caps"), "capitals");
    runner.assertTrue(hasRule(found, "code_format"), "code format");
    runner.assertTrue(hasRule(found, "category_missing"), "no category");
    runner.assertTrue(hasRule(found, "inn_invalid"), "bad inn");
    runner.assertTrue(hasRule(found, "kpp_invalid"), "bad kpp");
    runner.assertTrue(hasRule(found, "low_quality_score"), "low score");
    runner.assertFalse(hasRule(found, "name_required"), "name present");
    runner.assertFalse(hasRule(found, "name_too_short"), "name long enough");
    runner.assertFalse(hasRule(found, "low_ai_confidence"), "not enhanced");

    const Violation *score = findRule(found, "low_quality_score");
    runner.assertEquals("0.40", score->currentValue, "score formatted");
    runner.assertEquals("consistency", toString(score->category),
                        "score category");
    const Violation *code = findRule(found, "code_format");
    runner.assertEquals("ab 1", code->currentValue, "offending code kept");
    runner.assertEquals("code", code->fieldName, "field name");
  });

  runner.runTest("Missing fields are completeness violations", [&]() {
    NormalizedRecord record = makeRecord("R3", "", "", 0.6);
    std::vector<Violation> found = engine.evaluate(record);
    const Violation *name = findRule(found, "name_required");
    runner.assertTrue(name != nullptr, "name required");
    runner.assertEquals("critical", toString(name->severity), "critical");
    runner.assertEquals("completeness", toString(name->category), "category");
    runner.assertTrue(hasRule(found, "code_required"), "code required");
    runner.assertFalse(hasRule(found, "name_too_short"),
                       "empty name is not short");

    NormalizedRecord shortName = makeRecord("R4", "A-2", "Xy", 0.6);
    runner.assertTrue(hasRule(engine.evaluate(shortName), "name_too_short"),
                      "two letters are too short");
  });

  runner.runTest("Level consistency rules", [&]() {
    NormalizedRecord enhanced =
        makeRecord("R5", "A-3", "Болт М8", 0.6, ProcessingLevel::AI_ENHANCED);
    enhanced.aiConfidence = 0.5;
    runner.assertTrue(hasRule(engine.evaluate(enhanced), "low_ai_confidence"),
                      "weak AI confidence");
    enhanced.aiConfidence = 0.9;
    runner.assertFalse(hasRule(engine.evaluate(enhanced), "low_ai_confidence"),
                       "strong AI confidence");

    NormalizedRecord benchmark =
        makeRecord("R6", "A-4", "Болт М8", 0.85, ProcessingLevel::BENCHMARK);
    runner.assertTrue(
        hasRule(engine.evaluate(benchmark), "benchmark_inconsistent"),
        "benchmark below threshold");
  });

  runner.runTest("Detection stores each violation once", [&]() {
    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "violations.db");
    TargetDatabase db(path);
    insertRecord(db, makeRecord("R1", "A-1", "Болт М8", 0.95,
                                ProcessingLevel::BENCHMARK));
    insertRecord(db, makeRecord("R2", "", "Xy", 0.3));

    ViolationDetectionSummary first = engine.detectViolations(db);
    runner.assertEquals(int64_t{2}, static_cast<int64_t>(first.recordsChecked),
                        "records checked");
    runner.assertEquals(int64_t{3}, static_cast<int64_t>(first.violationsFound),
                        "code, short name and low score");
    runner.assertEquals(int64_t{3},
                        static_cast<int64_t>(first.violationsCreated),
                        "all stored");

    ViolationDetectionSummary second = engine.detectViolations(db);
    runner.assertEquals(int64_t{3},
                        static_cast<int64_t>(second.violationsFound),
                        "still found");
    runner.assertEquals(int64_t{0},
                        static_cast<int64_t>(second.violationsCreated),
                        "nothing duplicated");

    ViolationRepository repository(db);
    ViolationFilter errors;
    errors.severity = Severity::ERROR;
    runner.assertEquals(int64_t{1}, repository.count(errors),
                        "one error-level violation");
    ViolationFilter search;
    search.search = "SHORTER";
    runner.assertEquals(int64_t{1}, repository.count(search),
                        "case-insensitive search");
  });

  runner.runTest("Resolving is idempotent and keeps the first resolver", [&]() {
    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "resolve.db");
    TargetDatabase db(path);
    insertRecord(db, makeRecord("R1", "A-1", "Xy", 0.6));
    engine.detectViolations(db);
    ViolationRepository repository(db);
    std::vector<Violation> open = repository.findUnresolved();
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(open.size()),
                        "one open violation");
    int64_t id = open[0].id;

    runner.assertThrows<ValidationError>(
        [&]() { engine.resolveViolation(db, id, "  "); }, "blank resolver");
    runner.assertThrows<NotFoundError>(
        [&]() { engine.resolveViolation(db, id + 100, "alice"); },
        "unknown violation");

    engine.resolveViolation(db, id, "alice");
    engine.resolveViolation(db, id, "bob");
    std::optional<Violation> resolved = repository.findById(id);
    runner.assertTrue(resolved->resolved, "resolved");
    runner.assertEquals("alice", resolved->resolvedBy.value_or(""),
                        "first resolver kept");
    runner.assertTrue(resolved->resolvedAt.has_value(), "time stamped");

    ViolationDetectionSummary again = engine.detectViolations(db);
    runner.assertEquals(int64_t{0}, static_cast<int64_t>(again.violationsCreated),
                        "resolved violation not recreated");
    runner.assertEquals(int64_t{0}, repository.count(ViolationFilter{}),
                        "hidden from the default listing");
    ViolationFilter all;
    all.showResolved = true;
    runner.assertEquals(int64_t{1}, repository.count(all),
                        "visible with show_resolved");
  });

  runner.printSummary();
  return 0;
}
