#include "../support/test_runner.h"
#include "core/errors.h"
#include "normalization/catalog_normalizer.h"
#include "normalization/field_extractor.h"
#include "normalization/text_normalizer.h"

class FixedScorer : public IConfidenceScorer {
  double value_;

public:
  explicit FixedScorer(double value) : value_(value) {}
  std::optional<double> score(const NormalizedRecord &) override {
    return value_;
  }
};

RawCatalogItem makeItem(const std::string &reference, const std::string &code,
                        const std::string &name,
                        const std::string &payload = "") {
  RawCatalogItem item;
  item.rowId = 7;
  item.reference = reference;
  item.code = code;
  item.name = name;
  item.payload = payload;
  return item;
}

int main() {
  TestRunner runner;

  runner.runTest("cleanName collapses whitespace and unifies quotes", [&]() {
    runner.assertEquals("Болт \"М8\"",
                        TextNormalizer::cleanName("  Болт   «М8»  "),
                        "guillemets become straight quotes");
    runner.assertEquals("Труба - 20", TextNormalizer::cleanName("Труба — 20"),
                        "em dash becomes hyphen");
  });

  runner.runTest("normalizeName lower-cases and strips diacritics", [&]() {
    runner.assertEquals("cafe creme", TextNormalizer::normalizeName(" Café  Crème "),
                        "latin diacritics");
    runner.assertEquals("болт м8", TextNormalizer::normalizeName("БОЛТ М8"),
                        "cyrillic lower case");
  });

  runner.runTest("normalizeCode keeps only code characters", [&]() {
    runner.assertEquals("AB-12X", TextNormalizer::normalizeCode(" ab-12 x "),
                        "upper-cased without spaces");
    runner.assertEquals("A.1/2_B", TextNormalizer::normalizeCode("a.1/2_b#"),
                        "separators kept, hash dropped");
  });

  runner.runTest("tokenize removes stop words on request", [&]() {
    std::vector<std::string> all = TextNormalizer::tokenize("болт для трубы");
    std::vector<std::string> filtered =
        TextNormalizer::tokenize("болт для трубы", true);
    runner.assertEquals(int64_t{3}, static_cast<int64_t>(all.size()),
                        "all tokens");
    runner.assertEquals(int64_t{2}, static_cast<int64_t>(filtered.size()),
                        "stop word removed");
    runner.assertEquals("трубы", filtered[1], "second token");
  });

  runner.runTest("INN and KPP validation", [&]() {
    runner.assertTrue(FieldExtractor::isValidInn("7707083893"), "10-digit INN");
    runner.assertTrue(FieldExtractor::isValidInn("500100732259"),
                      "12-digit INN");
    runner.assertFalse(FieldExtractor::isValidInn("7707083894"),
                       "bad check digit");
    runner.assertTrue(FieldExtractor::isValidInn("7707 083893"),
                      "spaces are ignored");
    runner.assertFalse(FieldExtractor::isValidInn("77070838"), "too short");
    runner.assertFalse(FieldExtractor::isValidInn("77070838AB"), "letters");
    runner.assertTrue(FieldExtractor::isValidKpp("773601001"), "KPP");
    runner.assertFalse(FieldExtractor::isValidKpp("77360100"), "short KPP");
  });

  runner.runTest("Category and unit are guessed from the name", [&]() {
    runner.assertEquals("Крепеж", FieldExtractor::guessCategory("болт м8"),
                        "fastener keyword");
    runner.assertEquals("Кабельная продукция",
                        FieldExtractor::guessCategory("кабель ввг"),
                        "cable keyword");
    runner.assertEquals("Контрагенты",
                        FieldExtractor::guessCategory("ооо ромашка"),
                        "legal form");
    runner.assertEquals("", FieldExtractor::guessCategory("нечто"),
                        "no keyword");
    runner.assertEquals("м", FieldExtractor::detectUnit("кабель ввг 100 м"),
                        "trailing unit");
    runner.assertEquals("шт", FieldExtractor::detectUnit("болт 10 штук"),
                        "unit alias");
  });

  runner.runTest("Fields are extracted from a JSON payload", [&]() {
    ExtractedFields fields = FieldExtractor::extract(
        "изделие",
        R"({"inn": "7707-083893", "КПП": 773601001, "unit": "кг", "category": "Метизы"})");
    runner.assertEquals("7707083893", fields.inn, "inn cleaned");
    runner.assertEquals("773601001", fields.kpp, "numeric kpp");
    runner.assertEquals("кг", fields.unit, "unit");
    runner.assertEquals("Метизы", fields.category, "category");
    runner.assertEquals("payload", fields.categorySource, "category source");
    runner.assertTrue(fields.payload.is_object(), "payload kept as object");
  });

  runner.runTest("Fields are extracted from free text", [&]() {
    ExtractedFields fields = FieldExtractor::extract(
        "ооо ромашка", "ИНН: 7707083893 КПП 773601001");
    runner.assertEquals("7707083893", fields.inn, "inn");
    runner.assertEquals("773601001", fields.kpp, "kpp");
    runner.assertEquals("Контрагенты", fields.category, "category");
    runner.assertEquals("keyword", fields.categorySource, "category source");
    runner.assertTrue(fields.payload.is_string(), "payload kept as text");
  });

  runner.runTest("Complete item reaches the benchmark level", [&]() {
    CatalogNormalizer normalizer;
    NormalizedRecord record =
        normalizer.normalize(makeItem(" REF-1 ", "A-100", "Болт М8 шт"));
    runner.assertEquals("REF-1", record.sourceReference, "reference trimmed");
    runner.assertEquals("болт м8 шт", record.normalizedName, "normalized name");
    runner.assertEquals("Крепеж", record.category, "category");
    runner.assertEquals("шт", record.unit, "unit");
    runner.assertNear(1.0, record.qualityScore, 1e-9, "full score");
    runner.assertEquals("benchmark", toString(record.processingLevel),
                        "benchmark level");
    runner.assertNear(0.0, record.aiConfidence, 1e-9, "no confidence");
  });

  runner.runTest("Sparse item stays basic", [&]() {
    CatalogNormalizer normalizer;
    NormalizedRecord record = normalizer.normalize(makeItem("REF-2", "", "Xy"));
    runner.assertNear(0.3, record.qualityScore, 1e-9, "name weight only");
    runner.assertEquals("basic", toString(record.processingLevel),
                        "basic level");
  });

  runner.runTest("Invalid INN is penalized", [&]() {
    NormalizedRecord record;
    record.name = "Болт";
    record.code = "A-1";
    record.inn = "7707083894";
    record.unit = "шт";
    // 0.3 + 0.2 + 0.2 (unit) + 0.1 + 0.05 - 0.1
    runner.assertNear(0.75, CatalogNormalizer::computeQualityScore(record), 1e-9,
                      "penalty applied");
  });

  runner.runTest("Items without reference or content are rejected", [&]() {
    CatalogNormalizer normalizer;
    runner.assertThrows<ValidationError>(
        [&]() { normalizer.normalize(makeItem("  ", "A-1", "Болт")); },
        "empty reference");
    runner.assertThrows<ValidationError>(
        [&]() { normalizer.normalize(makeItem("REF-3", " ", "")); },
        "no code and no name");
  });

  runner.runTest("Scorer confidence sets the AI level", [&]() {
    CatalogNormalizer normalizer(std::make_shared<FixedScorer>(0.42));
    NormalizedRecord record = normalizer.normalize(makeItem("REF-4", "", "Xy"));
    runner.assertEquals("ai_enhanced", toString(record.processingLevel),
                        "ai level");
    runner.assertNear(0.42, record.aiConfidence, 1e-9, "confidence stored");

    CatalogNormalizer overconfident(std::make_shared<FixedScorer>(1.7));
    NormalizedRecord clamped =
        overconfident.normalize(makeItem("REF-5", "", "Xy"));
    runner.assertNear(1.0, clamped.aiConfidence, 1e-9, "confidence clamped");
  });

  runner.runTest("Attributes record extracted fields", [&]() {
    CatalogNormalizer normalizer;
    NormalizedRecord record = normalizer.normalize(
        makeItem("REF-6", "b-7", "Кабель ВВГ 100 м", "ИНН 7707083893"));
    nlohmann::json attributes = nlohmann::json::parse(record.attributes);
    runner.assertEquals(int64_t{7}, attributes["source_row_id"].get<int64_t>(),
                        "row id");
    runner.assertEquals("B-7", attributes["canonical_code"].get<std::string>(),
                        "canonical code");
    runner.assertEquals(
        "keyword",
        attributes["extracted"]["category_source"].get<std::string>(),
        "category source");
    runner.assertEquals("7707083893",
                        attributes["extracted"]["inn"].get<std::string>(),
                        "inn");
  });

  runner.printSummary();
  return 0;
}
