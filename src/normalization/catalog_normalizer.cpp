#include "normalization/catalog_normalizer.h"
#include "core/errors.h"
#include "normalization/field_extractor.h"
#include "normalization/text_normalizer.h"
#include "utils/string_utils.h"

namespace {
constexpr double NAME_WEIGHT = 0.30;
constexpr double CODE_WEIGHT = 0.20;
constexpr double CATEGORY_WEIGHT = 0.15;
constexpr double DETAIL_WEIGHT = 0.20;
constexpr double NAME_LENGTH_BONUS = 0.10;
constexpr double CLEAN_CODE_BONUS = 0.05;
constexpr double INVALID_INN_PENALTY = 0.10;
constexpr size_t MIN_NAME_LENGTH = 3;
} // namespace

CatalogNormalizer::CatalogNormalizer(std::shared_ptr<IConfidenceScorer> scorer)
    : scorer_(std::move(scorer)) {}

double CatalogNormalizer::computeQualityScore(const NormalizedRecord &record) {
  double score = 0.0;
  std::string name = StringUtils::trim(record.name);
  std::string code = StringUtils::trim(record.code);

  if (!name.empty())
    score += NAME_WEIGHT;
  if (!code.empty())
    score += CODE_WEIGHT;
  if (!record.category.empty())
    score += CATEGORY_WEIGHT;
  if (FieldExtractor::isValidInn(record.inn) || !record.unit.empty())
    score += DETAIL_WEIGHT;
  if (StringUtils::utf8Length(name) >= MIN_NAME_LENGTH)
    score += NAME_LENGTH_BONUS;
  if (!code.empty() && TextNormalizer::normalizeCode(code) == record.code)
    score += CLEAN_CODE_BONUS;
  if (!record.inn.empty() && !FieldExtractor::isValidInn(record.inn))
    score -= INVALID_INN_PENALTY;

  return clampUnit(score);
}

ProcessingLevel
CatalogNormalizer::decideLevel(double qualityScore,
                               const std::optional<double> &confidence) {
  if (qualityScore >= BENCHMARK_THRESHOLD)
    return ProcessingLevel::BENCHMARK;
  if (confidence.has_value())
    return ProcessingLevel::AI_ENHANCED;
  return ProcessingLevel::BASIC;
}

NormalizedRecord CatalogNormalizer::normalize(const RawCatalogItem &item) const {
  std::string reference = StringUtils::trim(item.reference);
  if (reference.empty()) {
    throw ValidationError("Catalog item at row " + std::to_string(item.rowId) +
                          " has no reference");
  }
  if (StringUtils::trim(item.code).empty() &&
      StringUtils::trim(item.name).empty()) {
    throw ValidationError("Catalog item '" + reference +
                          "' has neither code nor name");
  }

  NormalizedRecord record;
  record.sourceReference = reference;
  record.code = StringUtils::trim(item.code);
  record.name = item.name;
  record.normalizedName = TextNormalizer::normalizeName(item.name);

  ExtractedFields fields =
      FieldExtractor::extract(record.normalizedName, item.payload);
  record.inn = fields.inn;
  record.kpp = fields.kpp;
  record.unit = fields.unit;
  record.category = fields.category;

  nlohmann::json attributes;
  attributes["source_row_id"] = item.rowId;
  attributes["canonical_code"] = TextNormalizer::normalizeCode(item.code);
  attributes["extracted"] = {{"inn", fields.inn},
                             {"kpp", fields.kpp},
                             {"unit", fields.unit},
                             {"category", fields.category},
                             {"category_source", fields.categorySource}};
  attributes["payload"] = fields.payload;
  record.attributes = attributes.dump();

  record.qualityScore = computeQualityScore(record);

  std::optional<double> confidence;
  if (scorer_) {
    confidence = scorer_->score(record);
  }
  record.aiConfidence = confidence.has_value() ? clampUnit(*confidence) : 0.0;
  record.processingLevel = decideLevel(record.qualityScore, confidence);
  return record;
}
