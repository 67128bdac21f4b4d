#include "quality/violation_engine.h"
#include "core/errors.h"
#include "core/logger.h"
#include "normalization/field_extractor.h"
#include "normalization/text_normalizer.h"
#include "storage/normalized_record_repository.h"
#include "storage/violation_repository.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <sstream>

namespace {
using Check = std::optional<std::string>;

std::string formatScore(double value) {
  std::ostringstream out;
  out.precision(2);
  out << std::fixed << value;
  return out.str();
}

bool isAllCaps(const std::string &text) {
  size_t upper = 0;
  for (char32_t cp : StringUtils::decodeUtf8(text)) {
    char32_t lower = StringUtils::toLowerCodePoint(cp);
    char32_t up = StringUtils::toUpperCodePoint(cp);
    if (lower == up)
      continue;
    if (cp == lower)
      return false;
    upper++;
  }
  return upper > 3;
}

std::vector<QualityRule> buildRules() {
  std::vector<QualityRule> rules;

  rules.push_back({"name_required", ViolationCategory::COMPLETENESS,
                   Severity::CRITICAL, "name", "Record has no name",
                   "Fill in the item name from the source system",
                   [](const NormalizedRecord &r) -> Check {
                     if (StringUtils::trim(r.name).empty())
                       return r.name;
                     return std::nullopt;
                   }});

  rules.push_back({"code_required", ViolationCategory::COMPLETENESS,
                   Severity::ERROR, "code", "Record has no code",
                   "Assign the item code used by the source system",
                   [](const NormalizedRecord &r) -> Check {
                     if (StringUtils::trim(r.code).empty())
                       return r.code;
                     return std::nullopt;
                   }});

  rules.push_back({"name_too_short", ViolationCategory::ACCURACY,
                   Severity::WARNING, "name",
                   "Name is shorter than 3 characters",
                   "Replace the abbreviation with the full item name",
                   [](const NormalizedRecord &r) -> Check {
                     std::string name = StringUtils::trim(r.name);
                     if (!name.empty() &&
                         StringUtils::utf8Length(name) <
                             ViolationEngine::MIN_NAME_LENGTH)
                       return r.name;
                     return std::nullopt;
                   }});

  rules.push_back({"name_not_trimmed", ViolationCategory::FORMAT,
                   Severity::INFO, "name",
                   "Name has leading, trailing or repeated whitespace",
                   "Trim the name and collapse inner whitespace",
                   [](const NormalizedRecord &r) -> Check {
                     if (!StringUtils::trim(r.name).empty() &&
                         StringUtils::collapseWhitespace(r.name) != r.name)
                       return r.name;
                     return std::nullopt;
                   }});

  rules.push_back({"name_all_caps", ViolationCategory::FORMAT, Severity::INFO,
                   "name", "Name is written in capital letters only",
                   "Use sentence case for the item name",
                   [](const NormalizedRecord &r) -> Check {
                     if (isAllCaps(r.name))
                       return r.name;
                     return std::nullopt;
                   }});

  rules.push_back({"code_format", ViolationCategory::FORMAT, Severity::WARNING,
                   "code", "Code contains lowercase letters, spaces or "
                   "characters outside [A-Z0-9._/-]",
                   "Use the canonical upper-case code without spaces",
                   [](const NormalizedRecord &r) -> Check {
                     std::string code = StringUtils::trim(r.code);
                     if (!code.empty() &&
                         TextNormalizer::normalizeCode(code) != r.code)
                       return r.code;
                     return std::nullopt;
                   }});

  rules.push_back({"category_missing", ViolationCategory::COMPLETENESS,
                   Severity::WARNING, "category", "Record has no category",
                   "Assign the item to a catalog category",
                   [](const NormalizedRecord &r) -> Check {
                     if (StringUtils::trim(r.category).empty())
                       return r.category;
                     return std::nullopt;
                   }});

  rules.push_back({"inn_invalid", ViolationCategory::ACCURACY, Severity::ERROR,
                   "inn", "INN is not 10 or 12 digits with valid check digits",
                   "Verify the INN against the counterparty documents",
                   [](const NormalizedRecord &r) -> Check {
                     if (!r.inn.empty() && !FieldExtractor::isValidInn(r.inn))
                       return r.inn;
                     return std::nullopt;
                   }});

  rules.push_back({"kpp_invalid", ViolationCategory::ACCURACY,
                   Severity::WARNING, "kpp", "KPP is not 9 digits",
                   "Verify the KPP against the counterparty documents",
                   [](const NormalizedRecord &r) -> Check {
                     if (!r.kpp.empty() && !FieldExtractor::isValidKpp(r.kpp))
                       return r.kpp;
                     return std::nullopt;
                   }});

  rules.push_back({"low_quality_score", ViolationCategory::CONSISTENCY,
                   Severity::WARNING, "quality_score",
                   "Quality score is below 0.50",
                   "Complete the missing fields and normalize again",
                   [](const NormalizedRecord &r) -> Check {
                     if (r.qualityScore < ViolationEngine::LOW_QUALITY_THRESHOLD)
                       return formatScore(r.qualityScore);
                     return std::nullopt;
                   }});

  rules.push_back({"low_ai_confidence", ViolationCategory::ACCURACY,
                   Severity::WARNING, "ai_confidence",
                   "AI confidence of an enhanced record is below 0.70",
                   "Review the enhanced values or reprocess the record",
                   [](const NormalizedRecord &r) -> Check {
                     if (r.processingLevel == ProcessingLevel::AI_ENHANCED &&
                         r.aiConfidence <
                             ViolationEngine::LOW_AI_CONFIDENCE_THRESHOLD)
                       return formatScore(r.aiConfidence);
                     return std::nullopt;
                   }});

  rules.push_back({"benchmark_inconsistent", ViolationCategory::CONSISTENCY,
                   Severity::ERROR, "processing_level",
                   "Benchmark record has a quality score below 0.90",
                   "Reprocess the record to recompute its level",
                   [](const NormalizedRecord &r) -> Check {
                     if (r.processingLevel == ProcessingLevel::BENCHMARK &&
                         r.qualityScore < BENCHMARK_THRESHOLD)
                       return toString(r.processingLevel);
                     return std::nullopt;
                   }});

  return rules;
}
} // namespace

const std::vector<QualityRule> &ViolationEngine::rules() {
  static const std::vector<QualityRule> catalog = buildRules();
  return catalog;
}

const QualityRule *ViolationEngine::findRule(const std::string &name) {
  for (const auto &rule : rules()) {
    if (rule.name == name)
      return &rule;
  }
  return nullptr;
}

std::vector<Violation>
ViolationEngine::evaluate(const NormalizedRecord &record) const {
  std::vector<Violation> violations;
  for (const auto &rule : rules()) {
    std::optional<std::string> current = rule.check(record);
    if (!current)
      continue;

    Violation violation;
    violation.normalizedItemId = record.id;
    violation.ruleName = rule.name;
    violation.category = rule.category;
    violation.severity = rule.severity;
    violation.message = rule.message;
    violation.recommendation = rule.recommendation;
    violation.fieldName = rule.field;
    violation.currentValue = *current;
    violations.push_back(std::move(violation));
  }
  return violations;
}

ViolationDetectionSummary
ViolationEngine::detectViolations(TargetDatabase &db) const {
  NormalizedRecordRepository records(db);
  ViolationRepository violations(db);
  ViolationDetectionSummary summary;

  std::vector<NormalizedRecord> active = records.loadActive();
  std::string now = TimeUtils::nowIso8601Utc();

  SqliteTransaction txn(db);
  for (const auto &record : active) {
    summary.recordsChecked++;
    for (auto &violation : evaluate(record)) {
      summary.violationsFound++;
      violation.createdAt = now;
      if (violations.insertIfAbsent(violation))
        summary.violationsCreated++;
    }
  }
  txn.commit();

  Logger::info(LogCategory::QUALITY, "ViolationEngine::detectViolations",
               db.path() + ": " + std::to_string(summary.violationsFound) +
                   " violations in " + std::to_string(summary.recordsChecked) +
                   " records, " + std::to_string(summary.violationsCreated) +
                   " new");
  return summary;
}

void ViolationEngine::resolveViolation(TargetDatabase &db, int64_t violationId,
                                       const std::string &resolvedBy) const {
  if (StringUtils::trim(resolvedBy).empty()) {
    throw ValidationError("resolved_by must not be empty");
  }

  ViolationRepository violations(db);
  SqliteTransaction txn(db);
  std::optional<Violation> violation = violations.findById(violationId);
  if (!violation) {
    throw NotFoundError("Violation " + std::to_string(violationId) +
                        " not found");
  }
  if (violation->resolved) {
    Logger::debug(LogCategory::QUALITY, "ViolationEngine::resolveViolation",
                  "Violation " + std::to_string(violationId) +
                      " already resolved by " +
                      violation->resolvedBy.value_or(""));
    txn.commit();
    return;
  }
  bool changed = violations.markResolved(violationId, resolvedBy,
                                         TimeUtils::nowIso8601Utc());
  txn.commit();
  if (!changed)
    return;

  Logger::info(LogCategory::QUALITY, "ViolationEngine::resolveViolation",
               "Violation " + std::to_string(violationId) + " resolved by " +
                   resolvedBy);
}
