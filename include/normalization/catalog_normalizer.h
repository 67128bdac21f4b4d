#ifndef CATALOG_NORMALIZER_H
#define CATALOG_NORMALIZER_H

#include "quality/quality_models.h"
#include "storage/catalog_item_reader.h"
#include <memory>
#include <optional>

// Pluggable source of an AI/model confidence for a normalized record. Returning
// nullopt means no opinion; the record then stays at the basic level.
class IConfidenceScorer {
public:
  virtual ~IConfidenceScorer() = default;
  virtual std::optional<double> score(const NormalizedRecord &record) = 0;
};

// Turns one raw catalog item into a NormalizedRecord: canonical name, domain
// fields, quality score and processing level. Workers share one instance, so
// the scorer is called concurrently.
class CatalogNormalizer {
private:
  std::shared_ptr<IConfidenceScorer> scorer_;

public:
  explicit CatalogNormalizer(std::shared_ptr<IConfidenceScorer> scorer = nullptr);

  // Throws ValidationError for items that cannot be normalized (no reference,
  // or neither code nor name). Scorer failures propagate; the worker counts
  // them as failed items.
  NormalizedRecord normalize(const RawCatalogItem &item) const;

  // Weighted completeness plus validity bonuses, clamped to [0, 1].
  static double computeQualityScore(const NormalizedRecord &record);

  static ProcessingLevel decideLevel(double qualityScore,
                                     const std::optional<double> &confidence);
};

#endif
