#ifndef DUPLICATE_DETECTOR_H
#define DUPLICATE_DETECTOR_H

#include "quality/quality_models.h"
#include "storage/target_database.h"
#include <array>
#include <set>
#include <string>
#include <vector>

struct MatchResult {
  bool matched = false;
  double score = 0.0;
};

// Features of one record precomputed once per detection run.
struct RecordFeatures {
  int64_t id = 0;
  double qualityScore = 0.0;
  std::string canonicalCode;
  std::string normalizedName;
  std::vector<std::string> tokens;
  std::string phoneticKey;
};

struct DuplicateCluster {
  std::vector<int64_t> memberIds;
  DetectionMethod method = DetectionMethod::EXACT_CODE;
  double similarityScore = 0.0;
  int64_t masterId = 0;
};

struct DuplicateDetectionSummary {
  size_t clustersFound = 0;
  size_t groupsCreated = 0;
  size_t groupsUnchanged = 0;
  size_t groupsSuperseded = 0;
};

class DuplicateDetector {
public:
  static constexpr double SEMANTIC_THRESHOLD = 0.90;
  static constexpr double WORD_BASED_THRESHOLD = 0.75;
  static constexpr size_t MAX_BUCKET_SIZE = 200;

  // Pairwise strategies in precedence order. MIXED is not a strategy; it
  // labels clusters linked by more than one of these.
  static constexpr std::array<DetectionMethod, 5> STRATEGIES = {
      DetectionMethod::EXACT_CODE, DetectionMethod::EXACT_NAME,
      DetectionMethod::SEMANTIC, DetectionMethod::PHONETIC,
      DetectionMethod::WORD_BASED};

  static RecordFeatures featuresOf(const NormalizedRecord &record);

  static MatchResult score(DetectionMethod strategy, const RecordFeatures &a,
                           const RecordFeatures &b);

  // Clusters the records in memory. Each record lands in at most one cluster;
  // clusters are ordered by their smallest member id.
  std::vector<DuplicateCluster>
  findClusters(const std::vector<NormalizedRecord> &records) const;

  // Detects over the active records of the database and stores the groups.
  // Merged groups are kept; an unmerged group with the same member set is
  // kept as is; unmerged groups overlapping a new cluster are replaced.
  DuplicateDetectionSummary detectDuplicates(TargetDatabase &db) const;

  // Folds the members into the suggested master in one transaction. Throws
  // NotFoundError for an unknown group and ConflictError when already merged.
  void mergeGroup(TargetDatabase &db, int64_t groupId) const;

private:
  struct Edge {
    size_t a;
    size_t b;
    DetectionMethod method;
    double score;
  };

  static bool evaluatePair(const std::vector<RecordFeatures> &features,
                           size_t a, size_t b, std::vector<Edge> &edges);
};

#endif
