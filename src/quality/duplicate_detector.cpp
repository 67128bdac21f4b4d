#include "quality/duplicate_detector.h"
#include "core/errors.h"
#include "core/logger.h"
#include "normalization/text_normalizer.h"
#include "quality/string_similarity.h"
#include "storage/duplicate_group_repository.h"
#include "storage/normalized_record_repository.h"
#include "storage/suggestion_repository.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <map>
#include <numeric>
#include <unordered_map>
#include <unordered_set>

namespace {
class UnionFind {
  std::vector<size_t> parent_;

public:
  explicit UnionFind(size_t n) : parent_(n) {
    std::iota(parent_.begin(), parent_.end(), 0);
  }

  size_t find(size_t x) {
    while (parent_[x] != x) {
      parent_[x] = parent_[parent_[x]];
      x = parent_[x];
    }
    return x;
  }

  void unite(size_t a, size_t b) {
    size_t ra = find(a);
    size_t rb = find(b);
    if (ra != rb)
      parent_[std::max(ra, rb)] = std::min(ra, rb);
  }
};

std::string namePrefix(const std::string &normalizedName) {
  std::u32string cps = StringUtils::decodeUtf8(normalizedName);
  if (cps.size() < 3)
    return "";
  return StringUtils::encodeUtf8(cps.substr(0, 3));
}
} // namespace

RecordFeatures DuplicateDetector::featuresOf(const NormalizedRecord &record) {
  RecordFeatures features;
  features.id = record.id;
  features.qualityScore = record.qualityScore;
  features.canonicalCode = TextNormalizer::normalizeCode(record.code);
  features.normalizedName = record.normalizedName.empty()
                                ? TextNormalizer::normalizeName(record.name)
                                : record.normalizedName;
  features.tokens = TextNormalizer::tokenize(features.normalizedName, true);
  features.phoneticKey = StringSimilarity::phoneticKey(features.tokens);
  return features;
}

MatchResult DuplicateDetector::score(DetectionMethod strategy,
                                     const RecordFeatures &a,
                                     const RecordFeatures &b) {
  MatchResult result;
  switch (strategy) {
  case DetectionMethod::EXACT_CODE:
    if (!a.canonicalCode.empty() && a.canonicalCode == b.canonicalCode) {
      result = {true, 1.0};
    }
    break;
  case DetectionMethod::EXACT_NAME:
    if (!a.normalizedName.empty() && a.normalizedName == b.normalizedName) {
      result = {true, 1.0};
    }
    break;
  case DetectionMethod::SEMANTIC:
    if (!a.normalizedName.empty() && !b.normalizedName.empty()) {
      double similarity = StringSimilarity::combinedSimilarity(
          a.normalizedName, b.normalizedName);
      if (similarity >= SEMANTIC_THRESHOLD)
        result = {true, similarity};
    }
    break;
  case DetectionMethod::PHONETIC:
    if (!a.phoneticKey.empty() && a.phoneticKey == b.phoneticKey) {
      result = {true, 0.5 + 0.5 * StringSimilarity::levenshteinSimilarity(
                                      a.normalizedName, b.normalizedName)};
    }
    break;
  case DetectionMethod::WORD_BASED:
    if (a.tokens.size() >= 2 && b.tokens.size() >= 2) {
      double similarity = StringSimilarity::jaccard(a.tokens, b.tokens);
      if (similarity >= WORD_BASED_THRESHOLD)
        result = {true, similarity};
    }
    break;
  case DetectionMethod::MIXED:
    break;
  }
  result.score = clampUnit(result.score);
  return result;
}

bool DuplicateDetector::evaluatePair(const std::vector<RecordFeatures> &features,
                                     size_t a, size_t b,
                                     std::vector<Edge> &edges) {
  for (DetectionMethod strategy : STRATEGIES) {
    MatchResult match = score(strategy, features[a], features[b]);
    if (match.matched) {
      edges.push_back(Edge{a, b, strategy, match.score});
      return true;
    }
  }
  return false;
}

std::vector<DuplicateCluster>
DuplicateDetector::findClusters(const std::vector<NormalizedRecord> &records) const {
  std::vector<RecordFeatures> features;
  features.reserve(records.size());
  for (const auto &record : records) {
    features.push_back(featuresOf(record));
  }

  // Candidate pairs come from blocking keys; records sharing none of them are
  // never compared.
  std::map<std::string, std::vector<size_t>> exactBuckets;
  std::map<std::string, std::vector<size_t>> fuzzyBuckets;
  for (size_t i = 0; i < features.size(); ++i) {
    const RecordFeatures &f = features[i];
    if (!f.canonicalCode.empty())
      exactBuckets["c:" + f.canonicalCode].push_back(i);
    if (!f.normalizedName.empty())
      exactBuckets["n:" + f.normalizedName].push_back(i);
    if (!f.phoneticKey.empty())
      fuzzyBuckets["p:" + f.phoneticKey].push_back(i);
    std::string prefix = namePrefix(f.normalizedName);
    if (!prefix.empty())
      fuzzyBuckets["x:" + prefix].push_back(i);
    for (const auto &token : f.tokens) {
      if (StringUtils::utf8Length(token) >= 3)
        fuzzyBuckets["t:" + token].push_back(i);
    }
  }

  std::vector<Edge> edges;
  std::unordered_set<uint64_t> evaluated;
  auto visit = [&](size_t a, size_t b) {
    if (a > b)
      std::swap(a, b);
    uint64_t pairKey = static_cast<uint64_t>(a) * features.size() + b;
    if (!evaluated.insert(pairKey).second)
      return;
    evaluatePair(features, a, b, edges);
  };

  // Identical keys link transitively, so chaining neighbours is enough.
  for (auto &bucket : exactBuckets) {
    auto &members = bucket.second;
    for (size_t i = 1; i < members.size(); ++i) {
      visit(members[i - 1], members[i]);
    }
  }
  size_t skippedBuckets = 0;
  for (auto &bucket : fuzzyBuckets) {
    auto &members = bucket.second;
    if (members.size() < 2)
      continue;
    if (members.size() > MAX_BUCKET_SIZE) {
      skippedBuckets++;
      continue;
    }
    for (size_t i = 0; i < members.size(); ++i) {
      for (size_t j = i + 1; j < members.size(); ++j) {
        visit(members[i], members[j]);
      }
    }
  }
  if (skippedBuckets > 0) {
    Logger::debug(LogCategory::QUALITY, "DuplicateDetector::findClusters",
                  "Skipped " + std::to_string(skippedBuckets) +
                      " oversized candidate buckets");
  }

  UnionFind components(features.size());
  for (const auto &edge : edges) {
    components.unite(edge.a, edge.b);
  }

  struct Accumulator {
    std::vector<size_t> members;
    std::set<DetectionMethod> methods;
    double scoreSum = 0.0;
    size_t edgeCount = 0;
  };
  std::map<size_t, Accumulator> byRoot;
  for (const auto &edge : edges) {
    Accumulator &acc = byRoot[components.find(edge.a)];
    acc.methods.insert(edge.method);
    acc.scoreSum += edge.score;
    acc.edgeCount++;
  }
  for (size_t i = 0; i < features.size(); ++i) {
    auto it = byRoot.find(components.find(i));
    if (it != byRoot.end())
      it->second.members.push_back(i);
  }

  std::vector<DuplicateCluster> clusters;
  for (const auto &entry : byRoot) {
    const Accumulator &acc = entry.second;
    DuplicateCluster cluster;
    cluster.method = acc.methods.size() == 1 ? *acc.methods.begin()
                                             : DetectionMethod::MIXED;
    cluster.similarityScore =
        clampUnit(acc.scoreSum / static_cast<double>(acc.edgeCount));

    const RecordFeatures *master = nullptr;
    for (size_t index : acc.members) {
      const RecordFeatures &f = features[index];
      cluster.memberIds.push_back(f.id);
      if (master == nullptr || f.qualityScore > master->qualityScore ||
          (f.qualityScore == master->qualityScore && f.id < master->id)) {
        master = &f;
      }
    }
    std::sort(cluster.memberIds.begin(), cluster.memberIds.end());
    cluster.masterId = master->id;
    clusters.push_back(std::move(cluster));
  }

  std::sort(clusters.begin(), clusters.end(),
            [](const DuplicateCluster &x, const DuplicateCluster &y) {
              return x.memberIds.front() < y.memberIds.front();
            });
  return clusters;
}

DuplicateDetectionSummary
DuplicateDetector::detectDuplicates(TargetDatabase &db) const {
  NormalizedRecordRepository records(db);
  DuplicateGroupRepository groups(db);
  DuplicateDetectionSummary summary;

  std::vector<DuplicateCluster> clusters = findClusters(records.loadActive());
  summary.clustersFound = clusters.size();

  SqliteTransaction txn(db);
  std::unordered_map<std::string, int64_t> existingByKey;
  std::unordered_map<int64_t, std::vector<int64_t>> groupsByMember;
  for (const auto &group : groups.findUnmerged()) {
    existingByKey[DuplicateGroupRepository::memberKey(group.memberIds)] =
        group.id;
    for (int64_t member : group.memberIds) {
      groupsByMember[member].push_back(group.id);
    }
  }

  std::unordered_set<int64_t> removed;
  std::string now = TimeUtils::nowIso8601Utc();
  for (const auto &cluster : clusters) {
    if (existingByKey.count(DuplicateGroupRepository::memberKey(cluster.memberIds))) {
      summary.groupsUnchanged++;
      continue;
    }

    for (int64_t member : cluster.memberIds) {
      auto it = groupsByMember.find(member);
      if (it == groupsByMember.end())
        continue;
      for (int64_t groupId : it->second) {
        if (removed.insert(groupId).second) {
          groups.remove(groupId);
          summary.groupsSuperseded++;
        }
      }
    }

    DuplicateGroup group;
    group.detectionMethod = cluster.method;
    group.similarityScore = cluster.similarityScore;
    group.suggestedMasterId = cluster.masterId;
    group.memberIds = cluster.memberIds;
    group.itemCount = static_cast<int64_t>(cluster.memberIds.size());
    group.createdAt = now;
    groups.insert(group);
    summary.groupsCreated++;
  }
  txn.commit();

  Logger::info(LogCategory::QUALITY, "DuplicateDetector::detectDuplicates",
               db.path() + ": " + std::to_string(summary.clustersFound) +
                   " clusters, " + std::to_string(summary.groupsCreated) +
                   " new groups, " + std::to_string(summary.groupsSuperseded) +
                   " superseded");
  return summary;
}

void DuplicateDetector::mergeGroup(TargetDatabase &db, int64_t groupId) const {
  NormalizedRecordRepository records(db);
  DuplicateGroupRepository groups(db);
  SuggestionRepository suggestions(db);

  SqliteTransaction txn(db);
  std::optional<DuplicateGroup> group = groups.findById(groupId);
  if (!group) {
    throw NotFoundError("Duplicate group " + std::to_string(groupId) +
                        " not found");
  }
  if (group->merged) {
    throw ConflictError("Duplicate group " + std::to_string(groupId) +
                        " is already merged");
  }

  std::string now = TimeUtils::nowIso8601Utc();
  size_t deactivated = 0;
  int64_t suggestionsClosed = 0;
  for (int64_t member : group->memberIds) {
    if (member == group->suggestedMasterId)
      continue;
    if (records.deactivate(member))
      deactivated++;
    suggestionsClosed += suggestions.markMergesApplied(member, now);
  }
  records.addMergedCount(group->suggestedMasterId,
                         static_cast<int64_t>(group->memberIds.size()) - 1);
  if (!groups.markMerged(groupId, now)) {
    throw ConflictError("Duplicate group " + std::to_string(groupId) +
                        " is already merged");
  }
  txn.commit();

  Logger::info(LogCategory::QUALITY, "DuplicateDetector::mergeGroup",
               "Merged group " + std::to_string(groupId) + " into record " +
                   std::to_string(group->suggestedMasterId) + " (" +
                   std::to_string(deactivated) + " records deactivated, " +
                   std::to_string(suggestionsClosed) +
                   " merge suggestions closed)");
}
