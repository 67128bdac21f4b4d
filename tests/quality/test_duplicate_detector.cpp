#include "../support/temp_database.h"
#include "../support/test_runner.h"
#include "core/errors.h"
#include "quality/duplicate_detector.h"
#include "quality/suggestion_generator.h"
#include "storage/duplicate_group_repository.h"
#include "storage/suggestion_repository.h"

NormalizedRecord inMemory(int64_t id, const std::string &code,
                          const std::string &name, double qualityScore) {
  NormalizedRecord record = makeRecord("R" + std::to_string(id), code, name,
                                       qualityScore);
  record.id = id;
  return record;
}

RecordFeatures featuresFor(const std::string &name) {
  NormalizedRecord record;
  record.name = name;
  return DuplicateDetector::featuresOf(record);
}

int main() {
  TestRunner runner;
  DuplicateDetector detector;

  runner.runTest("Same code forms an exact_code cluster", [&]() {
    std::vector<DuplicateCluster> clusters = detector.findClusters(
        {inMemory(1, "CODE001", "Болт М8", 0.6),
         inMemory(2, "code001", "Гайка М10", 0.9),
         inMemory(3, "CODE777", "Шайба плоская", 0.9)});
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(clusters.size()),
                        "one cluster");
    const DuplicateCluster &cluster = clusters[0];
    runner.assertEquals("exact_code", toString(cluster.method), "method");
    runner.assertEquals(int64_t{2},
                        static_cast<int64_t>(cluster.memberIds.size()),
                        "two members");
    runner.assertNear(1.0, cluster.similarityScore, 1e-9, "score");
    runner.assertEquals(int64_t{2}, cluster.masterId, "best quality is master");
  });

  runner.runTest("Equal quality picks the lowest id as master", [&]() {
    std::vector<DuplicateCluster> clusters =
        detector.findClusters({inMemory(9, "A-1", "Болт М8", 0.7),
                               inMemory(4, "X-1", "болт  м8", 0.7)});
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(clusters.size()),
                        "one cluster");
    runner.assertEquals("exact_name", toString(clusters[0].method),
                        "matched by normalized name");
    runner.assertEquals(int64_t{4}, clusters[0].masterId, "lowest id wins");
    runner.assertEquals(int64_t{4}, clusters[0].memberIds.front(),
                        "members sorted");
  });

  runner.runTest("Unrelated records form no cluster", [&]() {
    std::vector<DuplicateCluster> clusters =
        detector.findClusters({inMemory(1, "A-1", "Болт М8", 0.7),
                               inMemory(2, "B-2", "Краска белая", 0.7),
                               inMemory(3, "", "Xy", 0.3)});
    runner.assertEquals(int64_t{0}, static_cast<int64_t>(clusters.size()),
                        "no clusters");
  });

  runner.runTest("Fuzzy strategies score near matches", [&]() {
    RecordFeatures a = featuresFor("Болт м8 оцинкованный");
    RecordFeatures b = featuresFor("Болт м8 оцинкованныи");
    MatchResult semantic =
        DuplicateDetector::score(DetectionMethod::SEMANTIC, a, b);
    runner.assertTrue(semantic.matched, "one letter apart is semantic");
    runner.assertTrue(semantic.score >= DuplicateDetector::SEMANTIC_THRESHOLD &&
                          semantic.score < 1.0,
                      "semantic score in range");

    RecordFeatures c = featuresFor("кабель медный гибкий");
    RecordFeatures d = featuresFor("гибкий кабель медный");
    MatchResult words =
        DuplicateDetector::score(DetectionMethod::WORD_BASED, c, d);
    runner.assertTrue(words.matched, "same words in another order");
    runner.assertNear(1.0, words.score, 1e-9, "full token overlap");
    MatchResult phonetic =
        DuplicateDetector::score(DetectionMethod::PHONETIC, c, d);
    runner.assertTrue(phonetic.matched, "same phonetic key");
    runner.assertTrue(phonetic.score >= 0.5 && phonetic.score <= 1.0,
                      "phonetic score in range");

    RecordFeatures e = featuresFor("болт");
    RecordFeatures f = featuresFor("гайка");
    for (DetectionMethod strategy : DuplicateDetector::STRATEGIES) {
      runner.assertFalse(DuplicateDetector::score(strategy, e, f).matched,
                         "no strategy matches " + toString(strategy));
    }
  });

  runner.runTest("Detection stores groups and keeps unchanged ones", [&]() {
    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "dups.db");
    TargetDatabase db(path);
    int64_t first = insertRecord(db, makeRecord("R1", "CODE001", "Болт М8", 0.6));
    int64_t second =
        insertRecord(db, makeRecord("R2", "CODE001", "Гайка М10", 0.8));

    DuplicateDetectionSummary summary = detector.detectDuplicates(db);
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(summary.clustersFound),
                        "one cluster");
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(summary.groupsCreated),
                        "one group stored");

    DuplicateGroupRepository groups(db);
    std::vector<DuplicateGroup> stored = groups.findUnmerged();
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(stored.size()),
                        "one unmerged group");
    runner.assertEquals(int64_t{2}, stored[0].itemCount, "item count");
    runner.assertEquals(second, stored[0].suggestedMasterId, "master");
    runner.assertEquals(DuplicateGroupRepository::memberKey({first, second}),
                        DuplicateGroupRepository::memberKey(stored[0].memberIds),
                        "members");

    DuplicateDetectionSummary again = detector.detectDuplicates(db);
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(again.groupsUnchanged),
                        "same members left alone");
    runner.assertEquals(int64_t{0}, static_cast<int64_t>(again.groupsCreated),
                        "nothing new");
    runner.assertEquals(stored[0].id, groups.findUnmerged()[0].id,
                        "group id kept");
  });

  runner.runTest("A grown cluster supersedes the overlapping group", [&]() {
    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "grow.db");
    TargetDatabase db(path);
    insertRecord(db, makeRecord("R1", "CODE001", "Болт М8", 0.6));
    insertRecord(db, makeRecord("R2", "CODE001", "Гайка М10", 0.8));
    detector.detectDuplicates(db);

    insertRecord(db, makeRecord("R3", " code001", "Шайба", 0.5));
    DuplicateDetectionSummary summary = detector.detectDuplicates(db);
    runner.assertEquals(int64_t{1},
                        static_cast<int64_t>(summary.groupsSuperseded),
                        "old group replaced");
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(summary.groupsCreated),
                        "new group stored");
    std::vector<DuplicateGroup> stored = DuplicateGroupRepository(db).findUnmerged();
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(stored.size()),
                        "single unmerged group");
    runner.assertEquals(int64_t{3}, stored[0].itemCount, "three members");
  });

  runner.runTest("Merging folds members into the master", [&]() {
    TempDirectory dir;
    std::string path = createTargetDatabase(dir, "merge.db");
    TargetDatabase db(path);
    int64_t low = insertRecord(db, makeRecord("R1", "CODE001", "Болт М8", 0.6));
    int64_t high = insertRecord(db, makeRecord("R2", "CODE001", "Гайка", 0.9));
    detector.detectDuplicates(db);
    int64_t groupId = DuplicateGroupRepository(db).findUnmerged()[0].id;
    SuggestionGenerator().generateSuggestions(db);
    SuggestionRepository suggestions(db);
    SuggestionFilter openMerges;
    openMerges.type = SuggestionType::MERGE;
    openMerges.applied = false;
    runner.assertEquals(int64_t{1}, suggestions.count(openMerges),
                        "merge proposed before the merge");

    detector.mergeGroup(db, groupId);
    NormalizedRecordRepository records(db);
    runner.assertFalse(records.findById(low)->isActive,
                       "duplicate deactivated");
    runner.assertTrue(records.findById(high)->isActive, "master stays active");
    runner.assertEquals(int64_t{1}, records.findById(high)->mergedCount,
                        "merged count");
    std::optional<DuplicateGroup> merged =
        DuplicateGroupRepository(db).findById(groupId);
    runner.assertTrue(merged->merged, "group flagged");
    runner.assertTrue(merged->mergedAt.has_value(), "merge time stamped");
    runner.assertEquals(int64_t{0}, suggestions.count(openMerges),
                        "merge suggestion closed");
    SuggestionFilter closedMerges;
    closedMerges.type = SuggestionType::MERGE;
    closedMerges.applied = true;
    std::vector<Suggestion> closed = suggestions.list(closedMerges, 10, 0);
    runner.assertEquals(int64_t{1}, static_cast<int64_t>(closed.size()),
                        "closed suggestion kept");
    runner.assertEquals(low, closed[0].normalizedItemId,
                        "closed for the folded record");
    runner.assertTrue(closed[0].appliedAt.has_value(), "close time stamped");

    runner.assertThrows<ConflictError>(
        [&]() { detector.mergeGroup(db, groupId); }, "second merge");
    runner.assertEquals(int64_t{1}, records.findById(high)->mergedCount,
                        "failed merge leaves the count");
    runner.assertEquals(*merged->mergedAt,
                        *DuplicateGroupRepository(db).findById(groupId)->mergedAt,
                        "failed merge leaves the merge time");
    SuggestionGenerator().generateSuggestions(db);
    runner.assertEquals(int64_t{0}, suggestions.count(openMerges),
                        "merged group is not proposed again");
    runner.assertThrows<NotFoundError>(
        [&]() { detector.mergeGroup(db, groupId + 100); }, "unknown group");

    DuplicateDetectionSummary after = detector.detectDuplicates(db);
    runner.assertEquals(int64_t{0}, static_cast<int64_t>(after.clustersFound),
                        "inactive record no longer clusters");
    runner.assertTrue(DuplicateGroupRepository(db).findById(groupId).has_value(),
                      "merged group kept");
  });

  runner.printSummary();
  return 0;
}
