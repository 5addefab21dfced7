#include "test_helpers.h"
#include <gtest/gtest.h>
#include <sme/manifest/ingest_manifest.h>

using namespace sme;
using namespace sme::manifest;
using namespace sme::test;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class ChangeDetectorTest : public SmeTest {};

TEST_F(ChangeDetectorTest, NewFileIsProcessedAndNothingDeleted) {
    IngestManifest manifest;
    manifest.files = {{"/docs/a.txt", "h1"}};

    auto delta = ChangeDetector::computeDelta({{"/docs/a.txt", "h1"}, {"/docs/b.txt", "h2"}},
                                              manifest);

    EXPECT_THAT(delta.toProcess, ElementsAre("/docs/b.txt"));
    EXPECT_THAT(delta.newPaths, ElementsAre("/docs/b.txt"));
    EXPECT_THAT(delta.toDelete, IsEmpty());
    EXPECT_THAT(delta.unchanged, ElementsAre("/docs/a.txt"));
    EXPECT_TRUE(delta.hasChanges());
}

TEST_F(ChangeDetectorTest, ModifiedFileIsDeletedAndReprocessed) {
    IngestManifest manifest;
    manifest.files = {{"/docs/a.txt", "h1"}};

    auto delta = ChangeDetector::computeDelta({{"/docs/a.txt", "h2"}}, manifest);

    EXPECT_THAT(delta.toProcess, ElementsAre("/docs/a.txt"));
    EXPECT_THAT(delta.toDelete, ElementsAre("/docs/a.txt"));
    EXPECT_THAT(delta.modifiedPaths, ElementsAre("/docs/a.txt"));
    EXPECT_EQ(delta.next.files.at("/docs/a.txt"), "h2");
}

TEST_F(ChangeDetectorTest, RemovedFileIsDeletedOnly) {
    IngestManifest manifest;
    manifest.files = {{"/docs/a.txt", "h1"}, {"/docs/b.txt", "h2"}};
    manifest.doc_ids = {{"/docs/a.txt", "doc-1"}, {"/docs/b.txt", "doc-2"}};

    auto delta = ChangeDetector::computeDelta({{"/docs/a.txt", "h1"}}, manifest);

    EXPECT_THAT(delta.deletedPaths, ElementsAre("/docs/b.txt"));
    EXPECT_THAT(delta.toDelete, ElementsAre("/docs/b.txt"));
    EXPECT_THAT(delta.toProcess, IsEmpty());
    EXPECT_FALSE(delta.next.files.count("/docs/b.txt"));
    EXPECT_FALSE(delta.next.doc_ids.count("/docs/b.txt"));
    EXPECT_EQ(delta.next.doc_ids.at("/docs/a.txt"), "doc-1");
}

TEST_F(ChangeDetectorTest, ToDeleteMergesModifiedAndDeletedSorted) {
    IngestManifest manifest;
    manifest.files = {{"/a", "1"}, {"/b", "2"}, {"/c", "3"}};

    auto delta = ChangeDetector::computeDelta({{"/a", "1"}, {"/c", "changed"}}, manifest);

    EXPECT_THAT(delta.toDelete, ElementsAre("/b", "/c"));
    EXPECT_THAT(delta.toProcess, ElementsAre("/c"));
}

TEST_F(ChangeDetectorTest, UnchangedCorpusHasNoChanges) {
    IngestManifest manifest;
    manifest.files = {{"/a", "1"}};

    auto delta = ChangeDetector::computeDelta({{"/a", "1"}}, manifest);

    EXPECT_FALSE(delta.hasChanges());
    EXPECT_EQ(delta.next, manifest);
}

TEST_F(ChangeDetectorTest, UnreadableFileIsAlwaysRetried) {
    IngestManifest manifest;
    manifest.files = {{"/a", kUnreadableHash}};

    auto delta = ChangeDetector::computeDelta({{"/a", kUnreadableHash}}, manifest);

    EXPECT_THAT(delta.toProcess, ElementsAre("/a"));
}

TEST_F(ChangeDetectorTest, CommitSkipsFailedPaths) {
    IngestManifest previous;
    previous.files = {{"/mod", "old"}};
    previous.doc_ids = {{"/mod", "doc-mod"}};

    auto delta = ChangeDetector::computeDelta({{"/mod", "new"}, {"/new", "h"}}, previous);

    CommitOutcome outcome;
    outcome.failedPaths = {"/mod", "/new"};
    auto committed = ChangeDetector::commit(previous, delta, outcome);

    // Modified file keeps its previous hash so the next run retries it
    EXPECT_EQ(committed.files.at("/mod"), "old");
    EXPECT_FALSE(committed.files.count("/new"));
    EXPECT_EQ(committed.doc_ids.at("/mod"), "doc-mod");
}

TEST_F(ChangeDetectorTest, CommitRecordsSuccessfulWork) {
    IngestManifest previous;
    previous.files = {{"/gone", "g"}, {"/mod", "old"}};
    previous.doc_ids = {{"/gone", "doc-gone"}, {"/mod", "doc-mod"}};

    auto delta = ChangeDetector::computeDelta({{"/mod", "new"}, {"/new", "h"}}, previous);

    CommitOutcome outcome;
    outcome.assignedDocIds = {{"/mod", "doc-mod"}, {"/new", "doc-new"}};
    auto committed = ChangeDetector::commit(previous, delta, outcome);

    EXPECT_EQ(committed.files.size(), 2u);
    EXPECT_EQ(committed.files.at("/mod"), "new");
    EXPECT_EQ(committed.files.at("/new"), "h");
    EXPECT_EQ(committed.doc_ids.at("/new"), "doc-new");
    EXPECT_FALSE(committed.files.count("/gone"));
    EXPECT_FALSE(committed.doc_ids.count("/gone"));
}

TEST_F(ChangeDetectorTest, FailedDeletionKeepsManifestEntry) {
    IngestManifest previous;
    previous.files = {{"/gone", "g"}};
    previous.doc_ids = {{"/gone", "doc-gone"}};

    auto delta = ChangeDetector::computeDelta({}, previous);

    CommitOutcome outcome;
    outcome.failedDeletePaths = {"/gone"};
    auto committed = ChangeDetector::commit(previous, delta, outcome);

    EXPECT_EQ(committed.files.at("/gone"), "g");
    EXPECT_EQ(committed.doc_ids.at("/gone"), "doc-gone");
}

TEST_F(ChangeDetectorTest, ManifestSaveAndLoad) {
    IngestManifest manifest;
    manifest.files = {{"/docs/a.txt", "abc"}};
    manifest.doc_ids = {{"/docs/a.txt", "doc-0123456789abcdef"}};

    auto path = testDir / "logs" / "ingestion_manifest.json";
    ASSERT_TRUE(manifest.save(path));
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    EXPECT_EQ(IngestManifest::load(path), manifest);
    EXPECT_NE(readFile(path).find("\n  \"doc_ids\""), std::string::npos);
}

TEST_F(ChangeDetectorTest, MissingManifestLoadsEmpty) {
    EXPECT_TRUE(IngestManifest::load(testDir / "absent.json").empty());
}

TEST_F(ChangeDetectorTest, CorruptManifestLoadsEmpty) {
    auto path = writeFile("bad.json", "{ this is not json");
    EXPECT_TRUE(IngestManifest::load(path).empty());

    auto wrongShape = writeFile("shape.json", R"({"files": ["a", "b"]})");
    EXPECT_TRUE(IngestManifest::load(wrongShape).empty());
}

TEST_F(ChangeDetectorTest, FromJsonRejectsNonStringHashes) {
    auto parsed = IngestManifest::fromJson(R"({"files": {"/a": 3}, "doc_ids": {}})");
    EXPECT_THAT(parsed, HasErrorCode(ErrorCode::CorruptedData));
}
