#include "test_helpers.h"
#include <gtest/gtest.h>
#include <sme/ingest/identity_assigner.h>

#include <thread>

using namespace sme;
using namespace sme::ingest;
using namespace sme::test;

class IdentityAssignerTest : public SmeTest {};

TEST_F(IdentityAssignerTest, StableIdShape) {
    auto id = IdentityAssigner::stableId("abc", "doc");
    // SHA-1("abc") = a9993e364706816a...
    EXPECT_EQ(id, "doc-a9993e364706816a");
}

TEST_F(IdentityAssignerTest, ChunkIdIsDeterministic) {
    auto a = IdentityAssigner::chunkId("doc-1", 512, 3, 100, 42);
    auto b = IdentityAssigner::chunkId("doc-1", 512, 3, 100, 42);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.rfind("chunk-", 0), 0u);
    EXPECT_EQ(a.size(), std::string("chunk-").size() + IdentityAssigner::kIdHexLength);
}

TEST_F(IdentityAssignerTest, ChunkIdDependsOnEveryComponent) {
    auto base = IdentityAssigner::chunkId("doc-1", 512, 3, 100, 42);
    EXPECT_NE(base, IdentityAssigner::chunkId("doc-2", 512, 3, 100, 42));
    EXPECT_NE(base, IdentityAssigner::chunkId("doc-1", 2048, 3, 100, 42));
    EXPECT_NE(base, IdentityAssigner::chunkId("doc-1", 512, 4, 100, 42));
    EXPECT_NE(base, IdentityAssigner::chunkId("doc-1", 512, 3, 101, 42));
    EXPECT_NE(base, IdentityAssigner::chunkId("doc-1", 512, 3, 100, 43));
}

TEST_F(IdentityAssignerTest, DocumentIdIsKeyedByResolvedPath) {
    auto file = writeFile("sub/a.txt", "x");
    IdentityAssigner assigner;

    auto direct = assigner.documentId(file);
    auto indirect = assigner.documentId(testDir / "sub" / ".." / "sub" / "a.txt");

    EXPECT_EQ(direct, indirect);
    EXPECT_EQ(direct, IdentityAssigner::stableId(IdentityAssigner::resolvePath(file), "doc"));
}

TEST_F(IdentityAssignerTest, KnownIdsSurviveContentChanges) {
    auto file = writeFile("a.txt", "first");
    auto key = IdentityAssigner::resolvePath(file);

    IdentityAssigner assigner({{key, "doc-from-manifest"}});
    writeFile("a.txt", "second");

    EXPECT_EQ(assigner.documentId(file), "doc-from-manifest");
}

TEST_F(IdentityAssignerTest, LookupDoesNotAssign) {
    auto file = writeFile("a.txt", "x");
    IdentityAssigner assigner;

    EXPECT_FALSE(assigner.lookup(file).has_value());
    auto id = assigner.documentId(file);
    EXPECT_EQ(assigner.lookup(file), id);
    EXPECT_EQ(assigner.documentIds().size(), 1u);
}

TEST_F(IdentityAssignerTest, ConcurrentAssignmentAgrees) {
    auto file = writeFile("a.txt", "x");
    IdentityAssigner assigner;

    std::vector<std::string> ids(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < ids.size(); ++i) {
        threads.emplace_back([&, i]() { ids[i] = assigner.documentId(file); });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto& id : ids) {
        EXPECT_EQ(id, ids.front());
    }
    EXPECT_EQ(assigner.documentIds().size(), 1u);
}
