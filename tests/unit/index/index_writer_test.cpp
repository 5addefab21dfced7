#include "fake_vector_store.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <sme/index/index_writer.h>

using namespace sme;
using namespace sme::index;
using namespace sme::test;

namespace {

std::vector<vector::VectorRecord> records(size_t n, size_t dim) {
    std::vector<vector::VectorRecord> out;
    for (size_t i = 0; i < n; ++i) {
        vector::VectorRecord r;
        r.id = "chunk-" + std::to_string(i);
        r.values.assign(dim, 0.1f);
        r.metadata.doc_id = "doc-" + std::to_string(i % 2);
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace

class IndexWriterTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeVectorStore> store = std::make_shared<FakeVectorStore>();
};

TEST_F(IndexWriterTest, CreatesMissingIndex) {
    IndexWriter writer(store);
    ASSERT_TRUE(writer.ensureIndex(8).has_value());

    ASSERT_TRUE(store->index.has_value());
    EXPECT_EQ(store->index->dimension, 8u);
    EXPECT_EQ(store->index->metric, "dotproduct");
    EXPECT_EQ(store->countCalls("create"), 1u);
    EXPECT_EQ(writer.dimension(), std::optional<size_t>(8));
}

TEST_F(IndexWriterTest, AcceptsMatchingIndex) {
    store->index = vector::IndexDescription{"rag", 8, "dotproduct"};
    IndexWriter writer(store);
    EXPECT_TRUE(writer.ensureIndex(8).has_value());
    EXPECT_EQ(store->countCalls("create"), 0u);
}

TEST_F(IndexWriterTest, RejectsDimensionMismatch) {
    store->index = vector::IndexDescription{"rag", 768, "dotproduct"};
    IndexWriter writer(store);
    EXPECT_THAT(writer.ensureIndex(384), HasErrorCode(ErrorCode::ConfigurationError));
    EXPECT_FALSE(writer.dimension().has_value());
}

TEST_F(IndexWriterTest, RejectsMetricMismatch) {
    store->index = vector::IndexDescription{"rag", 8, "cosine"};
    IndexWriter writer(store);
    EXPECT_THAT(writer.ensureIndex(8), HasErrorCode(ErrorCode::ConfigurationError));
}

TEST_F(IndexWriterTest, PropagatesDescribeFailure) {
    store->describeError = Error{ErrorCode::NetworkError, "unreachable"};
    IndexWriter writer(store);
    EXPECT_THAT(writer.ensureIndex(8), HasErrorCode(ErrorCode::NetworkError));
    EXPECT_THAT(writer.ensureIndex(0), HasErrorCode(ErrorCode::ConfigurationError));
}

TEST_F(IndexWriterTest, UpsertRequiresEnsureIndex) {
    IndexWriter writer(store);
    EXPECT_THAT(writer.upsert(records(1, 8), "m"), HasErrorCode(ErrorCode::InvalidState));
    EXPECT_EQ(store->countCalls("upsert"), 0u);
}

TEST_F(IndexWriterTest, UpsertChecksWidthBeforeWriting) {
    IndexWriter writer(store);
    ASSERT_TRUE(writer.ensureIndex(8).has_value());

    auto batch = records(3, 8);
    batch[2].values.resize(4);
    EXPECT_THAT(writer.upsert(batch, "m"), HasErrorCode(ErrorCode::ConfigurationError));
    EXPECT_EQ(store->countCalls("upsert"), 0u);
}

TEST_F(IndexWriterTest, UpsertSplitsIntoBatches) {
    IndexWriter writer(store, IndexWriterConfig{"dotproduct", 2});
    ASSERT_TRUE(writer.ensureIndex(8).has_value());

    auto written = writer.upsert(records(5, 8), "m");
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(written.value(), 5u);
    EXPECT_EQ(store->countCalls("upsert"), 3u);
    EXPECT_EQ(store->count("m"), 5u);
}

TEST_F(IndexWriterTest, UpsertFailureKeepsErrorCode) {
    store->failUpsertNamespaces.insert("m");
    IndexWriter writer(store);
    ASSERT_TRUE(writer.ensureIndex(8).has_value());
    EXPECT_THAT(writer.upsert(records(2, 8), "m"), HasErrorCode(ErrorCode::ServiceUnavailable));
}

TEST_F(IndexWriterTest, DeleteIssuesOneRequestPerDocumentAndNamespace) {
    IndexWriter writer(store);
    ASSERT_TRUE(writer.ensureIndex(8).has_value());
    ASSERT_TRUE(writer.upsert(records(4, 8), "a").has_value());
    ASSERT_TRUE(writer.upsert(records(4, 8), "b").has_value());

    store->failDeleteDocIds.insert("doc-1");
    auto report = writer.deleteDocuments({"doc-0", "doc-1"}, {"a", "b"});

    EXPECT_EQ(report.requests, 4u);
    EXPECT_EQ(report.failed_doc_ids, std::set<std::string>{"doc-1"});
    // doc-0 owned chunk-0 and chunk-2
    EXPECT_EQ(store->count("a"), 2u);
    EXPECT_EQ(store->count("b"), 2u);
}

TEST_F(IndexWriterTest, DeleteNothingIsANoOp) {
    IndexWriter writer(store);
    auto report = writer.deleteDocuments({}, {"a"});
    EXPECT_EQ(report.requests, 0u);
    EXPECT_TRUE(report.failed_doc_ids.empty());
}

TEST(IndexWriterNamespaceTest, SanitizesModelNames) {
    EXPECT_EQ(IndexWriter::namespaceFor("all-MiniLM-L6-v2"), "all-MiniLM-L6-v2");
    EXPECT_EQ(IndexWriter::namespaceFor("BAAI/bge-base-en-v1.5"), "BAAI_bge-base-en-v1_5");
    EXPECT_EQ(IndexWriter::namespaceFor("my model"), "my_model");
}
