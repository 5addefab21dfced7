#include "fake_vector_store.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <sme/vector/rest_vector_store.h>

#include <nlohmann/json.hpp>

using namespace sme;
using namespace sme::vector;
using namespace sme::test;
using json = nlohmann::json;

namespace {

VectorRecord record(std::string id, bool withSparse) {
    VectorRecord r;
    r.id = std::move(id);
    r.values = {0.5f, -0.25f};
    if (withSparse) {
        r.sparse_values.indices = {3, 7};
        r.sparse_values.values = {0.25f, 0.75f};
    }
    r.metadata.text = "Basalt is an extrusive rock.";
    r.metadata.source = "rocks.txt";
    r.metadata.doc_id = "doc-1";
    r.metadata.chunk_size = 512;
    r.metadata.chunk_index = 2;
    r.metadata.parent_chunk_id = "chunk-p";
    r.metadata.parent_doc_id = "doc-1";
    r.metadata.subject = "geology";
    r.metadata.file_path = "/docs/rocks.txt";
    return r;
}

RestVectorStoreConfig storeConfig() {
    RestVectorStoreConfig cfg;
    cfg.index_name = "rag";
    cfg.api_key = "key";
    cfg.control_url = "https://control.test";
    return cfg;
}

} // namespace

TEST(RestVectorStoreTest, UpsertBodyCarriesMetadataAndOptionalSparse) {
    auto j = json::parse(RestVectorStore::upsertBody({record("a", true), record("b", false)}, "m1"));

    EXPECT_EQ(j["namespace"], "m1");
    ASSERT_EQ(j["vectors"].size(), 2u);
    const auto& first = j["vectors"][0];
    EXPECT_EQ(first["id"], "a");
    EXPECT_EQ(first["values"].size(), 2u);
    EXPECT_EQ(first["sparseValues"]["indices"], json::array({3, 7}));
    EXPECT_EQ(first["metadata"]["chunk_size"], 512);
    EXPECT_EQ(first["metadata"]["parent_chunk_id"], "chunk-p");
    EXPECT_EQ(first["metadata"]["subject"], "geology");
    EXPECT_FALSE(j["vectors"][1].contains("sparseValues"));
}

TEST(RestVectorStoreTest, QueryBodyIncludesFilterOnlyWhenSet) {
    QueryRequest request;
    request.dense = {1.0f, 0.0f};
    request.top_k = 20;
    request.ns = "m1";

    auto plain = json::parse(RestVectorStore::queryBody(request));
    EXPECT_EQ(plain["topK"], 20);
    EXPECT_EQ(plain["includeMetadata"], true);
    EXPECT_FALSE(plain.contains("filter"));
    EXPECT_FALSE(plain.contains("sparseVector"));

    request.filter = MetadataFilter::eq("chunk_size", int64_t{512});
    request.sparse.indices = {1};
    request.sparse.values = {1.0f};
    auto filtered = json::parse(RestVectorStore::queryBody(request));
    EXPECT_EQ(filtered["filter"]["chunk_size"]["$eq"], 512);
    EXPECT_EQ(filtered["sparseVector"]["values"].size(), 1u);
}

TEST(RestVectorStoreTest, ParseQueryResponse) {
    auto r = RestVectorStore::parseQueryResponse(R"({"matches":[
        {"id":"x","score":0.9,"metadata":{"text":"hello","chunk_size":512.0,"doc_id":"doc-1"}},
        {"id":"y","score":0.4}
    ]})");
    ASSERT_TRUE(r.has_value());
    const auto& matches = r.value();
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].id, "x");
    EXPECT_FLOAT_EQ(matches[0].score, 0.9f);
    EXPECT_EQ(matches[0].metadata.chunk_size, 512u);
    EXPECT_EQ(matches[0].metadata.text, "hello");
    EXPECT_TRUE(matches[1].metadata.text.empty());

    auto none = RestVectorStore::parseQueryResponse(R"({"namespace":"m1"})");
    ASSERT_TRUE(none.has_value());
    EXPECT_TRUE(none.value().empty());

    EXPECT_THAT(RestVectorStore::parseQueryResponse("not json"),
                HasErrorCode(ErrorCode::InvalidData));
}

TEST(RestVectorStoreTest, DescribeMissingIndexIsNullopt) {
    auto http = std::make_shared<FakeHttpClient>();
    http->respond(404, R"({"error":"not found"})");
    RestVectorStore store(storeConfig(), http);

    auto r = store.describeIndex();
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r.value().has_value());
    ASSERT_EQ(http->requests.size(), 1u);
    EXPECT_EQ(http->requests[0].url, "https://control.test/indexes/rag");
    EXPECT_EQ(http->requests[0].headers[0].name, "Api-Key");
}

TEST(RestVectorStoreTest, CreateThenUpsertUsesDataPlaneHost) {
    auto http = std::make_shared<FakeHttpClient>();
    http->respond(201, "{}");
    http->respond(200, R"({"name":"rag","dimension":2,"metric":"dotproduct","host":"rag-x.svc"})");
    http->respond(200, R"({"upsertedCount":1})");
    RestVectorStore store(storeConfig(), http);

    ASSERT_TRUE(store.createIndex(2, "dotproduct").has_value());
    auto created = json::parse(http->requests[0].body);
    EXPECT_EQ(created["metric"], "dotproduct");
    EXPECT_EQ(created["spec"]["serverless"]["region"], "us-east-1");

    ASSERT_TRUE(store.upsert({record("a", true)}, "m1").has_value());
    ASSERT_EQ(http->requests.size(), 3u);
    EXPECT_EQ(http->requests[2].url, "https://rag-x.svc/vectors/upsert");
}

TEST(RestVectorStoreTest, ErrorStatusesAreClassified) {
    auto http = std::make_shared<FakeHttpClient>();
    http->respond(200, R"({"dimension":2,"host":"https://rag-x.svc"})");
    http->respond(503, "busy");
    http->respond(401, "denied");
    RestVectorStore store(storeConfig(), http);

    QueryRequest request;
    request.dense = {1.0f, 0.0f};
    EXPECT_THAT(store.query(request), HasErrorCode(ErrorCode::ServiceUnavailable));
    EXPECT_THAT(store.query(request), HasErrorCode(ErrorCode::PermissionDenied));
}

TEST(RestVectorStoreTest, EmptyDeleteFilterIsRefused) {
    auto http = std::make_shared<FakeHttpClient>();
    RestVectorStore store(storeConfig(), http);
    EXPECT_THAT(store.deleteByFilter(MetadataFilter{}, "m1"),
                HasErrorCode(ErrorCode::InvalidArgument));
    EXPECT_TRUE(http->requests.empty());
}

TEST(RestVectorStoreTest, DeleteBodyFiltersOnDocId) {
    auto j = json::parse(RestVectorStore::deleteBody(MetadataFilter::eq("doc_id", "doc-1"), "m1"));
    EXPECT_EQ(j["filter"]["doc_id"]["$eq"], "doc-1");
    EXPECT_EQ(j["namespace"], "m1");
}

TEST(MetadataFilterTest, MatchesTypedFields) {
    auto r = record("a", false);
    EXPECT_TRUE(MetadataFilter{}.matches(r.metadata));
    EXPECT_TRUE(MetadataFilter::eq("chunk_size", int64_t{512}).matches(r.metadata));
    EXPECT_FALSE(MetadataFilter::eq("chunk_size", int64_t{128}).matches(r.metadata));
    EXPECT_FALSE(MetadataFilter::eq("chunk_size", std::string("512")).matches(r.metadata));
    EXPECT_TRUE(MetadataFilter::eq("doc_id", std::string("doc-1")).matches(r.metadata));
    EXPECT_FALSE(MetadataFilter::eq("unknown", std::string("x")).matches(r.metadata));
}
