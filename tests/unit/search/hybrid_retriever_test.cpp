#include "fake_vector_store.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <sme/search/hybrid_retriever.h>

using namespace sme;
using namespace sme::search;
using namespace sme::test;

namespace {

class ScriptedReranker : public IReranker {
public:
    Result<std::vector<float>> scoreDocuments(const std::string& query,
                                              const std::vector<std::string>& documents) override {
        ++calls;
        lastQuery = query;
        lastDocuments = documents;
        if (error) {
            return *error;
        }
        return scores;
    }

    bool isReady() const override { return ready; }

    std::vector<float> scores;
    std::optional<Error> error;
    bool ready = true;
    int calls = 0;
    std::string lastQuery;
    std::vector<std::string> lastDocuments;
};

vector::QueryMatch match(std::string id, float score, std::string text) {
    vector::QueryMatch m;
    m.id = std::move(id);
    m.score = score;
    m.metadata.text = std::move(text);
    m.metadata.chunk_size = 512;
    m.metadata.doc_id = "doc-1";
    return m;
}

} // namespace

class HybridRetrieverTest : public SmeTest {
protected:
    void SetUp() override {
        SmeTest::SetUp();
        vector::EmbeddingModelConfig cfg;
        cfg.name = "alpha";
        cfg.provider = "hashing";
        cfg.dimension = 16;
        encoder = std::make_shared<vector::DenseEncoder>(
            std::vector<vector::EmbeddingModelConfig>{cfg});

        auto bm25 = std::make_shared<sparse::BM25Encoder>();
        ASSERT_TRUE(bm25->fit({"bauxite is refined into alumina",
                               "geothermal plants turn steam into power"})
                        .has_value());
        sparseModel = bm25;

        store->cannedMatches = {match("a", 0.9f, "first"), match("b", 0.8f, "second"),
                                match("c", 0.7f, "third"), match("d", 0.6f, "fourth")};
    }

    HybridRetriever retriever(std::shared_ptr<IReranker> r, size_t finalTopK = 3) {
        return HybridRetriever(encoder, sparseModel, store, std::move(r),
                               RetrievalConfig{512, 20, finalTopK});
    }

    std::shared_ptr<vector::DenseEncoder> encoder;
    std::shared_ptr<const sparse::BM25Encoder> sparseModel;
    std::shared_ptr<FakeVectorStore> store = std::make_shared<FakeVectorStore>();
    std::shared_ptr<ScriptedReranker> reranker = std::make_shared<ScriptedReranker>();
};

TEST_F(HybridRetrieverTest, StageOneQueriesTheSearchLevel) {
    auto r = retriever(reranker).search("How is bauxite refined?", "alpha");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().size(), 4u);

    ASSERT_TRUE(store->lastQuery.has_value());
    const auto& q = *store->lastQuery;
    EXPECT_EQ(q.ns, "alpha");
    EXPECT_EQ(q.top_k, 20u);
    EXPECT_EQ(q.dense.size(), 16u);
    EXPECT_FALSE(q.sparse.empty());
    ASSERT_EQ(q.filter.equals.count("chunk_size"), 1u);
    EXPECT_EQ(std::get<int64_t>(q.filter.equals.at("chunk_size")), 512);
    EXPECT_EQ(reranker->calls, 0);
}

TEST_F(HybridRetrieverTest, RerankSortsByRelevanceAndTruncates) {
    reranker->scores = {0.1f, 0.9f, 0.5f, 0.9f};
    auto r = retriever(reranker).searchAndRerank("bauxite", "alpha");
    ASSERT_TRUE(r.has_value());
    const auto& passages = r.value();

    ASSERT_EQ(passages.size(), 3u);
    // Ties keep stage-1 order
    EXPECT_EQ(passages[0].id, "b");
    EXPECT_EQ(passages[1].id, "d");
    EXPECT_EQ(passages[2].id, "c");
    EXPECT_FLOAT_EQ(*passages[0].rerank_score, 0.9f);
    EXPECT_FLOAT_EQ(passages[0].hybrid_score, 0.8f);
    EXPECT_EQ(reranker->lastQuery, "bauxite");
    EXPECT_EQ(reranker->lastDocuments,
              (std::vector<std::string>{"first", "second", "third", "fourth"}));
}

TEST_F(HybridRetrieverTest, FallsBackToStageOneOrder) {
    auto expectStageOne = [](const Result<std::vector<RetrievedPassage>>& r) {
        ASSERT_TRUE(r.has_value());
        ASSERT_EQ(r.value().size(), 3u);
        EXPECT_EQ(r.value()[0].id, "a");
        EXPECT_EQ(r.value()[2].id, "c");
        EXPECT_FALSE(r.value()[0].rerank_score.has_value());
    };

    expectStageOne(retriever(nullptr).searchAndRerank("bauxite", "alpha"));

    reranker->ready = false;
    expectStageOne(retriever(reranker).searchAndRerank("bauxite", "alpha"));
    EXPECT_EQ(reranker->calls, 0);

    reranker->ready = true;
    reranker->error = Error{ErrorCode::ServiceUnavailable, "down"};
    expectStageOne(retriever(reranker).searchAndRerank("bauxite", "alpha"));

    reranker->error.reset();
    reranker->scores = {1.0f, 2.0f};
    expectStageOne(retriever(reranker).searchAndRerank("bauxite", "alpha"));
}

TEST_F(HybridRetrieverTest, EmptyResultsSkipReranking) {
    store->cannedMatches.clear();
    auto r = retriever(reranker).searchAndRerank("nothing here", "alpha");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r.value().empty());
    EXPECT_EQ(reranker->calls, 0);
}

TEST_F(HybridRetrieverTest, UnknownModelIsConfigurationError) {
    EXPECT_THAT(retriever(reranker).searchAndRerank("q", "missing"),
                HasErrorCode(ErrorCode::ConfigurationError));
    EXPECT_FALSE(store->lastQuery.has_value());
}

TEST_F(HybridRetrieverTest, StoreErrorsPropagate) {
    store->queryError = Error{ErrorCode::NetworkError, "unreachable"};
    EXPECT_THAT(retriever(reranker).searchAndRerank("bauxite", "alpha"),
                HasErrorCode(ErrorCode::NetworkError));
}

TEST_F(HybridRetrieverTest, OnlyTheSearchLevelIsReturned) {
    store->cannedMatches.clear();
    auto coarse = match("coarse", 0.0f, "bauxite ore");
    auto fine = match("fine", 0.0f, "bauxite ore");
    fine.metadata.chunk_size = 128;
    for (const auto& m : {coarse, fine}) {
        vector::VectorRecord rec;
        rec.id = m.id;
        rec.values.assign(16, 0.25f);
        rec.metadata = m.metadata;
        store->data["alpha"][rec.id] = rec;
    }

    auto r = retriever(nullptr).searchAndRerank("bauxite", "alpha");
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].id, "coarse");
    EXPECT_EQ(r.value()[0].chunk_size, 512u);
}

TEST_F(HybridRetrieverTest, CreateRequiresSparseModelArtifact) {
    auto missing = HybridRetriever::create(encoder, testDir / "absent.json", store, reranker);
    EXPECT_THAT(missing, HasErrorCode(ErrorCode::MissingArtifact));

    auto path = testDir / "bm25.json";
    ASSERT_TRUE(sparseModel->save(path).has_value());
    auto created = HybridRetriever::create(encoder, path, store, reranker,
                                           RetrievalConfig{512, 20, 2});
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created.value()->config().final_top_k, 2u);
}
