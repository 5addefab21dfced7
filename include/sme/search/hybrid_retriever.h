#pragma once

#include <sme/core/types.h>
#include <sme/search/reranker.h>
#include <sme/sparse/bm25_encoder.h>
#include <sme/vector/dense_encoder.h>
#include <sme/vector/vector_store.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sme::search {

struct RetrievalConfig {
    size_t search_level = 2048;
    size_t pre_rerank_top_k = 50;
    size_t final_top_k = 10;
};

struct RetrievedPassage {
    std::string id;
    std::string text;
    std::string source;
    std::string doc_id;
    std::string parent_chunk_id;
    std::string file_path;
    std::string subject;
    size_t chunk_size = 0;
    size_t chunk_index = 0;
    float hybrid_score = 0.0f;
    std::optional<float> rerank_score;
};

/**
 * Two-stage retrieval.
 *
 * Stage 1 asks the vector store for the pre_rerank_top_k best chunks of the search level by
 * combined dense and sparse similarity. Stage 2 rescores those candidates with the relevance
 * model and keeps the final_top_k best. Without a usable relevance model the stage-1 order is
 * kept. Safe to call concurrently.
 */
class HybridRetriever {
public:
    HybridRetriever(std::shared_ptr<vector::DenseEncoder> encoder,
                    std::shared_ptr<const sparse::BM25Encoder> sparseModel,
                    std::shared_ptr<vector::IVectorStore> store,
                    std::shared_ptr<IReranker> reranker, RetrievalConfig config = {});

    // Loads the sparse model artifact; MissingArtifact when ingestion has not produced one
    static Result<std::unique_ptr<HybridRetriever>>
    create(std::shared_ptr<vector::DenseEncoder> encoder,
           const std::filesystem::path& sparseModelPath, std::shared_ptr<vector::IVectorStore> store,
           std::shared_ptr<IReranker> reranker, RetrievalConfig config = {});

    Result<std::vector<RetrievedPassage>> searchAndRerank(const std::string& query,
                                                          const std::string& model) const;

    // Stage 1 only
    Result<std::vector<RetrievedPassage>> search(const std::string& query,
                                                 const std::string& model) const;

    // Stage 2: stable descending sort by relevance, truncated to final_top_k
    std::vector<RetrievedPassage> rerank(const std::string& query,
                                         std::vector<RetrievedPassage> candidates) const;

    const RetrievalConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<vector::DenseEncoder> encoder_;
    std::shared_ptr<const sparse::BM25Encoder> sparse_;
    std::shared_ptr<vector::IVectorStore> store_;
    std::shared_ptr<IReranker> reranker_;
    RetrievalConfig config_;
};

} // namespace sme::search
