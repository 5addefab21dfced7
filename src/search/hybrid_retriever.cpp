#include <sme/core/format.h>
#include <sme/index/index_writer.h>
#include <sme/search/hybrid_retriever.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace sme::search {

namespace {

RetrievedPassage toPassage(vector::QueryMatch match) {
    RetrievedPassage p;
    p.id = std::move(match.id);
    p.hybrid_score = match.score;
    auto& md = match.metadata;
    p.text = std::move(md.text);
    p.source = std::move(md.source);
    p.doc_id = std::move(md.doc_id);
    p.parent_chunk_id = std::move(md.parent_chunk_id);
    p.file_path = std::move(md.file_path);
    p.subject = std::move(md.subject);
    p.chunk_size = md.chunk_size;
    p.chunk_index = md.chunk_index;
    return p;
}

} // namespace

HybridRetriever::HybridRetriever(std::shared_ptr<vector::DenseEncoder> encoder,
                                 std::shared_ptr<const sparse::BM25Encoder> sparseModel,
                                 std::shared_ptr<vector::IVectorStore> store,
                                 std::shared_ptr<IReranker> reranker, RetrievalConfig config)
    : encoder_(std::move(encoder)),
      sparse_(std::move(sparseModel)),
      store_(std::move(store)),
      reranker_(std::move(reranker)),
      config_(config) {}

Result<std::unique_ptr<HybridRetriever>>
HybridRetriever::create(std::shared_ptr<vector::DenseEncoder> encoder,
                        const std::filesystem::path& sparseModelPath,
                        std::shared_ptr<vector::IVectorStore> store,
                        std::shared_ptr<IReranker> reranker, RetrievalConfig config) {
    auto loaded = sparse::BM25Encoder::load(sparseModelPath);
    if (!loaded) {
        spdlog::error("Cannot start retrieval: {}", loaded.error().message);
        return loaded.error();
    }
    auto sparseModel = std::make_shared<const sparse::BM25Encoder>(std::move(loaded).value());
    if (!reranker || !reranker->isReady()) {
        spdlog::warn("No relevance model available; results keep first-stage order");
    }
    return std::make_unique<HybridRetriever>(std::move(encoder), std::move(sparseModel),
                                             std::move(store), std::move(reranker), config);
}

Result<std::vector<RetrievedPassage>> HybridRetriever::search(const std::string& query,
                                                              const std::string& model) const {
    if (!encoder_->hasModel(model)) {
        return Error{ErrorCode::ConfigurationError,
                     sme::format("Unknown embedding model '{}'", model)};
    }

    auto dense = encoder_->encodeOne(model, query);
    if (!dense) {
        return dense.error();
    }

    vector::QueryRequest request;
    request.dense = std::move(dense).value();
    request.sparse = sparse_->encodeQuery(query);
    request.filter =
        vector::MetadataFilter::eq("chunk_size", static_cast<int64_t>(config_.search_level));
    request.top_k = config_.pre_rerank_top_k;
    request.ns = index::IndexWriter::namespaceFor(model);
    request.include_metadata = true;

    if (request.sparse.empty()) {
        spdlog::debug("Query has no vocabulary terms; dense similarity only");
    }

    auto matches = store_->query(request);
    if (!matches) {
        return matches.error();
    }

    std::vector<RetrievedPassage> passages;
    passages.reserve(matches.value().size());
    for (auto& match : std::move(matches).value()) {
        passages.push_back(toPassage(std::move(match)));
    }
    spdlog::debug("Stage 1 returned {} candidates from namespace '{}'", passages.size(),
                  request.ns);
    return passages;
}

std::vector<RetrievedPassage> HybridRetriever::rerank(const std::string& query,
                                                      std::vector<RetrievedPassage> candidates) const {
    auto truncated = [this](std::vector<RetrievedPassage> v) {
        if (v.size() > config_.final_top_k) {
            v.resize(config_.final_top_k);
        }
        return v;
    };

    if (candidates.empty()) {
        return candidates;
    }
    if (!reranker_ || !reranker_->isReady()) {
        spdlog::warn("Relevance model unavailable; returning first-stage order");
        return truncated(std::move(candidates));
    }

    std::vector<std::string> texts;
    texts.reserve(candidates.size());
    for (const auto& c : candidates) {
        texts.push_back(c.text);
    }

    auto scores = reranker_->scoreDocuments(query, texts);
    if (!scores) {
        spdlog::warn("Reranking failed ({}); returning first-stage order", scores.error().message);
        return truncated(std::move(candidates));
    }
    if (scores.value().size() != candidates.size()) {
        spdlog::warn("Reranker returned {} scores for {} candidates; returning first-stage order",
                     scores.value().size(), candidates.size());
        return truncated(std::move(candidates));
    }

    for (size_t i = 0; i < candidates.size(); ++i) {
        candidates[i].rerank_score = scores.value()[i];
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const RetrievedPassage& a, const RetrievedPassage& b) {
                         return *a.rerank_score > *b.rerank_score;
                     });
    return truncated(std::move(candidates));
}

Result<std::vector<RetrievedPassage>> HybridRetriever::searchAndRerank(const std::string& query,
                                                                       const std::string& model) const {
    auto candidates = search(query, model);
    if (!candidates) {
        return candidates.error();
    }
    if (candidates.value().empty()) {
        spdlog::info("No passages found for query");
        return candidates;
    }
    return rerank(query, std::move(candidates).value());
}

} // namespace sme::search
