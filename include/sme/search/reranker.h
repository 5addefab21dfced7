#pragma once

#include <sme/core/types.h>
#include <sme/net/http_client.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sme::search {

/**
 * @brief Relevance model scoring (query, passage) pairs
 */
class IReranker {
public:
    virtual ~IReranker() = default;

    /**
     * @brief Score documents against a query using a cross-encoder
     *
     * @return One score per document, in input order (higher is more relevant), or error
     */
    virtual Result<std::vector<float>>
    scoreDocuments(const std::string& query, const std::vector<std::string>& documents) = 0;

    /**
     * @brief Check if the reranker is ready to accept requests
     */
    virtual bool isReady() const = 0;
};

struct HttpRerankerConfig {
    std::string model = "BAAI/bge-reranker-base";
    std::string endpoint;
    std::string api_key;
    size_t batch_size = 16;
};

/**
 * @brief Cross-encoder scoring service client
 *
 * POSTs {"model", "query", "texts"} per batch and accepts either {"scores": [...]} or a
 * list of {"index", "score"} objects.
 */
class HttpReranker final : public IReranker {
public:
    HttpReranker(HttpRerankerConfig config, std::shared_ptr<net::IHttpClient> http);

    Result<std::vector<float>> scoreDocuments(const std::string& query,
                                              const std::vector<std::string>& documents) override;

    bool isReady() const override;

    static Result<std::vector<float>> parseScores(const std::string& body, size_t expected);

private:
    HttpRerankerConfig config_;
    std::shared_ptr<net::IHttpClient> http_;
};

} // namespace sme::search
