#pragma once

#include <sme/core/types.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sme::net {
class IHttpClient;
}

namespace sme::vector {

/**
 * Configuration of one named embedding model.
 *
 * The model name doubles as the vector-store namespace (after sanitization), so two
 * configurations with the same name are not allowed.
 */
struct EmbeddingModelConfig {
    std::string name;
    std::string provider = "http"; // "http" | "hashing"
    std::string endpoint;
    std::string api_key;
    size_t dimension = 768;
    size_t batch_size = 32;
    bool normalize = false;
    std::chrono::milliseconds timeout{30000};
};

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Abstract interface for embedding providers
 * Lets the encoder work with different embedding backends without depending on them.
 * Implementations must be safe to call concurrently once initialized.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Generate embeddings for a batch of texts
     * @param texts Input texts to embed
     * @return One vector per input text, in input order, or error
     */
    virtual Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) = 0;

    /**
     * Check if the provider is initialized and functional
     */
    virtual bool isAvailable() const = 0;

    /**
     * Get the name of this provider (e.g., "Http", "Hashing")
     */
    virtual std::string getProviderName() const = 0;

    /**
     * Get embedding dimension
     */
    virtual size_t getEmbeddingDimension() const = 0;

    /**
     * Initialize the provider (model load / service handshake)
     */
    virtual Result<void> initialize() = 0;

    virtual void shutdown() = 0;
};

/**
 * Deterministic offline encoder: lower-cased alphanumeric tokens are hashed into
 * `dimension` buckets with a signed count and the result is L2-normalized.
 */
class HashingEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimension);

    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override;

    bool isAvailable() const override;
    std::string getProviderName() const override { return "Hashing"; }
    size_t getEmbeddingDimension() const override { return dimension_; }

    Result<void> initialize() override;
    void shutdown() override;

    // Exposed for tests
    std::vector<float> embed(const std::string& text) const;

private:
    size_t dimension_;
    bool initialized_ = false;
};

/**
 * Embedding service client.
 *
 * POSTs {"model": name, "input": [texts]} to the configured endpoint and accepts either an
 * OpenAI-style {"data": [{"embedding": [...]}]} or a bare {"embeddings": [[...]]} response.
 * initialize() probes the service with a single text and verifies the reported width.
 */
class HttpEmbeddingProvider : public IEmbeddingProvider {
public:
    HttpEmbeddingProvider(EmbeddingModelConfig config, std::shared_ptr<net::IHttpClient> http);

    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override;

    bool isAvailable() const override;
    std::string getProviderName() const override { return "Http"; }
    size_t getEmbeddingDimension() const override { return config_.dimension; }

    Result<void> initialize() override;
    void shutdown() override;

private:
    EmbeddingModelConfig config_;
    std::shared_ptr<net::IHttpClient> http_;
    bool initialized_ = false;
};

// Factory keyed on EmbeddingModelConfig::provider
Result<std::unique_ptr<IEmbeddingProvider>>
createEmbeddingProvider(const EmbeddingModelConfig& config,
                        std::shared_ptr<net::IHttpClient> http = nullptr);

} // namespace sme::vector
