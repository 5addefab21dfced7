#pragma once

#include <sme/core/types.h>
#include <sme/vector/embedding_provider.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sme::vector {

using ProviderFactory =
    std::function<Result<std::unique_ptr<IEmbeddingProvider>>(const EmbeddingModelConfig&)>;

/**
 * Registry of named embedding models.
 *
 * A model is created and initialized the first time it is used and then shared for the
 * lifetime of the encoder. Concurrent first callers wait on the same load. A failed load is
 * not cached, so a later call retries it.
 */
class DenseEncoder {
public:
    explicit DenseEncoder(std::vector<EmbeddingModelConfig> models,
                          ProviderFactory factory = nullptr);
    ~DenseEncoder();

    DenseEncoder(const DenseEncoder&) = delete;
    DenseEncoder& operator=(const DenseEncoder&) = delete;

    bool hasModel(const std::string& model) const;
    std::vector<std::string> modelNames() const;

    // Encode in batches of the model's batch_size; one vector per text, in order
    Result<std::vector<std::vector<float>>> encode(const std::string& model,
                                                   const std::vector<std::string>& texts);

    Result<std::vector<float>> encodeOne(const std::string& model, const std::string& text);

    // Vector width of a model (loads it)
    Result<size_t> dimension(const std::string& model);

    // Load now instead of on first use
    Result<void> preload(const std::string& model);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace sme::vector
