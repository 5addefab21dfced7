#include <sme/core/format.h>
#include <sme/vector/dense_encoder.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <mutex>

namespace sme::vector {

namespace {

struct ModelSlot {
    EmbeddingModelConfig config;
    std::mutex load_mutex;
    std::shared_ptr<IEmbeddingProvider> provider;
};

} // namespace

class DenseEncoder::Impl {
public:
    Impl(std::vector<EmbeddingModelConfig> models, ProviderFactory factory)
        : factory_(std::move(factory)) {
        if (!factory_) {
            factory_ = [](const EmbeddingModelConfig& cfg) { return createEmbeddingProvider(cfg); };
        }
        for (auto& model : models) {
            auto name = model.name;
            if (slots_.count(name)) {
                spdlog::warn("Embedding model '{}' configured twice, keeping the first", name);
                continue;
            }
            auto slot = std::make_unique<ModelSlot>();
            slot->config = std::move(model);
            order_.push_back(name);
            slots_.emplace(std::move(name), std::move(slot));
        }
    }

    ModelSlot* find(const std::string& model) const {
        auto it = slots_.find(model);
        return it == slots_.end() ? nullptr : it->second.get();
    }

    Result<std::shared_ptr<IEmbeddingProvider>> acquire(const std::string& model) {
        ModelSlot* slot = find(model);
        if (!slot) {
            return Error{ErrorCode::ConfigurationError,
                         sme::format("Unknown embedding model '{}'", model)};
        }

        std::lock_guard<std::mutex> lock(slot->load_mutex);
        if (slot->provider) {
            return slot->provider;
        }

        auto created = factory_(slot->config);
        if (!created) {
            return created.error();
        }
        std::shared_ptr<IEmbeddingProvider> provider = std::move(created).value();
        if (!provider) {
            return Error{ErrorCode::InternalError,
                         sme::format("Provider factory returned nothing for '{}'", model)};
        }
        if (auto init = provider->initialize(); !init) {
            spdlog::error("Failed to load embedding model '{}': {}", model, init.error().message);
            return init.error();
        }
        if (provider->getEmbeddingDimension() != slot->config.dimension) {
            return Error{ErrorCode::ConfigurationError,
                         sme::format("Model '{}' reports dimension {}, configured {}", model,
                                     provider->getEmbeddingDimension(), slot->config.dimension)};
        }

        spdlog::info("Embedding model '{}' ready ({} provider, dim {})", model,
                     provider->getProviderName(), provider->getEmbeddingDimension());
        slot->provider = provider;
        return provider;
    }

    std::map<std::string, std::unique_ptr<ModelSlot>> slots_;
    std::vector<std::string> order_;
    ProviderFactory factory_;
};

DenseEncoder::DenseEncoder(std::vector<EmbeddingModelConfig> models, ProviderFactory factory)
    : pImpl(std::make_unique<Impl>(std::move(models), std::move(factory))) {}

DenseEncoder::~DenseEncoder() = default;

bool DenseEncoder::hasModel(const std::string& model) const {
    return pImpl->find(model) != nullptr;
}

std::vector<std::string> DenseEncoder::modelNames() const {
    return pImpl->order_;
}

Result<void> DenseEncoder::preload(const std::string& model) {
    auto provider = pImpl->acquire(model);
    if (!provider) {
        return provider.error();
    }
    return Result<void>();
}

Result<size_t> DenseEncoder::dimension(const std::string& model) {
    auto provider = pImpl->acquire(model);
    if (!provider) {
        return provider.error();
    }
    return provider.value()->getEmbeddingDimension();
}

Result<std::vector<std::vector<float>>>
DenseEncoder::encode(const std::string& model, const std::vector<std::string>& texts) {
    auto acquired = pImpl->acquire(model);
    if (!acquired) {
        return acquired.error();
    }
    const auto& provider = acquired.value();
    const auto* slot = pImpl->find(model);
    const size_t batchSize = std::max<size_t>(1, slot->config.batch_size);
    const size_t width = provider->getEmbeddingDimension();

    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (size_t begin = 0; begin < texts.size(); begin += batchSize) {
        size_t end = std::min(texts.size(), begin + batchSize);
        std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(begin),
                                       texts.begin() + static_cast<std::ptrdiff_t>(end));
        auto vectors = provider->generateBatchEmbeddings(batch);
        if (!vectors) {
            return vectors.error();
        }
        if (vectors.value().size() != batch.size()) {
            return Error{ErrorCode::InvalidData,
                         sme::format("Model '{}' returned {} vectors for {} texts", model,
                                     vectors.value().size(), batch.size())};
        }
        for (auto& v : std::move(vectors).value()) {
            if (v.size() != width) {
                return Error{ErrorCode::ConfigurationError,
                             sme::format("Model '{}' produced a {}-dimensional vector, expected {}",
                                         model, v.size(), width)};
            }
            out.push_back(std::move(v));
        }
    }
    return out;
}

Result<std::vector<float>> DenseEncoder::encodeOne(const std::string& model,
                                                   const std::string& text) {
    auto vectors = encode(model, {text});
    if (!vectors) {
        return vectors.error();
    }
    return std::move(vectors).value().front();
}

} // namespace sme::vector
