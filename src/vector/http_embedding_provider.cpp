#include <sme/core/format.h>
#include <sme/net/http_client.h>
#include <sme/vector/embedding_provider.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>

namespace sme::vector {

using json = nlohmann::json;

namespace {

void l2Normalize(std::vector<float>& v) {
    double norm = 0.0;
    for (float x : v) {
        norm += static_cast<double>(x) * x;
    }
    if (norm <= 0.0) {
        return;
    }
    const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (auto& x : v) {
        x *= inv;
    }
}

Result<std::vector<std::vector<float>>> parseEmbeddings(const std::string& body, size_t expected) {
    try {
        auto j = json::parse(body);
        std::vector<std::vector<float>> out;
        if (j.is_object() && j.contains("data") && j["data"].is_array()) {
            for (const auto& item : j["data"]) {
                out.push_back(item.at("embedding").get<std::vector<float>>());
            }
        } else if (j.is_object() && j.contains("embeddings")) {
            out = j["embeddings"].get<std::vector<std::vector<float>>>();
        } else {
            return Error{ErrorCode::InvalidData, "Embedding response has neither data nor embeddings"};
        }
        if (out.size() != expected) {
            return Error{ErrorCode::InvalidData,
                         sme::format("Embedding service returned {} vectors for {} inputs",
                                     out.size(), expected)};
        }
        return out;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     sme::format("Malformed embedding response: {}", e.what())};
    }
}

} // namespace

HttpEmbeddingProvider::HttpEmbeddingProvider(EmbeddingModelConfig config,
                                             std::shared_ptr<net::IHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {}

Result<void> HttpEmbeddingProvider::initialize() {
    if (initialized_) {
        return Result<void>();
    }
    if (config_.endpoint.empty()) {
        return Error{ErrorCode::ConfigurationError,
                     sme::format("Model '{}' has no embedding endpoint configured", config_.name)};
    }
    if (!http_) {
        return Error{ErrorCode::InvalidState, "Embedding provider has no HTTP client"};
    }

    spdlog::info("Loading embedding model '{}' from {}", config_.name, config_.endpoint);
    initialized_ = true;
    auto probe = generateBatchEmbeddings({"dimension probe"});
    if (!probe) {
        initialized_ = false;
        return probe.error();
    }
    const size_t width = probe.value().front().size();
    if (width != config_.dimension) {
        initialized_ = false;
        return Error{ErrorCode::ConfigurationError,
                     sme::format("Model '{}' produces {}-dimensional vectors, configured {}",
                                 config_.name, width, config_.dimension)};
    }
    return Result<void>();
}

void HttpEmbeddingProvider::shutdown() {
    initialized_ = false;
}

bool HttpEmbeddingProvider::isAvailable() const {
    return initialized_;
}

Result<std::vector<std::vector<float>>>
HttpEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized,
                     sme::format("Embedding model '{}' not initialized", config_.name)};
    }
    if (texts.empty()) {
        return std::vector<std::vector<float>>{};
    }

    json request{{"model", config_.name}, {"input", texts}};
    std::vector<net::Header> headers;
    if (!config_.api_key.empty()) {
        headers.push_back({"Authorization", "Bearer " + config_.api_key});
    }

    auto response = http_->post(config_.endpoint, request.dump(), headers);
    if (!response) {
        return response.error();
    }
    if (!response.value().ok()) {
        return net::statusToError(response.value(), "embedding request");
    }

    auto parsed = parseEmbeddings(response.value().body, texts.size());
    if (!parsed) {
        return parsed.error();
    }
    auto vectors = std::move(parsed).value();
    if (config_.normalize) {
        for (auto& v : vectors) {
            l2Normalize(v);
        }
    }
    return vectors;
}

Result<std::unique_ptr<IEmbeddingProvider>>
createEmbeddingProvider(const EmbeddingModelConfig& config, std::shared_ptr<net::IHttpClient> http) {
    if (config.provider == "hashing") {
        return std::unique_ptr<IEmbeddingProvider>(
            std::make_unique<HashingEmbeddingProvider>(config.dimension));
    }
    if (config.provider == "http") {
        if (!http) {
            http = net::createHttpClient(net::HttpClientConfig{config.timeout});
        }
        return std::unique_ptr<IEmbeddingProvider>(
            std::make_unique<HttpEmbeddingProvider>(config, std::move(http)));
    }
    return Error{ErrorCode::ConfigurationError,
                 sme::format("Unknown embedding provider '{}' for model '{}'", config.provider,
                             config.name)};
}

} // namespace sme::vector
