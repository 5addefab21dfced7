#include <sme/vector/embedding_provider.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <string_view>

namespace sme::vector {

namespace {

// FNV-1a, stable across platforms unlike std::hash
uint64_t fnv1a(std::string_view s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

} // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension) : dimension_(dimension) {
    spdlog::debug("HashingEmbeddingProvider created with dimension {}", dimension);
}

Result<void> HashingEmbeddingProvider::initialize() {
    if (dimension_ == 0) {
        return Error{ErrorCode::ConfigurationError, "Hashing provider needs a positive dimension"};
    }
    initialized_ = true;
    return Result<void>();
}

void HashingEmbeddingProvider::shutdown() {
    initialized_ = false;
}

bool HashingEmbeddingProvider::isAvailable() const {
    return initialized_;
}

std::vector<float> HashingEmbeddingProvider::embed(const std::string& text) const {
    std::vector<float> v(dimension_, 0.0f);
    if (dimension_ == 0) {
        return v;
    }

    std::string token;
    auto flush = [&]() {
        if (token.empty()) {
            return;
        }
        uint64_t h = fnv1a(token);
        size_t bucket = static_cast<size_t>(h % dimension_);
        v[bucket] += ((h >> 63) & 1ULL) ? -1.0f : 1.0f;
        token.clear();
    };
    for (unsigned char c : text) {
        if (c >= 0x80 || std::isalnum(c)) {
            token.push_back(static_cast<char>(c < 0x80 ? std::tolower(c) : c));
        } else {
            flush();
        }
    }
    flush();

    double norm = 0.0;
    for (float x : v) {
        norm += static_cast<double>(x) * x;
    }
    if (norm > 0.0) {
        const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& x : v) {
            x *= inv;
        }
    }
    return v;
}

Result<std::vector<std::vector<float>>>
HashingEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Hashing provider not initialized"};
    }
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(embed(text));
    }
    return out;
}

} // namespace sme::vector
