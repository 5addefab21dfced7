#include <sme/core/format.h>
#include <sme/crypto/hasher.h>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <vector>

namespace sme::crypto {

namespace {

const EVP_MD* digestFor(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::SHA1:
            return EVP_sha1();
        case DigestAlgorithm::SHA256:
            return EVP_sha256();
    }
    return EVP_sha256();
}

const char* digestName(DigestAlgorithm algorithm) {
    return algorithm == DigestAlgorithm::SHA1 ? "SHA1" : "SHA256";
}

} // namespace

struct DigestHasher::Impl {
    EVP_MD_CTX* ctx = nullptr;
    DigestAlgorithm algorithm;

    explicit Impl(DigestAlgorithm algo) : ctx(EVP_MD_CTX_new()), algorithm(algo) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

DigestHasher::DigestHasher(DigestAlgorithm algorithm)
    : pImpl(std::make_unique<Impl>(algorithm)) {
    init();
}

DigestHasher::~DigestHasher() = default;

DigestHasher::DigestHasher(DigestHasher&&) noexcept = default;
DigestHasher& DigestHasher::operator=(DigestHasher&&) noexcept = default;

void DigestHasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, digestFor(pImpl->algorithm), nullptr) != 1) {
        throw std::runtime_error(sme::format("Failed to initialize {}", digestName(pImpl->algorithm)));
    }
}

void DigestHasher::update(std::span<const std::byte> data) {
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error(sme::format("Failed to update {}", digestName(pImpl->algorithm)));
    }
}

std::string DigestHasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, digest.data(), &digestLen) != 1) {
        throw std::runtime_error(sme::format("Failed to finalize {}", digestName(pImpl->algorithm)));
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string result;
    result.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        result.push_back(kHex[digest[i] >> 4]);
        result.push_back(kHex[digest[i] & 0x0f]);
    }

    // Reset for potential reuse
    init();

    return result;
}

std::string DigestHasher::hashFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error(sme::format("Failed to open file: {}", path.string()));
    }

    init();

    std::vector<std::byte> buffer(DEFAULT_BUFFER_SIZE);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto bytesRead = file.gcount();
        if (bytesRead > 0) {
            update(std::span{buffer.data(), static_cast<size_t>(bytesRead)});
        }
    }
    if (file.bad()) {
        init();
        throw std::runtime_error(sme::format("Failed to read file: {}", path.string()));
    }

    return finalize();
}

Result<std::string> DigestHasher::tryHashFile(const std::filesystem::path& path) {
    try {
        return hashFile(path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to hash file {}: {}", path.string(), e.what());
        return Error{ErrorCode::FileNotFound, e.what()};
    }
}

DigestAlgorithm DigestHasher::algorithm() const noexcept {
    return pImpl->algorithm;
}

std::string DigestHasher::hexDigest(DigestAlgorithm algorithm, std::string_view text) {
    DigestHasher hasher(algorithm);
    return hasher.hash(text);
}

std::string DigestHasher::sha256Hex(std::string_view text) {
    return hexDigest(DigestAlgorithm::SHA256, text);
}

std::string DigestHasher::sha1Hex(std::string_view text) {
    return hexDigest(DigestAlgorithm::SHA1, text);
}

std::unique_ptr<IContentHasher> createSHA256Hasher() {
    return std::make_unique<DigestHasher>(DigestAlgorithm::SHA256);
}

std::unique_ptr<IContentHasher> createSHA1Hasher() {
    return std::make_unique<DigestHasher>(DigestAlgorithm::SHA1);
}

} // namespace sme::crypto
