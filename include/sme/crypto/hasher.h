#pragma once

#include <sme/core/types.h>

#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace sme::crypto {

enum class DigestAlgorithm { SHA1, SHA256 };

// Interface for content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    // Stream-based hashing
    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    // Convenience method for hashing files; throws std::runtime_error when unreadable
    virtual std::string hashFile(const std::filesystem::path& path) = 0;

    // Non-throwing variant used where an unreadable file must not abort the caller
    virtual Result<std::string> tryHashFile(const std::filesystem::path& path) = 0;

    std::string hash(std::string_view text) {
        init();
        update(std::as_bytes(std::span(text.data(), text.size())));
        return finalize();
    }
};

// OpenSSL EVP backed digest, lowercase hex output
class DigestHasher : public IContentHasher {
public:
    explicit DigestHasher(DigestAlgorithm algorithm = DigestAlgorithm::SHA256);
    ~DigestHasher();

    DigestHasher(const DigestHasher&) = delete;
    DigestHasher& operator=(const DigestHasher&) = delete;
    DigestHasher(DigestHasher&&) noexcept;
    DigestHasher& operator=(DigestHasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    std::string hashFile(const std::filesystem::path& path) override;
    Result<std::string> tryHashFile(const std::filesystem::path& path) override;

    DigestAlgorithm algorithm() const noexcept;

    // One-shot helpers
    static std::string hexDigest(DigestAlgorithm algorithm, std::string_view text);
    static std::string sha256Hex(std::string_view text);
    static std::string sha1Hex(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Factory functions
std::unique_ptr<IContentHasher> createSHA256Hasher();
std::unique_ptr<IContentHasher> createSHA1Hasher();

} // namespace sme::crypto
