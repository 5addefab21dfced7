#include <sme/core/format.h>
#include <sme/crypto/hasher.h>
#include <sme/ingest/identity_assigner.h>

namespace sme::ingest {

IdentityAssigner::IdentityAssigner(manifest::DocumentIds known) : ids_(std::move(known)) {}

std::string IdentityAssigner::stableId(std::string_view seed, std::string_view prefix) {
    auto digest = crypto::DigestHasher::sha1Hex(seed);
    return sme::format("{}-{}", prefix, digest.substr(0, kIdHexLength));
}

std::string IdentityAssigner::chunkId(std::string_view parentId, size_t levelSize, size_t index,
                                      size_t startOffset, size_t contentLength) {
    return stableId(
        sme::format("{}|{}|{}|{}|{}", parentId, levelSize, index, startOffset, contentLength),
        "chunk");
}

std::string IdentityAssigner::resolvePath(const std::filesystem::path& path) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        resolved = std::filesystem::absolute(path, ec).lexically_normal();
    }
    return resolved.string();
}

std::string IdentityAssigner::documentId(const std::filesystem::path& path) {
    auto key = resolvePath(path);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ids_.find(key);
    if (it != ids_.end()) {
        return it->second;
    }
    auto id = stableId(key, "doc");
    ids_.emplace(key, id);
    return id;
}

std::optional<std::string> IdentityAssigner::lookup(const std::filesystem::path& path) const {
    auto key = resolvePath(path);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ids_.find(key);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

manifest::DocumentIds IdentityAssigner::documentIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_;
}

} // namespace sme::ingest
