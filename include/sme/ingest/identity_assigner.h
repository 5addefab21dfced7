#pragma once

#include <sme/manifest/ingest_manifest.h>

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace sme::ingest {

/**
 * Stable, content-addressed identities.
 *
 * stableId(seed, prefix) = prefix + "-" + first 16 hex chars of SHA-1(seed).
 * Document ids are keyed by the resolved absolute file path and cached in a map that is
 * seeded from the manifest, so a file keeps its id across content edits.
 */
class IdentityAssigner {
public:
    static constexpr size_t kIdHexLength = 16;

    IdentityAssigner() = default;
    explicit IdentityAssigner(manifest::DocumentIds known);

    static std::string stableId(std::string_view seed, std::string_view prefix);

    // Seed: "{parent}|{levelSize}|{index}|{startOffset}|{length}"
    static std::string chunkId(std::string_view parentId, size_t levelSize, size_t index,
                               size_t startOffset, size_t contentLength);

    // Absolute, lexically normalized path; symlinks resolved when the file exists
    static std::string resolvePath(const std::filesystem::path& path);

    // Cached or newly derived id for the file
    std::string documentId(const std::filesystem::path& path);

    // Known id without assigning one
    std::optional<std::string> lookup(const std::filesystem::path& path) const;

    manifest::DocumentIds documentIds() const;

private:
    manifest::DocumentIds ids_;
    mutable std::mutex mutex_;
};

} // namespace sme::ingest
