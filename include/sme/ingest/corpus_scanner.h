#pragma once

#include <sme/crypto/hasher.h>
#include <sme/manifest/ingest_manifest.h>

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace sme::ingest {

struct ScanOptions {
    std::filesystem::path root;
    std::vector<std::string> extensions{".txt", ".md"};
};

/**
 * Walks the corpus root recursively and hashes every file with a supported extension.
 *
 * Keys are resolved absolute paths. A file that cannot be read is logged and recorded with
 * manifest::kUnreadableHash; the scan continues.
 */
class CorpusScanner {
public:
    explicit CorpusScanner(ScanOptions options,
                           std::unique_ptr<crypto::IContentHasher> hasher = nullptr);

    // FileNotFound when the root is missing or not a directory
    Result<manifest::FileHashes> scan();

    bool isSupported(const std::filesystem::path& path) const;

private:
    ScanOptions options_;
    std::set<std::string> extensions_;
    std::unique_ptr<crypto::IContentHasher> hasher_;
};

} // namespace sme::ingest
