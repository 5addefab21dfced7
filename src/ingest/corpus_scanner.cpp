#include <sme/core/format.h>
#include <sme/extraction/text_extractor.h>
#include <sme/ingest/corpus_scanner.h>
#include <sme/ingest/identity_assigner.h>

#include <spdlog/spdlog.h>

namespace sme::ingest {

CorpusScanner::CorpusScanner(ScanOptions options, std::unique_ptr<crypto::IContentHasher> hasher)
    : options_(std::move(options)), hasher_(std::move(hasher)) {
    if (!hasher_) {
        hasher_ = crypto::createSHA256Hasher();
    }
    for (const auto& ext : options_.extensions) {
        extensions_.insert(extraction::TextExtractorRegistry::normalizeExtension(ext));
    }
}

bool CorpusScanner::isSupported(const std::filesystem::path& path) const {
    return extensions_.count(
               extraction::TextExtractorRegistry::normalizeExtension(path.extension().string())) >
           0;
}

Result<manifest::FileHashes> CorpusScanner::scan() {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(options_.root, ec)) {
        return Error{ErrorCode::FileNotFound,
                     sme::format("Corpus directory not found: {}", options_.root.string())};
    }

    manifest::FileHashes hashes;
    fs::recursive_directory_iterator it(options_.root,
                                        fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     sme::format("Cannot read corpus directory {}: {}", options_.root.string(),
                                 ec.message())};
    }

    for (auto end = fs::recursive_directory_iterator(); it != end;) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc) && isSupported(it->path())) {
            auto key = IdentityAssigner::resolvePath(it->path());
            auto digest = hasher_->tryHashFile(it->path());
            if (digest) {
                hashes[key] = digest.value();
            } else {
                spdlog::error("Cannot hash {}: {}; it will be retried on the next run", key,
                              digest.error().message);
                hashes[key] = manifest::kUnreadableHash;
            }
        }

        it.increment(ec);
        if (ec) {
            // A partial listing would look like deletions to the change detector
            return Error{ErrorCode::PermissionDenied,
                         sme::format("Failed to list {}: {}", options_.root.string(),
                                     ec.message())};
        }
    }
    spdlog::info("Scanned {}: {} supported files", options_.root.string(), hashes.size());
    return hashes;
}

} // namespace sme::ingest
