#include <sme/chunking/text_normalizer.h>
#include <sme/core/format.h>
#include <sme/ingest/document_loader.h>

#include <spdlog/spdlog.h>

#include <ctime>

namespace sme::ingest {

DocumentLoader::DocumentLoader(std::shared_ptr<extraction::TextExtractorRegistry> registry,
                               IdentityAssigner& identities, DocumentLoaderOptions options)
    : registry_(std::move(registry)), identities_(identities), options_(std::move(options)) {}

std::string DocumentLoader::isoTimestamp(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
    return buf;
}

Result<std::vector<DocumentRecord>> DocumentLoader::loadFile(const std::string& path) {
    std::filesystem::path fsPath(path);
    auto extractor = registry_->findForFile(fsPath);
    if (!extractor) {
        return Error{ErrorCode::NotSupported,
                     sme::format("No extractor for {}", fsPath.extension().string())};
    }

    auto extracted = extractor->extract(fsPath, options_.extraction);
    if (!extracted) {
        return extracted.error();
    }
    for (const auto& warning : extracted.value().warnings) {
        spdlog::warn("{}: {}", path, warning);
    }

    const auto resolved = IdentityAssigner::resolvePath(fsPath);
    const auto docId = identities_.documentId(resolved);
    const auto timestamp = isoTimestamp(std::chrono::system_clock::now());

    std::vector<DocumentRecord> documents;
    auto texts = extracted.value().documents();
    documents.reserve(texts.size());
    for (size_t seq = 0; seq < texts.size(); ++seq) {
        DocumentRecord doc;
        doc.text = chunking::normalizeText(texts[seq]);
        doc.doc_id = docId;
        doc.subject = options_.subject;
        doc.source = fsPath.filename().string();
        doc.file_path = resolved;
        doc.timestamp = timestamp;
        doc.doc_seq = seq;
        documents.push_back(std::move(doc));
    }
    return documents;
}

LoadResult DocumentLoader::load(const std::vector<std::string>& paths) {
    LoadResult result;
    for (const auto& path : paths) {
        auto docs = loadFile(path);
        if (!docs) {
            spdlog::error("Failed to load {}: {}", path, docs.error().message);
            result.failedPaths.push_back(path);
            continue;
        }
        spdlog::debug("Loaded {} document(s) from {}", docs.value().size(), path);
        auto loaded = std::move(docs).value();
        result.documents.insert(result.documents.end(),
                                std::make_move_iterator(loaded.begin()),
                                std::make_move_iterator(loaded.end()));
        result.loadedPaths.push_back(path);
    }
    spdlog::info("Loaded {} documents from {} files ({} failed)", result.documents.size(),
                 result.loadedPaths.size(), result.failedPaths.size());
    return result;
}

} // namespace sme::ingest
