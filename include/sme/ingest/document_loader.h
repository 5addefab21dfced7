#pragma once

#include <sme/core/types.h>
#include <sme/extraction/text_extractor.h>
#include <sme/ingest/document_record.h>
#include <sme/ingest/identity_assigner.h>

#include <memory>
#include <string>
#include <vector>

namespace sme::ingest {

struct DocumentLoaderOptions {
    std::string subject = "General";
    extraction::ExtractionConfig extraction;
};

struct LoadResult {
    std::vector<DocumentRecord> documents;
    std::vector<std::string> loadedPaths; // at least one document extracted
    std::vector<std::string> failedPaths;
};

/**
 * Extracts files through the registry, assigns document identity, stamps document metadata
 * and normalizes the text. A file that fails is logged and reported, never fatal.
 */
class DocumentLoader {
public:
    DocumentLoader(std::shared_ptr<extraction::TextExtractorRegistry> registry,
                   IdentityAssigner& identities, DocumentLoaderOptions options = {});

    LoadResult load(const std::vector<std::string>& paths);

    Result<std::vector<DocumentRecord>> loadFile(const std::string& path);

    // ISO-8601 local time without fractional seconds, e.g. 2024-05-01T13:45:10
    static std::string isoTimestamp(TimePoint tp);

private:
    std::shared_ptr<extraction::TextExtractorRegistry> registry_;
    IdentityAssigner& identities_;
    DocumentLoaderOptions options_;
};

} // namespace sme::ingest
