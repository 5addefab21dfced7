#pragma once

#include <sme/extraction/text_extractor.h>

namespace sme::extraction {

/**
 * @brief Extractor for UTF-8 text and markdown files
 *
 * Strips a leading UTF-8 byte order mark. Content containing NUL bytes is treated as binary
 * and rejected with InvalidData.
 */
class PlainTextExtractor : public ITextExtractor {
public:
    Result<ExtractionResult> extract(const std::filesystem::path& path,
                                     const ExtractionConfig& config = {}) override;

    Result<ExtractionResult> extractFromBuffer(std::span<const std::byte> data,
                                               const ExtractionConfig& config = {}) override;

    std::vector<std::string> supportedExtensions() const override;

    std::string name() const override { return "Plain Text Extractor"; }

    static bool isBinary(std::span<const std::byte> data);
};

} // namespace sme::extraction
