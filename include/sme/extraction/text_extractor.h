#pragma once

#include <sme/core/types.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace sme::extraction {

/**
 * @brief Result of text extraction from a document
 */
struct ExtractionResult {
    std::string text;                          // Extracted text content
    std::vector<std::string> segments;         // Separate logical documents, if the format has them
    std::map<std::string, std::string> metadata;
    std::vector<std::string> warnings;         // Non-fatal warnings
    std::string extractionMethod;              // Method used for extraction

    /**
     * @brief Logical documents yielded by this file: the segments, or the whole text
     */
    [[nodiscard]] std::vector<std::string> documents() const {
        if (!segments.empty()) {
            return segments;
        }
        return {text};
    }
};

/**
 * @brief Configuration for text extraction
 */
struct ExtractionConfig {
    size_t maxFileSize = 100 * 1024 * 1024; // 100MB default limit
};

/**
 * @brief Base interface for text extractors
 */
class ITextExtractor {
public:
    virtual ~ITextExtractor() = default;

    /**
     * @brief Extract text from a file
     * @return Extraction result, or an error when the file cannot be read or decoded
     */
    virtual Result<ExtractionResult> extract(const std::filesystem::path& path,
                                             const ExtractionConfig& config = {}) = 0;

    /**
     * @brief Extract text from memory buffer
     */
    virtual Result<ExtractionResult> extractFromBuffer(std::span<const std::byte> data,
                                                       const ExtractionConfig& config = {}) = 0;

    /**
     * @brief Supported file extensions, lower-case with the leading dot (".txt")
     */
    virtual std::vector<std::string> supportedExtensions() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Maps file extensions to extractors
 *
 * Not a process-wide singleton: the ingestion pipeline owns one and the embedding
 * application registers the formats it can handle.
 */
class TextExtractorRegistry {
public:
    // Registry with the built-in plain-text extractor
    static std::shared_ptr<TextExtractorRegistry> withDefaults();

    // Later registrations replace earlier ones for the same extension
    void registerExtractor(std::shared_ptr<ITextExtractor> extractor);

    std::shared_ptr<ITextExtractor> find(const std::string& extension) const;
    std::shared_ptr<ITextExtractor> findForFile(const std::filesystem::path& path) const;

    bool isSupported(const std::string& extension) const;
    std::vector<std::string> supportedExtensions() const;

    static std::string normalizeExtension(std::string extension);

private:
    std::map<std::string, std::shared_ptr<ITextExtractor>> extractors_;
    mutable std::mutex mutex_;
};

} // namespace sme::extraction
