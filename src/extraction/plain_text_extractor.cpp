#include <sme/core/format.h>
#include <sme/extraction/plain_text_extractor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace sme::extraction {

namespace {

constexpr unsigned char kBom[] = {0xEF, 0xBB, 0xBF};

} // namespace

Result<ExtractionResult> PlainTextExtractor::extract(const std::filesystem::path& path,
                                                     const ExtractionConfig& config) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "File does not exist: " + path.string()};
    }

    auto fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     sme::format("Cannot stat {}: {}", path.string(), ec.message())};
    }
    if (fileSize > config.maxFileSize) {
        return Error{ErrorCode::InvalidData,
                     sme::format("File too large: {} bytes ({})", fileSize, path.string())};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Error{ErrorCode::PermissionDenied, "Failed to open file: " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Error{ErrorCode::PermissionDenied, "Failed to read file: " + path.string()};
    }
    const std::string raw = buffer.str();

    auto result = extractFromBuffer(
        std::as_bytes(std::span(raw.data(), raw.size())), config);
    if (!result) {
        return Error{result.error().code,
                     sme::format("{}: {}", path.string(), result.error().message)};
    }

    ExtractionResult extracted = std::move(result).value();
    extracted.extractionMethod = "plain_text";
    extracted.metadata["filename"] = path.filename().string();
    extracted.metadata["extension"] = path.extension().string();
    spdlog::debug("Extracted {} characters from {}", extracted.text.size(), path.string());
    return extracted;
}

Result<ExtractionResult> PlainTextExtractor::extractFromBuffer(std::span<const std::byte> data,
                                                               const ExtractionConfig& config) {
    if (data.size() > config.maxFileSize) {
        return Error{ErrorCode::InvalidData, sme::format("Buffer too large: {} bytes", data.size())};
    }
    if (isBinary(data)) {
        return Error{ErrorCode::InvalidData, "Content appears to be binary"};
    }

    ExtractionResult result;
    result.extractionMethod = "plain_text_buffer";

    const auto* bytes = reinterpret_cast<const unsigned char*>(data.data());
    size_t offset = 0;
    if (data.size() >= 3 && std::equal(kBom, kBom + 3, bytes)) {
        offset = 3;
    }
    result.text.assign(reinterpret_cast<const char*>(bytes) + offset, data.size() - offset);
    return result;
}

std::vector<std::string> PlainTextExtractor::supportedExtensions() const {
    return {".txt", ".md"};
}

bool PlainTextExtractor::isBinary(std::span<const std::byte> data) {
    return std::find(data.begin(), data.end(), std::byte{0}) != data.end();
}

} // namespace sme::extraction
