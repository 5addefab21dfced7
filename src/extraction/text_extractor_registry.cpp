#include <sme/extraction/plain_text_extractor.h>
#include <sme/extraction/text_extractor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace sme::extraction {

std::shared_ptr<TextExtractorRegistry> TextExtractorRegistry::withDefaults() {
    auto registry = std::make_shared<TextExtractorRegistry>();
    registry->registerExtractor(std::make_shared<PlainTextExtractor>());
    return registry;
}

std::string TextExtractorRegistry::normalizeExtension(std::string extension) {
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!extension.empty() && extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }
    return extension;
}

void TextExtractorRegistry::registerExtractor(std::shared_ptr<ITextExtractor> extractor) {
    if (!extractor) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& ext : extractor->supportedExtensions()) {
        auto key = normalizeExtension(ext);
        spdlog::debug("Registered {} for {}", extractor->name(), key);
        extractors_[key] = extractor;
    }
}

std::shared_ptr<ITextExtractor> TextExtractorRegistry::find(const std::string& extension) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = extractors_.find(normalizeExtension(extension));
    return it == extractors_.end() ? nullptr : it->second;
}

std::shared_ptr<ITextExtractor>
TextExtractorRegistry::findForFile(const std::filesystem::path& path) const {
    return find(path.extension().string());
}

bool TextExtractorRegistry::isSupported(const std::string& extension) const {
    return find(extension) != nullptr;
}

std::vector<std::string> TextExtractorRegistry::supportedExtensions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(extractors_.size());
    for (const auto& [ext, _] : extractors_) {
        out.push_back(ext);
    }
    return out;
}

} // namespace sme::extraction
