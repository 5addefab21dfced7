#include <sme/chunking/recursive_text_splitter.h>

#include <spdlog/spdlog.h>

#include <cctype>

namespace sme::chunking {

namespace {

inline bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Length of the UTF-8 sequence starting at `i`, so "" never splits a code point
size_t codePointLength(std::string_view text, size_t i) {
    size_t n = 1;
    while (i + n < text.size() && (static_cast<unsigned char>(text[i + n]) & 0xC0) == 0x80) {
        ++n;
    }
    return n;
}

} // namespace

std::vector<std::string> defaultSeparators() {
    return {"\n\n", "\n", ". ", " ", ""};
}

RecursiveTextSplitter::RecursiveTextSplitter(SplitterConfig config) : config_(std::move(config)) {
    // Validate and fix invalid configuration
    if (config_.chunk_size == 0) {
        config_.chunk_size = 1;
    }
    if (config_.chunk_overlap >= config_.chunk_size) {
        spdlog::warn("Chunk overlap {} is not smaller than chunk size {}, clamping",
                     config_.chunk_overlap, config_.chunk_size);
        config_.chunk_overlap = config_.chunk_size - 1;
    }
    if (config_.separators.empty()) {
        config_.separators.emplace_back();
    }
}

std::vector<TextSpan> RecursiveTextSplitter::split(std::string_view text) const {
    std::vector<TextSpan> out;
    if (text.empty()) {
        return out;
    }
    splitRecursive(text, 0, text.size(), 0, out);
    return out;
}

std::vector<std::string> RecursiveTextSplitter::splitText(std::string_view text) const {
    std::vector<std::string> out;
    for (auto& span : split(text)) {
        out.push_back(std::move(span.text));
    }
    return out;
}

void RecursiveTextSplitter::splitRecursive(std::string_view root, size_t begin, size_t end,
                                           size_t firstSeparator,
                                           std::vector<TextSpan>& out) const {
    const auto& separators = config_.separators;
    std::string_view text = root.substr(begin, end - begin);

    // Pick the first separator present; "" always matches
    std::string separator = separators.back();
    size_t nextSeparator = separators.size();
    for (size_t i = firstSeparator; i < separators.size(); ++i) {
        if (separators[i].empty()) {
            separator.clear();
            nextSeparator = separators.size();
            break;
        }
        if (text.find(separators[i]) != std::string_view::npos) {
            separator = separators[i];
            nextSeparator = i + 1;
            break;
        }
    }

    auto pieces = splitOnSeparator(root, begin, end, separator);

    std::vector<Piece> good;
    for (const auto& piece : pieces) {
        if (piece.size() < config_.chunk_size) {
            good.push_back(piece);
            continue;
        }
        if (!good.empty()) {
            mergePieces(root, good, out);
            good.clear();
        }
        if (nextSeparator >= separators.size()) {
            emit(root, piece.begin, piece.end, out);
        } else {
            splitRecursive(root, piece.begin, piece.end, nextSeparator, out);
        }
    }
    if (!good.empty()) {
        mergePieces(root, good, out);
    }
}

std::vector<RecursiveTextSplitter::Piece>
RecursiveTextSplitter::splitOnSeparator(std::string_view root, size_t begin, size_t end,
                                        const std::string& separator) const {
    std::vector<Piece> pieces;
    std::string_view text = root.substr(begin, end - begin);

    if (separator.empty()) {
        for (size_t i = 0; i < text.size();) {
            size_t n = codePointLength(text, i);
            pieces.push_back({begin + i, begin + i + n});
            i += n;
        }
        return pieces;
    }

    // Separator kept at the start of the following piece
    size_t pieceStart = 0;
    size_t pos = text.find(separator);
    while (pos != std::string_view::npos) {
        if (pos > pieceStart) {
            pieces.push_back({begin + pieceStart, begin + pos});
        }
        pieceStart = pos;
        pos = text.find(separator, pos + separator.size());
    }
    if (text.size() > pieceStart) {
        pieces.push_back({begin + pieceStart, end});
    }
    return pieces;
}

void RecursiveTextSplitter::mergePieces(std::string_view root, const std::vector<Piece>& pieces,
                                        std::vector<TextSpan>& out) const {
    const size_t size = config_.chunk_size;
    const size_t overlap = config_.chunk_overlap;

    // Current window is pieces[first, i)
    size_t first = 0;
    size_t total = 0;
    for (size_t i = 0; i < pieces.size(); ++i) {
        const size_t len = pieces[i].size();
        if (total + len > size && i > first) {
            emit(root, pieces[first].begin, pieces[i - 1].end, out);
            while (first < i && (total > overlap || (total + len > size && total > 0))) {
                total -= pieces[first].size();
                ++first;
            }
        }
        total += len;
    }
    if (first < pieces.size()) {
        emit(root, pieces[first].begin, pieces.back().end, out);
    }
}

void RecursiveTextSplitter::emit(std::string_view root, size_t begin, size_t end,
                                 std::vector<TextSpan>& out) {
    while (begin < end && isSpace(root[begin])) {
        ++begin;
    }
    while (end > begin && isSpace(root[end - 1])) {
        --end;
    }
    if (begin == end) {
        return;
    }
    out.push_back({std::string(root.substr(begin, end - begin)), begin});
}

} // namespace sme::chunking
