#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sme::chunking {

// Paragraph break, line break, sentence end, word boundary, character
std::vector<std::string> defaultSeparators();

struct SplitterConfig {
    size_t chunk_size = 2048;
    size_t chunk_overlap = 0;
    std::vector<std::string> separators = defaultSeparators();
};

// A chunk and the byte offset of its first character in the split text
struct TextSpan {
    std::string text;
    size_t start_offset = 0;
};

/**
 * Separator-cascade splitter.
 *
 * The first separator present in the text is used; each separator stays attached to the
 * start of the piece that follows it. Pieces shorter than chunk_size are merged greedily up to
 * chunk_size, and after each emitted chunk leading pieces are dropped until at most
 * chunk_overlap bytes remain. Longer pieces are split again with the remaining separators.
 * Emitted chunks are whitespace-trimmed, non-empty substrings of the input.
 */
class RecursiveTextSplitter {
public:
    explicit RecursiveTextSplitter(SplitterConfig config = {});

    std::vector<TextSpan> split(std::string_view text) const;

    std::vector<std::string> splitText(std::string_view text) const;

    const SplitterConfig& config() const noexcept { return config_; }

private:
    struct Piece {
        size_t begin;
        size_t end;
        size_t size() const noexcept { return end - begin; }
    };

    void splitRecursive(std::string_view root, size_t begin, size_t end, size_t firstSeparator,
                        std::vector<TextSpan>& out) const;

    std::vector<Piece> splitOnSeparator(std::string_view root, size_t begin, size_t end,
                                        const std::string& separator) const;

    void mergePieces(std::string_view root, const std::vector<Piece>& pieces,
                     std::vector<TextSpan>& out) const;

    static void emit(std::string_view root, size_t begin, size_t end, std::vector<TextSpan>& out);

    SplitterConfig config_;
};

} // namespace sme::chunking
