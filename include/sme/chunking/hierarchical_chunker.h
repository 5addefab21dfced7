#pragma once

#include <sme/chunking/chunk.h>
#include <sme/chunking/recursive_text_splitter.h>
#include <sme/ingest/document_record.h>

#include <vector>

namespace sme::chunking {

struct HierarchicalChunkerConfig {
    std::vector<size_t> levels{2048, 512};
    double overlap_ratio = 0.1;
    size_t max_overlap = 220;
    std::vector<std::string> separators = defaultSeparators();
};

/**
 * Nested multi-granularity chunking.
 *
 * The coarsest level splits each document; every finer level splits each chunk of the level
 * above on its own text, so children never cross a parent boundary.
 */
class HierarchicalChunker {
public:
    explicit HierarchicalChunker(HierarchicalChunkerConfig config = {});

    // Every configured level is present in the result, possibly empty
    ChunkLevels chunk(const std::vector<ingest::DocumentRecord>& documents) const;

    // Distinct level sizes, largest first
    const std::vector<size_t>& levels() const noexcept { return levels_; }

    size_t overlapFor(size_t levelSize) const;

    // Identity of the text a top-level chunk is split from
    static std::string documentParentId(const ingest::DocumentRecord& doc);

private:
    std::vector<Chunk> chunkDocument(const ingest::DocumentRecord& doc,
                                     const RecursiveTextSplitter& splitter, size_t levelSize) const;

    std::vector<Chunk> chunkParent(const Chunk& parent, const RecursiveTextSplitter& splitter,
                                   size_t levelSize) const;

    HierarchicalChunkerConfig config_;
    std::vector<size_t> levels_;
};

} // namespace sme::chunking
