#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace sme::chunking {

/**
 * Fixed-schema chunk metadata.
 *
 * Document-level fields (subject, source, file_path, doc_id, timestamp, doc_seq) are copied
 * from the document into top-level chunks and from each parent into its children.
 */
struct ChunkMetadata {
    std::string chunk_id;
    std::string parent_chunk_id; // empty at the coarsest level
    std::string parent_doc_id;
    size_t level_size = 0;
    size_t chunk_index = 0;  // position among the chunks split from the same parent
    size_t start_offset = 0; // relative to the text that was split

    std::string doc_id;
    std::string subject;
    std::string source;
    std::string file_path;
    std::string timestamp;
    size_t doc_seq = 0;
};

struct Chunk {
    std::string text;
    ChunkMetadata metadata;
};

// Level size -> chunks, largest level first
using ChunkLevels = std::map<size_t, std::vector<Chunk>, std::greater<size_t>>;

} // namespace sme::chunking
