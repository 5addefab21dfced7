#include <sme/chunking/hierarchical_chunker.h>
#include <sme/chunking/text_normalizer.h>
#include <sme/core/format.h>
#include <sme/ingest/identity_assigner.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace sme::chunking {

HierarchicalChunker::HierarchicalChunker(HierarchicalChunkerConfig config)
    : config_(std::move(config)) {
    for (size_t level : config_.levels) {
        if (level > 0) {
            levels_.push_back(level);
        }
    }
    std::sort(levels_.begin(), levels_.end(), std::greater<size_t>());
    levels_.erase(std::unique(levels_.begin(), levels_.end()), levels_.end());
}

size_t HierarchicalChunker::overlapFor(size_t levelSize) const {
    double ratio = std::clamp(config_.overlap_ratio, 0.0, 1.0);
    auto scaled = static_cast<size_t>(std::floor(static_cast<double>(levelSize) * ratio));
    return std::min(scaled, config_.max_overlap);
}

std::string HierarchicalChunker::documentParentId(const ingest::DocumentRecord& doc) {
    // Files yielding several documents share a doc id; keep their chunk seeds apart
    if (doc.doc_seq == 0) {
        return doc.doc_id;
    }
    return sme::format("{}#{}", doc.doc_id, doc.doc_seq);
}

std::vector<Chunk> HierarchicalChunker::chunkDocument(const ingest::DocumentRecord& doc,
                                                      const RecursiveTextSplitter& splitter,
                                                      size_t levelSize) const {
    std::vector<Chunk> chunks;
    const auto parentId = documentParentId(doc);
    auto spans = splitter.split(doc.text);
    chunks.reserve(spans.size());

    for (size_t i = 0; i < spans.size(); ++i) {
        Chunk chunk;
        auto& md = chunk.metadata;
        md.doc_id = doc.doc_id;
        md.subject = doc.subject;
        md.source = doc.source;
        md.file_path = doc.file_path;
        md.timestamp = doc.timestamp;
        md.doc_seq = doc.doc_seq;

        md.parent_doc_id = doc.doc_id;
        md.parent_chunk_id.clear();
        md.level_size = levelSize;
        md.chunk_index = i;
        md.start_offset = spans[i].start_offset;
        md.chunk_id = ingest::IdentityAssigner::chunkId(parentId, levelSize, i,
                                                        spans[i].start_offset,
                                                        spans[i].text.size());
        chunk.text = std::move(spans[i].text);
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

std::vector<Chunk> HierarchicalChunker::chunkParent(const Chunk& parent,
                                                    const RecursiveTextSplitter& splitter,
                                                    size_t levelSize) const {
    std::vector<Chunk> children;
    auto spans = splitter.split(parent.text);
    children.reserve(spans.size());

    for (size_t i = 0; i < spans.size(); ++i) {
        // Inherit everything, then set the fields that belong to the child
        Chunk child;
        child.metadata = parent.metadata;
        auto& md = child.metadata;
        md.parent_chunk_id = parent.metadata.chunk_id;
        md.parent_doc_id = parent.metadata.parent_doc_id;
        md.level_size = levelSize;
        md.chunk_index = i;
        md.start_offset = spans[i].start_offset;
        md.chunk_id = ingest::IdentityAssigner::chunkId(parent.metadata.chunk_id, levelSize, i,
                                                        spans[i].start_offset,
                                                        spans[i].text.size());
        child.text = std::move(spans[i].text);
        children.push_back(std::move(child));
    }
    return children;
}

ChunkLevels HierarchicalChunker::chunk(const std::vector<ingest::DocumentRecord>& documents) const {
    ChunkLevels result;
    for (size_t level : levels_) {
        result[level];
    }
    if (levels_.empty()) {
        return result;
    }

    const std::vector<Chunk>* parents = nullptr;
    for (size_t li = 0; li < levels_.size(); ++li) {
        const size_t levelSize = levels_[li];
        RecursiveTextSplitter splitter(
            SplitterConfig{levelSize, overlapFor(levelSize), config_.separators});
        auto& out = result[levelSize];

        if (li == 0) {
            for (const auto& doc : documents) {
                if (isBlank(doc.text)) {
                    spdlog::warn("Skipping empty document {} ({})", doc.file_path, doc.doc_id);
                    continue;
                }
                auto chunks = chunkDocument(doc, splitter, levelSize);
                out.insert(out.end(), std::make_move_iterator(chunks.begin()),
                           std::make_move_iterator(chunks.end()));
            }
        } else {
            for (const auto& parent : *parents) {
                if (isBlank(parent.text)) {
                    spdlog::warn("Skipping empty parent chunk {}", parent.metadata.chunk_id);
                    continue;
                }
                auto children = chunkParent(parent, splitter, levelSize);
                out.insert(out.end(), std::make_move_iterator(children.begin()),
                           std::make_move_iterator(children.end()));
            }
        }

        spdlog::debug("Level {}: {} chunks (overlap {})", levelSize, out.size(),
                      overlapFor(levelSize));
        parents = &out;
    }
    return result;
}

} // namespace sme::chunking
