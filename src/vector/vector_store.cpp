#include <sme/vector/vector_store.h>

namespace sme::vector {

namespace {

std::optional<FilterValue> fieldValue(const VectorMetadata& m, const std::string& field) {
    if (field == "doc_id")
        return m.doc_id;
    if (field == "source")
        return m.source;
    if (field == "subject")
        return m.subject;
    if (field == "file_path")
        return m.file_path;
    if (field == "parent_chunk_id")
        return m.parent_chunk_id;
    if (field == "parent_doc_id")
        return m.parent_doc_id;
    if (field == "text")
        return m.text;
    if (field == "chunk_size")
        return static_cast<int64_t>(m.chunk_size);
    if (field == "chunk_index")
        return static_cast<int64_t>(m.chunk_index);
    return std::nullopt;
}

} // namespace

bool MetadataFilter::matches(const VectorMetadata& metadata) const {
    for (const auto& [field, expected] : equals) {
        auto actual = fieldValue(metadata, field);
        if (!actual || *actual != expected) {
            return false;
        }
    }
    return true;
}

} // namespace sme::vector
