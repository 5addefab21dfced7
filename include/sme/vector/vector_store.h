#pragma once

#include <sme/core/types.h>
#include <sme/sparse/sparse_vector.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sme::vector {

// Metadata stored with every vector; fixed schema
struct VectorMetadata {
    std::string text;
    std::string source;
    std::string doc_id;
    size_t chunk_size = 0;
    size_t chunk_index = 0;
    std::string parent_chunk_id;
    std::string parent_doc_id;
    std::string subject;
    std::string file_path;

    bool operator==(const VectorMetadata& other) const = default;
};

struct VectorRecord {
    std::string id;
    std::vector<float> values;
    sparse::SparseVector sparse_values;
    VectorMetadata metadata;
};

using FilterValue = std::variant<std::string, int64_t>;

// Conjunction of equality conditions on metadata fields
struct MetadataFilter {
    std::map<std::string, FilterValue> equals;

    static MetadataFilter eq(std::string field, FilterValue value) {
        MetadataFilter f;
        f.equals.emplace(std::move(field), std::move(value));
        return f;
    }

    bool matches(const VectorMetadata& metadata) const;
};

struct QueryRequest {
    std::vector<float> dense;
    sparse::SparseVector sparse;
    MetadataFilter filter;
    size_t top_k = 10;
    std::string ns;
    bool include_metadata = true;
};

struct QueryMatch {
    std::string id;
    float score = 0.0f;
    VectorMetadata metadata;
};

struct IndexDescription {
    std::string name;
    size_t dimension = 0;
    std::string metric;
};

/**
 * External vector store contract.
 *
 * The store owns similarity search, hybrid dense+sparse scoring and metadata filtering.
 * Upserting an existing id overwrites it.
 */
class IVectorStore {
public:
    virtual ~IVectorStore() = default;

    // nullopt when the index does not exist
    virtual Result<std::optional<IndexDescription>> describeIndex() = 0;

    virtual Result<void> createIndex(size_t dimension, const std::string& metric) = 0;

    virtual Result<void> upsert(const std::vector<VectorRecord>& records,
                                const std::string& ns) = 0;

    virtual Result<std::vector<QueryMatch>> query(const QueryRequest& request) = 0;

    virtual Result<void> deleteByFilter(const MetadataFilter& filter, const std::string& ns) = 0;
};

} // namespace sme::vector
