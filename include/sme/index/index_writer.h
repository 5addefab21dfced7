#pragma once

#include <sme/core/types.h>
#include <sme/vector/vector_store.h>

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sme::index {

struct IndexWriterConfig {
    std::string metric = "dotproduct";
    size_t upsert_batch_size = 100;
};

struct DeleteReport {
    size_t requests = 0;                    // delete calls issued
    std::set<std::string> failed_doc_ids;   // failed in at least one namespace
};

/**
 * Writes chunk vectors to the external store.
 *
 * ensureIndex() must succeed before upsert(); it fixes the dimension every record is checked
 * against. A dimension or metric mismatch with an existing index is a configuration error,
 * never migrated.
 */
class IndexWriter {
public:
    explicit IndexWriter(std::shared_ptr<vector::IVectorStore> store, IndexWriterConfig config = {});

    Result<void> ensureIndex(size_t dimension);

    // Returns the number of records written
    Result<size_t> upsert(const std::vector<vector::VectorRecord>& records, const std::string& ns);

    DeleteReport deleteDocuments(const std::vector<std::string>& docIds,
                                 const std::vector<std::string>& namespaces);

    // Every character outside [A-Za-z0-9_-] becomes '_'
    static std::string namespaceFor(std::string_view model);

    std::optional<size_t> dimension() const;

    const IndexWriterConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<vector::IVectorStore> store_;
    IndexWriterConfig config_;
    mutable std::mutex mutex_;
    std::optional<size_t> dimension_;
};

} // namespace sme::index
