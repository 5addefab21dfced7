#include <sme/core/format.h>
#include <sme/index/index_writer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace sme::index {

IndexWriter::IndexWriter(std::shared_ptr<vector::IVectorStore> store, IndexWriterConfig config)
    : store_(std::move(store)), config_(std::move(config)) {
    if (config_.upsert_batch_size == 0) {
        config_.upsert_batch_size = 100;
    }
}

std::string IndexWriter::namespaceFor(std::string_view model) {
    std::string ns(model);
    for (auto& c : ns) {
        auto u = static_cast<unsigned char>(c);
        if (!(std::isalnum(u) || c == '_' || c == '-') || u >= 0x80) {
            c = '_';
        }
    }
    return ns;
}

std::optional<size_t> IndexWriter::dimension() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dimension_;
}

Result<void> IndexWriter::ensureIndex(size_t dimension) {
    if (dimension == 0) {
        return Error{ErrorCode::ConfigurationError, "Index dimension must be positive"};
    }

    auto described = store_->describeIndex();
    if (!described) {
        return described.error();
    }

    const auto& existing = described.value();
    if (!existing) {
        spdlog::info("Creating index (dim {}, metric {})", dimension, config_.metric);
        if (auto created = store_->createIndex(dimension, config_.metric); !created) {
            return created.error();
        }
    } else {
        if (existing->dimension != dimension) {
            return Error{ErrorCode::ConfigurationError,
                         sme::format("Index '{}' has dimension {}, models produce {}",
                                     existing->name, existing->dimension, dimension)};
        }
        if (!existing->metric.empty() && existing->metric != config_.metric) {
            return Error{ErrorCode::ConfigurationError,
                         sme::format("Index '{}' uses metric '{}', hybrid search needs '{}'",
                                     existing->name, existing->metric, config_.metric)};
        }
        spdlog::debug("Index '{}' ready (dim {}, metric {})", existing->name, existing->dimension,
                      existing->metric);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    dimension_ = dimension;
    return Result<void>();
}

Result<size_t> IndexWriter::upsert(const std::vector<vector::VectorRecord>& records,
                                   const std::string& ns) {
    auto dim = dimension();
    if (!dim) {
        return Error{ErrorCode::InvalidState, "ensureIndex must succeed before upsert"};
    }
    for (const auto& record : records) {
        if (record.values.size() != *dim) {
            return Error{ErrorCode::ConfigurationError,
                         sme::format("Vector {} has {} dimensions, index expects {}", record.id,
                                     record.values.size(), *dim)};
        }
    }

    size_t written = 0;
    const size_t batchSize = config_.upsert_batch_size;
    for (size_t begin = 0; begin < records.size(); begin += batchSize) {
        size_t end = std::min(records.size(), begin + batchSize);
        std::vector<vector::VectorRecord> batch(records.begin() + static_cast<std::ptrdiff_t>(begin),
                                                records.begin() + static_cast<std::ptrdiff_t>(end));
        if (auto r = store_->upsert(batch, ns); !r) {
            return Error{r.error().code,
                         sme::format("Upsert to namespace '{}' failed after {} of {} records: {}",
                                     ns, written, records.size(), r.error().message)};
        }
        written += batch.size();
    }
    spdlog::debug("Upserted {} vectors into namespace '{}'", written, ns);
    return written;
}

DeleteReport IndexWriter::deleteDocuments(const std::vector<std::string>& docIds,
                                          const std::vector<std::string>& namespaces) {
    DeleteReport report;
    for (const auto& ns : namespaces) {
        for (const auto& docId : docIds) {
            ++report.requests;
            auto r = store_->deleteByFilter(vector::MetadataFilter::eq("doc_id", docId), ns);
            if (!r) {
                spdlog::error("Failed to delete vectors of {} in namespace '{}': {}", docId, ns,
                              r.error().message);
                report.failed_doc_ids.insert(docId);
            }
        }
    }
    if (!docIds.empty()) {
        spdlog::info("Deleted vectors of {} documents across {} namespaces ({} failed)",
                     docIds.size(), namespaces.size(), report.failed_doc_ids.size());
    }
    return report;
}

} // namespace sme::index
