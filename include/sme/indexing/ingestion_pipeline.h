#pragma once

#include <sme/chunking/hierarchical_chunker.h>
#include <sme/core/types.h>
#include <sme/extraction/text_extractor.h>
#include <sme/index/index_writer.h>
#include <sme/manifest/ingest_manifest.h>
#include <sme/sparse/bm25_encoder.h>
#include <sme/vector/dense_encoder.h>
#include <sme/vector/vector_store.h>

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace sme::indexing {

struct IngestionOptions {
    std::filesystem::path docs_path = "./Docs";
    std::filesystem::path manifest_path = "logs/ingestion_manifest.json";
    std::filesystem::path sparse_model_path = "bm25_encoder.json";
    std::string subject = "General";
    std::vector<std::string> extensions{".txt", ".md"};
    chunking::HierarchicalChunkerConfig chunking;
    std::vector<std::string> models;
    index::IndexWriterConfig writer;
    bool parallel_namespaces = false;
    size_t worker_threads = 0; // 0 = one per model
};

struct IngestionReport {
    size_t new_files = 0;
    size_t modified_files = 0;
    size_t deleted_files = 0;
    size_t unchanged_files = 0;
    std::map<size_t, size_t, std::greater<size_t>> chunks_per_level; // processed files only
    size_t vectors_upserted = 0;
    size_t skipped_empty_sparse = 0;
    bool sparse_model_refit = false;
    std::vector<std::string> failed_paths;
    std::vector<std::string> failed_deletes;
};

/**
 * One run-to-completion ingestion.
 *
 * Order: scan and diff against the manifest, check model dimensions and the index, delete
 * vectors of modified and removed files, refit the sparse model over the whole corpus, encode
 * and upsert the chunks of new and modified files namespace by namespace, then commit the
 * manifest for the files that made it through. Per-file failures are reported and retried on
 * the next run; configuration and artifact errors abort before the manifest is touched.
 */
class IngestionPipeline {
public:
    IngestionPipeline(IngestionOptions options, std::shared_ptr<vector::DenseEncoder> encoder,
                      std::shared_ptr<vector::IVectorStore> store,
                      std::shared_ptr<extraction::TextExtractorRegistry> extractors = nullptr);

    Result<IngestionReport> run();

private:
    struct NamespaceOutcome {
        size_t upserted = 0;
        size_t skipped_empty = 0;
        std::set<std::string> failed_paths;
    };

    Result<void> preflight(index::IndexWriter& writer);

    NamespaceOutcome buildNamespace(const std::string& model, const chunking::ChunkLevels& levels,
                                    const sparse::BM25Encoder& bm25, index::IndexWriter& writer);

    std::vector<NamespaceOutcome> buildAll(const chunking::ChunkLevels& levels,
                                           const sparse::BM25Encoder& bm25,
                                           index::IndexWriter& writer);

    IngestionOptions options_;
    std::shared_ptr<vector::DenseEncoder> encoder_;
    std::shared_ptr<vector::IVectorStore> store_;
    std::shared_ptr<extraction::TextExtractorRegistry> extractors_;
};

} // namespace sme::indexing
