#pragma once

#include <sme/config/config_helpers.h>
#include <sme/core/types.h>
#include <sme/vector/embedding_provider.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sme::config {

struct IngestSettings {
    std::filesystem::path docs_path = "./Docs";
    std::string subject = "General";
    std::vector<size_t> chunk_sizes{2048, 512};
    double overlap_ratio = 0.1;
    size_t max_overlap = 220;
    std::filesystem::path manifest_path = "logs/ingestion_manifest.json";
    std::filesystem::path sparse_model_path = "bm25_encoder.json";
    std::vector<std::string> extensions{".txt", ".md"};
    size_t upsert_batch_size = 100;
    bool parallel_namespaces = false;
    size_t worker_threads = 0; // 0 = one per model
};

struct ModelSettings {
    std::vector<vector::EmbeddingModelConfig> embedding;
    std::string reranker = "BAAI/bge-reranker-base";
    std::string reranker_endpoint; // empty = no relevance model
    size_t reranker_batch_size = 16;
};

struct VectorStoreSettings {
    std::string index_name = "sme-index";
    std::string api_key;
    std::string control_url = "https://api.pinecone.io";
    std::string cloud = "aws";
    std::string region = "us-east-1";
    std::string metric = "dotproduct";
    std::chrono::milliseconds timeout{30000};
};

struct RetrievalSettings {
    size_t search_level = 2048;
    size_t pre_rerank_top_k = 50;
    size_t final_top_k = 10;
    std::string default_model;
};

struct LoggingSettings {
    std::string level = "info";
    std::filesystem::path log_dir = "logs";
};

/**
 * Process configuration.
 *
 * Precedence: built-in defaults, then the config file, then environment variables
 * (SME_DOCS_PATH, SME_VECTOR_STORE_API_KEY, SME_VECTOR_STORE_URL, SME_INDEX_NAME,
 * SME_LOG_LEVEL). Command-line flags are applied on top by the CLI.
 */
struct SmeConfig {
    IngestSettings ingest;
    ModelSettings models;
    VectorStoreSettings vector_store;
    RetrievalSettings retrieval;
    LoggingSettings logging;

    static SmeConfig defaults();

    // Build from parsed key/values; unknown keys are ignored, malformed values are errors
    static Result<SmeConfig> fromValues(const ConfigValues& values);

    // Load a config file. A missing file yields defaults unless `required` is set.
    static Result<SmeConfig> load(const std::filesystem::path& path, bool required = false);

    void applyEnvironment();

    Result<void> validate() const;

    const vector::EmbeddingModelConfig* findModel(const std::string& name) const;
    std::vector<std::string> modelNames() const;
};

} // namespace sme::config
