#include <sme/config/sme_config.h>
#include <sme/core/format.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <set>

namespace sme::config {

namespace {

const std::vector<std::string> kDefaultModels{"all-mpnet-base-v2", "BAAI/bge-base-en-v1.5"};

Error invalidValue(const std::string& key, const std::string& raw) {
    return Error{ErrorCode::ConfigurationError,
                 sme::format("Invalid value for '{}': {}", key, raw)};
}

// Small reader that records the first malformed value it sees
class ValueReader {
public:
    explicit ValueReader(const ConfigValues& values) : values_(values) {}

    void string(const std::string& key, std::string& out) const {
        if (auto it = values_.find(key); it != values_.end()) {
            out = unquote(it->second);
        }
    }

    void path(const std::string& key, std::filesystem::path& out) const {
        if (auto it = values_.find(key); it != values_.end()) {
            out = expand_tilde(unquote(it->second));
        }
    }

    void size(const std::string& key, size_t& out) {
        if (auto it = values_.find(key); it != values_.end()) {
            if (!parse_size(it->second, out)) {
                fail(key, it->second);
            }
        }
    }

    void real(const std::string& key, double& out) {
        if (auto it = values_.find(key); it != values_.end()) {
            if (!parse_double(it->second, out)) {
                fail(key, it->second);
            }
        }
    }

    void boolean(const std::string& key, bool& out) {
        if (auto it = values_.find(key); it != values_.end()) {
            if (!parse_bool(it->second, out)) {
                fail(key, it->second);
            }
        }
    }

    void millis(const std::string& key, std::chrono::milliseconds& out) {
        size_t ms = 0;
        if (auto it = values_.find(key); it != values_.end()) {
            if (parse_size(it->second, ms)) {
                out = std::chrono::milliseconds(ms);
            } else {
                fail(key, it->second);
            }
        }
    }

    void strings(const std::string& key, std::vector<std::string>& out) const {
        if (auto it = values_.find(key); it != values_.end()) {
            out = parse_string_list(it->second);
        }
    }

    void sizes(const std::string& key, std::vector<size_t>& out) {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return;
        }
        std::vector<size_t> parsed;
        for (const auto& item : parse_string_list(it->second)) {
            size_t v = 0;
            if (!parse_size(item, v)) {
                fail(key, it->second);
                return;
            }
            parsed.push_back(v);
        }
        out = std::move(parsed);
    }

    bool has(const std::string& key) const { return values_.count(key) > 0; }

    const std::optional<Error>& error() const { return error_; }

private:
    void fail(const std::string& key, const std::string& raw) {
        if (!error_) {
            error_ = invalidValue(key, raw);
        }
    }

    const ConfigValues& values_;
    std::optional<Error> error_;
};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

SmeConfig SmeConfig::defaults() {
    SmeConfig cfg;
    for (const auto& name : kDefaultModels) {
        vector::EmbeddingModelConfig model;
        model.name = name;
        cfg.models.embedding.push_back(std::move(model));
    }
    cfg.retrieval.search_level =
        *std::max_element(cfg.ingest.chunk_sizes.begin(), cfg.ingest.chunk_sizes.end());
    cfg.retrieval.default_model = kDefaultModels.front();
    return cfg;
}

Result<SmeConfig> SmeConfig::fromValues(const ConfigValues& values) {
    SmeConfig cfg = defaults();
    ValueReader r(values);

    // [ingest]
    r.path("ingest.docs_path", cfg.ingest.docs_path);
    r.string("ingest.subject", cfg.ingest.subject);
    r.sizes("ingest.chunk_sizes", cfg.ingest.chunk_sizes);
    r.real("ingest.overlap_ratio", cfg.ingest.overlap_ratio);
    r.size("ingest.max_overlap", cfg.ingest.max_overlap);
    r.path("ingest.manifest_path", cfg.ingest.manifest_path);
    r.path("ingest.sparse_model_path", cfg.ingest.sparse_model_path);
    r.strings("ingest.extensions", cfg.ingest.extensions);
    r.size("ingest.upsert_batch_size", cfg.ingest.upsert_batch_size);
    r.boolean("ingest.parallel_namespaces", cfg.ingest.parallel_namespaces);
    r.size("ingest.worker_threads", cfg.ingest.worker_threads);

    // [models] shared defaults, then [model."<name>"] overrides
    std::vector<std::string> names = kDefaultModels;
    r.strings("models.embedding", names);
    vector::EmbeddingModelConfig shared;
    r.string("models.provider", shared.provider);
    r.string("models.endpoint", shared.endpoint);
    r.string("models.api_key", shared.api_key);
    r.size("models.dimension", shared.dimension);
    r.size("models.batch_size", shared.batch_size);
    r.boolean("models.normalize", shared.normalize);
    r.millis("models.timeout_ms", shared.timeout);

    cfg.models.embedding.clear();
    for (const auto& name : names) {
        vector::EmbeddingModelConfig model = shared;
        model.name = name;
        const std::string prefix = "model." + name + ".";
        r.string(prefix + "provider", model.provider);
        r.string(prefix + "endpoint", model.endpoint);
        r.string(prefix + "api_key", model.api_key);
        r.size(prefix + "dimension", model.dimension);
        r.size(prefix + "batch_size", model.batch_size);
        r.boolean(prefix + "normalize", model.normalize);
        r.millis(prefix + "timeout_ms", model.timeout);
        cfg.models.embedding.push_back(std::move(model));
    }
    r.string("models.reranker", cfg.models.reranker);
    r.string("models.reranker_endpoint", cfg.models.reranker_endpoint);
    r.size("models.reranker_batch_size", cfg.models.reranker_batch_size);

    // [vector_store]
    r.string("vector_store.index_name", cfg.vector_store.index_name);
    r.string("vector_store.api_key", cfg.vector_store.api_key);
    r.string("vector_store.control_url", cfg.vector_store.control_url);
    r.string("vector_store.cloud", cfg.vector_store.cloud);
    r.string("vector_store.region", cfg.vector_store.region);
    r.string("vector_store.metric", cfg.vector_store.metric);
    r.millis("vector_store.timeout_ms", cfg.vector_store.timeout);

    // [retrieval]; search level defaults to the coarsest configured level
    if (!cfg.ingest.chunk_sizes.empty()) {
        cfg.retrieval.search_level =
            *std::max_element(cfg.ingest.chunk_sizes.begin(), cfg.ingest.chunk_sizes.end());
    }
    r.size("retrieval.search_level", cfg.retrieval.search_level);
    r.size("retrieval.pre_rerank_top_k", cfg.retrieval.pre_rerank_top_k);
    r.size("retrieval.final_top_k", cfg.retrieval.final_top_k);
    cfg.retrieval.default_model = names.empty() ? std::string{} : names.front();
    r.string("retrieval.default_model", cfg.retrieval.default_model);

    // [logging]
    r.string("logging.level", cfg.logging.level);
    r.path("logging.log_dir", cfg.logging.log_dir);

    if (r.error()) {
        return *r.error();
    }
    return cfg;
}

Result<SmeConfig> SmeConfig::load(const std::filesystem::path& path, bool required) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (required) {
            return Error{ErrorCode::FileNotFound,
                         sme::format("Config file not found: {}", path.string())};
        }
        spdlog::debug("No config file at {}, using defaults", path.string());
        return defaults();
    }

    spdlog::debug("Loading config from {}", path.string());
    return fromValues(parse_config_file(path));
}

void SmeConfig::applyEnvironment() {
    if (const char* v = std::getenv("SME_DOCS_PATH"); v && *v) {
        ingest.docs_path = expand_tilde(v);
    }
    if (const char* v = std::getenv("SME_VECTOR_STORE_API_KEY"); v && *v) {
        vector_store.api_key = v;
    }
    if (const char* v = std::getenv("SME_VECTOR_STORE_URL"); v && *v) {
        vector_store.control_url = v;
    }
    if (const char* v = std::getenv("SME_INDEX_NAME"); v && *v) {
        vector_store.index_name = v;
    }
    if (const char* v = std::getenv("SME_LOG_LEVEL"); v && *v) {
        logging.level = toLower(v);
    }
}

Result<void> SmeConfig::validate() const {
    auto fail = [](std::string msg) { return Error{ErrorCode::ConfigurationError, std::move(msg)}; };

    if (ingest.chunk_sizes.empty()) {
        return fail("ingest.chunk_sizes must list at least one level");
    }
    if (std::find(ingest.chunk_sizes.begin(), ingest.chunk_sizes.end(), size_t{0}) !=
        ingest.chunk_sizes.end()) {
        return fail("ingest.chunk_sizes must be positive");
    }
    if (!(ingest.overlap_ratio >= 0.0 && ingest.overlap_ratio < 1.0)) {
        return fail(sme::format("ingest.overlap_ratio must be in [0, 1), got {}",
                                ingest.overlap_ratio));
    }
    if (ingest.upsert_batch_size == 0) {
        return fail("ingest.upsert_batch_size must be positive");
    }
    if (models.embedding.empty()) {
        return fail("models.embedding must name at least one model");
    }

    std::set<std::string> seen;
    for (const auto& model : models.embedding) {
        if (model.name.empty()) {
            return fail("embedding model name must not be empty");
        }
        if (!seen.insert(model.name).second) {
            return fail(sme::format("embedding model '{}' configured twice", model.name));
        }
        if (model.batch_size == 0) {
            return fail(sme::format("model '{}': batch_size must be positive", model.name));
        }
        if (model.dimension == 0) {
            return fail(sme::format("model '{}': dimension must be positive", model.name));
        }
        if (model.provider != "http" && model.provider != "hashing") {
            return fail(sme::format("model '{}': unknown provider '{}'", model.name,
                                    model.provider));
        }
    }
    if (models.reranker_batch_size == 0) {
        return fail("models.reranker_batch_size must be positive");
    }
    if (retrieval.final_top_k == 0 || retrieval.pre_rerank_top_k == 0) {
        return fail("retrieval top-k values must be positive");
    }
    if (retrieval.final_top_k > retrieval.pre_rerank_top_k) {
        return fail("retrieval.final_top_k must not exceed retrieval.pre_rerank_top_k");
    }

    static const std::set<std::string> kLevels{"trace", "debug", "info", "warn", "error", "off"};
    if (!kLevels.count(logging.level)) {
        return fail(sme::format("logging.level '{}' is not a known level", logging.level));
    }
    return Result<void>();
}

const vector::EmbeddingModelConfig* SmeConfig::findModel(const std::string& name) const {
    for (const auto& model : models.embedding) {
        if (model.name == name) {
            return &model;
        }
    }
    return nullptr;
}

std::vector<std::string> SmeConfig::modelNames() const {
    std::vector<std::string> names;
    names.reserve(models.embedding.size());
    for (const auto& model : models.embedding) {
        names.push_back(model.name);
    }
    return names;
}

} // namespace sme::config
