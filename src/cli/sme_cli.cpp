#include <sme/cli/command_registry.h>
#include <sme/cli/error_hints.h>
#include <sme/cli/sme_cli.h>
#include <sme/config/config_helpers.h>
#include <sme/core/format.h>
#include <sme/vector/rest_vector_store.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <iostream>

namespace sme::cli {

namespace fs = std::filesystem;

SmeCLI::SmeCLI() {
    // Finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("SME retrieval core: incremental ingestion and hybrid search",
                                      "sme-cli");
    app_->require_subcommand(1);

    app_->add_option("-c,--config", configPath_,
                     "Configuration file (default: $XDG_CONFIG_HOME/sme/config.toml)");
    app_->add_option("--log-level", logLevel_, "Log level: trace, debug, info, warn, error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");

    CommandRegistry::registerAllCommands(this);
}

SmeCLI::~SmeCLI() = default;

void SmeCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

void SmeCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

std::optional<spdlog::level::level_enum> SmeCLI::parseLogLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "off" || v == "none")
        return spdlog::level::off;
    return std::nullopt;
}

Result<void> SmeCLI::loadConfiguration() {
    const bool explicitPath = !configPath_.empty();
    const auto path = config::get_config_path(configPath_);

    auto loaded = config::SmeConfig::load(path, explicitPath);
    if (!loaded) {
        return loaded.error();
    }
    config_ = std::move(loaded).value();
    config_.applyEnvironment();

    // Precedence: --log-level > --verbose > env/config
    if (!logLevel_.empty()) {
        config_.logging.level = logLevel_;
    } else if (verbose_) {
        config_.logging.level = "debug";
    }
    return config_.validate();
}

void SmeCLI::configureLogging(const std::string& fileName) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::error_code ec;
    fs::create_directories(config_.logging.log_dir, ec);
    if (ec) {
        std::cerr << "Cannot create log directory " << config_.logging.log_dir << ": "
                  << ec.message() << "\n";
    } else {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                (config_.logging.log_dir / fileName).string(), false));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "File logging disabled: " << e.what() << "\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>("sme", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S [%l] %n: %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(parseLogLevel(config_.logging.level).value_or(spdlog::level::info));
    spdlog::flush_on(spdlog::level::info);
}

std::shared_ptr<net::IHttpClient> SmeCLI::getHttpClient() {
    if (!http_) {
        net::HttpClientConfig cfg;
        cfg.timeout = config_.vector_store.timeout;
        http_ = net::createHttpClient(cfg);
    }
    return http_;
}

std::shared_ptr<vector::DenseEncoder> SmeCLI::getDenseEncoder() {
    if (!encoder_) {
        auto http = getHttpClient();
        encoder_ = std::make_shared<vector::DenseEncoder>(
            config_.models.embedding,
            [http](const vector::EmbeddingModelConfig& model) {
                return vector::createEmbeddingProvider(model, http);
            });
    }
    return encoder_;
}

std::shared_ptr<vector::IVectorStore> SmeCLI::getVectorStore() {
    if (!store_) {
        vector::RestVectorStoreConfig cfg;
        cfg.index_name = config_.vector_store.index_name;
        cfg.api_key = config_.vector_store.api_key;
        cfg.control_url = config_.vector_store.control_url;
        cfg.cloud = config_.vector_store.cloud;
        cfg.region = config_.vector_store.region;
        store_ = std::make_shared<vector::RestVectorStore>(std::move(cfg), getHttpClient());
    }
    return store_;
}

std::shared_ptr<search::IReranker> SmeCLI::getReranker() {
    if (!reranker_ && !config_.models.reranker_endpoint.empty()) {
        search::HttpRerankerConfig cfg;
        cfg.model = config_.models.reranker;
        cfg.endpoint = config_.models.reranker_endpoint;
        cfg.batch_size = config_.models.reranker_batch_size;
        reranker_ = std::make_shared<search::HttpReranker>(std::move(cfg), getHttpClient());
    }
    return reranker_;
}

Result<std::unique_ptr<search::HybridRetriever>> SmeCLI::createRetriever() {
    search::RetrievalConfig cfg;
    cfg.search_level = config_.retrieval.search_level;
    cfg.pre_rerank_top_k = config_.retrieval.pre_rerank_top_k;
    cfg.final_top_k = config_.retrieval.final_top_k;
    return search::HybridRetriever::create(getDenseEncoder(), config_.ingest.sparse_model_path,
                                           getVectorStore(), getReranker(), cfg);
}

int SmeCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);

        if (!pendingCommand_) {
            std::cerr << app_->help() << "\n";
            return 1;
        }

        if (auto loaded = loadConfiguration(); !loaded) {
            std::cerr << "[FAIL] "
                      << formatErrorWithHint(loaded.error().code, loaded.error().message)
                      << "\n";
            return 1;
        }
        configureLogging(pendingCommand_->getName() + ".log");

        auto result = pendingCommand_->execute();
        if (!result) {
            spdlog::error("{} failed: {}", pendingCommand_->getName(), result.error().message);
            std::cerr << "[FAIL] "
                      << formatErrorWithHint(result.error().code, result.error().message,
                                             pendingCommand_->getName())
                      << "\n";
            return 1;
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace sme::cli
