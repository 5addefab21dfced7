#pragma once

#include <CLI/CLI.hpp>
#include <sme/cli/command.h>
#include <sme/config/sme_config.h>
#include <sme/net/http_client.h>
#include <sme/search/hybrid_retriever.h>
#include <sme/search/reranker.h>
#include <sme/vector/dense_encoder.h>
#include <sme/vector/vector_store.h>

#include <spdlog/common.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sme::cli {

/**
 * Main CLI application class.
 *
 * Commands mark themselves pending while CLI11 parses; run() then loads the configuration,
 * sets up logging and executes the pending command. Shared services are built on first use.
 */
class SmeCLI {
public:
    SmeCLI();
    ~SmeCLI();

    /**
     * Run the CLI with given arguments; returns the process exit code
     */
    int run(int argc, char* argv[]);

    void setPendingCommand(ICommand* cmd);

    const config::SmeConfig& config() const { return config_; }

    // Commands apply their flag overrides here before using any service
    config::SmeConfig& mutableConfig() { return config_; }

    bool getVerbose() const { return verbose_; }

    std::shared_ptr<net::IHttpClient> getHttpClient();

    std::shared_ptr<vector::DenseEncoder> getDenseEncoder();

    std::shared_ptr<vector::IVectorStore> getVectorStore();

    // nullptr when no relevance model endpoint is configured
    std::shared_ptr<search::IReranker> getReranker();

    Result<std::unique_ptr<search::HybridRetriever>> createRetriever();

    static std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& s);

private:
    void registerCommand(std::unique_ptr<ICommand> command);
    Result<void> loadConfiguration();
    void configureLogging(const std::string& fileName);

    friend class CommandRegistry;

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    std::string configPath_;
    std::string logLevel_;
    bool verbose_ = false;

    config::SmeConfig config_;

    std::shared_ptr<net::IHttpClient> http_;
    std::shared_ptr<vector::DenseEncoder> encoder_;
    std::shared_ptr<vector::IVectorStore> store_;
    std::shared_ptr<search::IReranker> reranker_;
};

} // namespace sme::cli
