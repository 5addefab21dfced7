#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sme/cli/command.h>
#include <sme/cli/sme_cli.h>

#include <iomanip>
#include <iostream>

namespace sme::cli {

using json = nlohmann::json;

class SearchCommand : public ICommand {
public:
    std::string getName() const override { return "search"; }

    std::string getDescription() const override {
        return "Hybrid dense and sparse retrieval with relevance reranking";
    }

    void registerCommand(CLI::App& app, SmeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("search", getDescription());
        cmd->add_option("query", query_, "Search query")->required();
        cmd->add_option("-m,--model", model_, "Embedding model (default: retrieval.default_model)");
        cmd->add_option("-k,--top-k", topK_, "Number of passages to return");
        cmd->add_option("--candidates", candidates_, "Candidates fetched before reranking");
        cmd->add_option("--level", level_, "Chunk level to search");
        cmd->add_flag("--no-rerank", noRerank_, "Return stage-1 order without reranking");
        cmd->add_flag("--json", jsonOutput_, "Output results as JSON");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto& cfg = cli_->mutableConfig();
        if (topK_ > 0)
            cfg.retrieval.final_top_k = topK_;
        if (candidates_ > 0)
            cfg.retrieval.pre_rerank_top_k = candidates_;
        if (level_ > 0)
            cfg.retrieval.search_level = level_;
        if (noRerank_)
            cfg.models.reranker_endpoint.clear();

        std::string model = model_.empty() ? cfg.retrieval.default_model : model_;
        if (model.empty() && !cfg.models.embedding.empty()) {
            model = cfg.models.embedding.front().name;
        }

        auto retriever = cli_->createRetriever();
        if (!retriever) {
            return retriever.error();
        }

        auto passages = retriever.value()->searchAndRerank(query_, model);
        if (!passages) {
            return passages.error();
        }
        spdlog::debug("Query '{}' returned {} passages", query_, passages.value().size());

        if (jsonOutput_) {
            json out = json::array();
            for (const auto& p : passages.value()) {
                json j{{"id", p.id},
                       {"text", p.text},
                       {"source", p.source},
                       {"doc_id", p.doc_id},
                       {"parent_chunk_id", p.parent_chunk_id},
                       {"file_path", p.file_path},
                       {"subject", p.subject},
                       {"chunk_size", p.chunk_size},
                       {"chunk_index", p.chunk_index},
                       {"hybrid_score", p.hybrid_score}};
                if (p.rerank_score) {
                    j["rerank_score"] = *p.rerank_score;
                }
                out.push_back(std::move(j));
            }
            std::cout << out.dump(2) << "\n";
            return Result<void>();
        }

        if (passages.value().empty()) {
            std::cout << "No results\n";
            return Result<void>();
        }
        size_t rank = 1;
        for (const auto& p : passages.value()) {
            std::cout << rank++ << ". " << p.source << " [" << p.id << "]";
            if (p.rerank_score) {
                std::cout << " rerank=" << std::fixed << std::setprecision(4) << *p.rerank_score;
            }
            std::cout << " hybrid=" << std::fixed << std::setprecision(4) << p.hybrid_score
                      << "\n";
            auto preview = p.text.substr(0, 200);
            for (auto& c : preview) {
                if (c == '\n')
                    c = ' ';
            }
            std::cout << "   " << preview << (p.text.size() > 200 ? "..." : "") << "\n";
        }
        return Result<void>();
    }

private:
    SmeCLI* cli_ = nullptr;
    std::string query_;
    std::string model_;
    size_t topK_ = 0;
    size_t candidates_ = 0;
    size_t level_ = 0;
    bool noRerank_ = false;
    bool jsonOutput_ = false;
};

std::unique_ptr<ICommand> createSearchCommand() {
    return std::make_unique<SearchCommand>();
}

} // namespace sme::cli
