#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sme/cli/command.h>
#include <sme/cli/sme_cli.h>
#include <sme/search/retrieval_metrics.h>

#include <fstream>
#include <iomanip>
#include <iostream>

namespace sme::cli {

using json = nlohmann::json;

class EvalCommand : public ICommand {
public:
    std::string getName() const override { return "eval"; }

    std::string getDescription() const override {
        return "Measure Hit@k, MRR and nDCG@k of retrieval against keyword-graded queries";
    }

    void registerCommand(CLI::App& app, SmeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("eval", getDescription());
        cmd->add_option("-q,--queries", queriesPath_,
                        "JSON query set [{\"query\", \"expected_keywords\"}]");
        cmd->add_option("-m,--model", models_, "Model to evaluate (repeatable; default: all)");
        cmd->add_option("--level", levels_, "Chunk level to evaluate (repeatable)");
        cmd->add_option("-k", k_, "Cutoff for Hit@k and nDCG@k")->default_val(10);
        cmd->add_option("-o,--output", outputPath_, "Write per-query results as JSON");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        std::vector<search::EvalQuery> queries;
        if (queriesPath_.empty()) {
            queries = search::defaultEvalQueries();
        } else {
            auto loaded = search::loadEvalQueries(queriesPath_);
            if (!loaded) {
                return loaded.error();
            }
            queries = std::move(loaded).value();
        }

        auto& cfg = cli_->mutableConfig();
        const auto models = models_.empty() ? cfg.modelNames() : models_;
        const auto levels =
            levels_.empty() ? std::vector<size_t>{cfg.retrieval.search_level} : levels_;
        // Metrics are taken over the first k passages
        cfg.retrieval.final_top_k = k_;
        if (cfg.retrieval.pre_rerank_top_k < k_) {
            cfg.retrieval.pre_rerank_top_k = k_;
        }

        spdlog::info("Starting retrieval evaluation: {} queries, {} models, {} levels",
                     queries.size(), models.size(), levels.size());

        json results = json::array();
        std::cout << std::left << std::setw(32) << "model" << std::setw(8) << "level"
                  << std::setw(10) << "Hit" << std::setw(10) << "MRR" << "nDCG@" << k_ << "\n";
        for (const auto& level : levels) {
            cfg.retrieval.search_level = level;
            auto retriever = cli_->createRetriever();
            if (!retriever) {
                return retriever.error();
            }
            for (const auto& model : models) {
                spdlog::info("--- Evaluating: {} @ g{} ---", model, level);
                auto summary = search::evaluateRetrieval(*retriever.value(), model, queries, k_);
                if (!summary) {
                    return summary.error();
                }
                const auto& s = summary.value();
                std::cout << std::left << std::setw(32) << model << std::setw(8) << level
                          << std::fixed << std::setprecision(4) << std::setw(10) << s.hit_rate
                          << std::setw(10) << s.mrr << s.ndcg << "\n";

                for (const auto& q : s.queries) {
                    results.push_back({{"model", model},
                                       {"granularity", level},
                                       {"query", q.query},
                                       {"relevance", q.relevance},
                                       {"hit", q.hit},
                                       {"mrr", q.reciprocal_rank},
                                       {"ndcg", q.ndcg}});
                }
            }
        }

        if (!outputPath_.empty()) {
            std::ofstream out(outputPath_);
            if (!out) {
                return Error{ErrorCode::WriteError, "Cannot write " + outputPath_};
            }
            out << results.dump(2) << "\n";
            spdlog::info("Per-query results saved to {}", outputPath_);
        }
        return Result<void>();
    }

private:
    SmeCLI* cli_ = nullptr;
    std::string queriesPath_;
    std::vector<std::string> models_;
    std::vector<size_t> levels_;
    size_t k_ = 10;
    std::string outputPath_;
};

std::unique_ptr<ICommand> createEvalCommand() {
    return std::make_unique<EvalCommand>();
}

} // namespace sme::cli
