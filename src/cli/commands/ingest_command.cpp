#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sme/cli/command.h>
#include <sme/cli/sme_cli.h>
#include <sme/indexing/ingestion_pipeline.h>

#include <iostream>

namespace sme::cli {

using json = nlohmann::json;

class IngestCommand : public ICommand {
public:
    std::string getName() const override { return "ingest"; }

    std::string getDescription() const override {
        return "Index new and modified documents and remove vectors of deleted ones";
    }

    void registerCommand(CLI::App& app, SmeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("ingest", getDescription());
        cmd->add_option("--docs", docsPath_, "Corpus directory (overrides ingest.docs_path)");
        cmd->add_option("--subject", subject_, "Subject label stored with every chunk");
        cmd->add_option("--chunk-sizes", chunkSizes_, "Chunk levels, coarsest first")
            ->delimiter(',');
        cmd->add_option("--model", models_, "Embedding model (repeatable; default: all configured)");
        cmd->add_flag("--parallel", parallel_, "Build model namespaces concurrently");
        cmd->add_flag("--json", jsonOutput_, "Print the run report as JSON");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto& cfg = cli_->mutableConfig();
        if (!docsPath_.empty())
            cfg.ingest.docs_path = docsPath_;
        if (!subject_.empty())
            cfg.ingest.subject = subject_;
        if (!chunkSizes_.empty())
            cfg.ingest.chunk_sizes = chunkSizes_;
        if (parallel_)
            cfg.ingest.parallel_namespaces = true;

        indexing::IngestionOptions options;
        options.docs_path = cfg.ingest.docs_path;
        options.manifest_path = cfg.ingest.manifest_path;
        options.sparse_model_path = cfg.ingest.sparse_model_path;
        options.subject = cfg.ingest.subject;
        options.extensions = cfg.ingest.extensions;
        options.chunking.levels = cfg.ingest.chunk_sizes;
        options.chunking.overlap_ratio = cfg.ingest.overlap_ratio;
        options.chunking.max_overlap = cfg.ingest.max_overlap;
        options.writer.metric = cfg.vector_store.metric;
        options.writer.upsert_batch_size = cfg.ingest.upsert_batch_size;
        options.parallel_namespaces = cfg.ingest.parallel_namespaces;
        options.worker_threads = cfg.ingest.worker_threads;
        options.models = models_.empty() ? cfg.modelNames() : models_;

        for (const auto& model : options.models) {
            if (!cfg.findModel(model)) {
                return Error{ErrorCode::ConfigurationError,
                             "Unknown embedding model: " + model};
            }
        }

        spdlog::info("Ingesting {} into index '{}' with {} model(s)",
                     options.docs_path.string(), cfg.vector_store.index_name,
                     options.models.size());

        indexing::IngestionPipeline pipeline(std::move(options), cli_->getDenseEncoder(),
                                             cli_->getVectorStore());
        auto report = pipeline.run();
        if (!report) {
            return report.error();
        }
        render(report.value());

        if (!report.value().failed_paths.empty() || !report.value().failed_deletes.empty()) {
            return Error{ErrorCode::InvalidData,
                         std::to_string(report.value().failed_paths.size() +
                                        report.value().failed_deletes.size()) +
                             " file(s) failed and will be retried on the next run"};
        }
        return Result<void>();
    }

private:
    void render(const indexing::IngestionReport& r) const {
        if (jsonOutput_) {
            json j;
            j["new"] = r.new_files;
            j["modified"] = r.modified_files;
            j["deleted"] = r.deleted_files;
            j["unchanged"] = r.unchanged_files;
            json levels = json::object();
            for (const auto& [size, count] : r.chunks_per_level) {
                levels[std::to_string(size)] = count;
            }
            j["chunks_per_level"] = levels;
            j["vectors_upserted"] = r.vectors_upserted;
            j["skipped_empty_sparse"] = r.skipped_empty_sparse;
            j["sparse_model_refit"] = r.sparse_model_refit;
            j["failed_paths"] = r.failed_paths;
            j["failed_deletes"] = r.failed_deletes;
            std::cout << j.dump(2) << "\n";
            return;
        }

        std::cout << "New: " << r.new_files << "  Modified: " << r.modified_files
                  << "  Deleted: " << r.deleted_files << "  Unchanged: " << r.unchanged_files
                  << "\n";
        for (const auto& [size, count] : r.chunks_per_level) {
            std::cout << "  level " << size << ": " << count << " chunks\n";
        }
        std::cout << "Vectors upserted: " << r.vectors_upserted << "\n";
        if (r.skipped_empty_sparse > 0) {
            std::cout << "Chunks skipped (no sparse terms): " << r.skipped_empty_sparse << "\n";
        }
        for (const auto& path : r.failed_paths) {
            std::cout << "  failed: " << path << "\n";
        }
        for (const auto& path : r.failed_deletes) {
            std::cout << "  delete failed: " << path << "\n";
        }
    }

    SmeCLI* cli_ = nullptr;
    std::string docsPath_;
    std::string subject_;
    std::vector<size_t> chunkSizes_;
    std::vector<std::string> models_;
    bool parallel_ = false;
    bool jsonOutput_ = false;
};

std::unique_ptr<ICommand> createIngestCommand() {
    return std::make_unique<IngestCommand>();
}

} // namespace sme::cli
