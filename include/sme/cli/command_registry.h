#pragma once

#include <sme/cli/command.h>

#include <memory>

namespace sme::cli {

class SmeCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(SmeCLI* cli);

    // Incremental ingestion of the document corpus
    static std::unique_ptr<ICommand> createIngestCommand();

    // Two-stage hybrid retrieval for one query
    static std::unique_ptr<ICommand> createSearchCommand();

    // Keyword-graded retrieval metrics over a query set
    static std::unique_ptr<ICommand> createEvalCommand();
};

} // namespace sme::cli
