#include <sme/cli/command_registry.h>
#include <sme/cli/sme_cli.h>

namespace sme::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createIngestCommand();
std::unique_ptr<ICommand> createSearchCommand();
std::unique_ptr<ICommand> createEvalCommand();

void CommandRegistry::registerAllCommands(SmeCLI* cli) {
    cli->registerCommand(CommandRegistry::createIngestCommand());
    cli->registerCommand(CommandRegistry::createSearchCommand());
    cli->registerCommand(CommandRegistry::createEvalCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createIngestCommand() {
    return ::sme::cli::createIngestCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createSearchCommand() {
    return ::sme::cli::createSearchCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createEvalCommand() {
    return ::sme::cli::createEvalCommand();
}

} // namespace sme::cli
