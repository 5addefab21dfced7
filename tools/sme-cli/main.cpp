#include <spdlog/spdlog.h>
#include <sme/cli/sme_cli.h>

int main(int argc, char* argv[]) {
    try {
        // SmeCLI::run() replaces this once the configuration is loaded
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        sme::cli::SmeCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
