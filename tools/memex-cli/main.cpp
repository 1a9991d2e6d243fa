#include <spdlog/spdlog.h>
#include <memex/cli/memex_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; MemexCLI adjusts it from flags, env and config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        memex::cli::MemexCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
