#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memex/cli/command.h>
#include <memex/cli/memex_cli.h>
#include <memex/cli/result_renderer.h>
#include <memex/config/config_helpers.h>
#include <memex/indexing/file_indexer.h>

namespace memex::cli {

namespace {

std::atomic<indexing::FileIndexer*> gActiveIndexer{nullptr};

extern "C" void onInterrupt(int) {
    if (auto* indexer = gActiveIndexer.load()) {
        indexer->requestStop();
    }
}

} // namespace

class IndexCommand : public ICommand {
public:
    std::string getName() const override { return "index"; }

    std::string getDescription() const override {
        return "Incrementally index text files under the configured roots";
    }

    void registerCommand(CLI::App& app, MemexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("index", getDescription());
        cmd->add_option("--file", file_, "Re-index a single file regardless of its mtime");
        cmd->add_option("--root", roots_, "Index these directories instead of the configured ones");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Index failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (!roots_.empty()) {
            // Roots are fixed when the indexer is built, so this must precede initialization
            auto& cfg = cli_->mutableConfig();
            cfg.indexer.roots.clear();
            for (const auto& r : roots_) {
                cfg.indexer.roots.push_back(config::expand_tilde(r));
            }
        }
        if (auto ready = cli_->ensureInitialized(); !ready) {
            return ready;
        }
        auto& indexer = cli_->indexer();

        if (!file_.empty()) {
            auto written = indexer.indexFile(config::expand_tilde(file_));
            if (!written) {
                return written.error();
            }
            if (cli_->getJsonOutput()) {
                std::cout << json{{"path", file_}, {"chunks", written.value()}}.dump(2) << "\n";
            } else {
                std::cout << file_ << ": " << written.value() << " chunks\n";
            }
            return {};
        }

        gActiveIndexer.store(&indexer);
        auto previous = std::signal(SIGINT, onInterrupt);
        auto stats = indexer.runIncremental();
        std::signal(SIGINT, previous);
        gActiveIndexer.store(nullptr);

        if (!stats) {
            return stats.error();
        }
        if (cli_->getJsonOutput()) {
            std::cout << toJson(stats.value()).dump(2) << "\n";
        } else {
            renderRunStats(std::cout, stats.value());
        }
        return {};
    }

private:
    MemexCLI* cli_ = nullptr;
    std::string file_;
    std::vector<std::string> roots_;
};

std::unique_ptr<ICommand> createIndexCommand() {
    return std::make_unique<IndexCommand>();
}

} // namespace memex::cli
