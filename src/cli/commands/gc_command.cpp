#include <spdlog/spdlog.h>
#include <iostream>
#include <memex/cli/command.h>
#include <memex/cli/memex_cli.h>
#include <memex/cli/result_renderer.h>
#include <memex/vector/embedding_store.h>

namespace memex::cli {

class GcCommand : public ICommand {
public:
    std::string getName() const override { return "gc"; }

    std::string getDescription() const override {
        return "Delete orphaned embeddings and optionally rebuild the vector index";
    }

    void registerCommand(CLI::App& app, MemexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("gc", getDescription());
        cmd->add_option("--grace", graceSeconds_,
                        "Keep orphans younger than this many seconds")
            ->check(CLI::NonNegativeNumber);
        cmd->add_flag("--rebuild-index", rebuild_, "Repopulate the vector index afterwards");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("GC failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto ready = cli_->ensureInitialized(); !ready) {
            return ready;
        }
        auto& embeddings = cli_->embeddings();
        auto removed = embeddings.collectOrphans(graceSeconds_);
        if (!removed) {
            return removed.error();
        }
        json j{{"orphans_removed", removed.value()}};
        if (rebuild_) {
            auto written = embeddings.rebuildIndex();
            if (!written) {
                return written.error();
            }
            j["vectors_reindexed"] = written.value();
        }
        if (cli_->getJsonOutput()) {
            std::cout << j.dump(2) << "\n";
        } else {
            std::cout << "Removed " << removed.value() << " orphaned embeddings\n";
            if (rebuild_) {
                std::cout << "Re-indexed " << j["vectors_reindexed"].get<size_t>()
                          << " vectors into " << embeddings.indexName() << "\n";
            }
        }
        return {};
    }

private:
    MemexCLI* cli_ = nullptr;
    int64_t graceSeconds_ = 3600;
    bool rebuild_ = false;
};

std::unique_ptr<ICommand> createGcCommand() {
    return std::make_unique<GcCommand>();
}

} // namespace memex::cli
