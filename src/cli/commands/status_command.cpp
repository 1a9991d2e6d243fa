#include <spdlog/spdlog.h>
#include <iostream>
#include <memex/cli/command.h>
#include <memex/cli/memex_cli.h>
#include <memex/cli/result_renderer.h>
#include <memex/indexing/file_indexer.h>
#include <memex/knowledge/knowledge_store.h>
#include <memex/metadata/database.h>
#include <memex/vector/embedding_store.h>

namespace memex::cli {

class StatusCommand : public ICommand {
public:
    std::string getName() const override { return "status"; }

    std::string getDescription() const override {
        return "Show index, knowledge and embedding status";
    }

    void registerCommand(CLI::App& app, MemexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("status", getDescription());
        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Status failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto ready = cli_->ensureInitialized(); !ready) {
            return ready;
        }
        auto index = cli_->indexer().getStatus();
        if (!index) {
            return index.error();
        }

        const OwnerId owner = cli_->ownerId();
        auto& store = cli_->knowledge();
        json counts = json::object();
        for (auto type : {knowledge::EntityType::Fact, knowledge::EntityType::Goal,
                          knowledge::EntityType::ListItem}) {
            auto n = store.count(owner, type);
            if (!n) {
                return n.error();
            }
            counts[knowledge::entityTypeName(type)] = n.value();
        }

        auto& embeddings = cli_->embeddings();
        auto embedded = embeddings.count();
        if (!embedded) {
            return embedded.error();
        }

        if (cli_->getJsonOutput()) {
            json j;
            j["database"] = cli_->database().path();
            j["sqlite_version"] = metadata::Database::version();
            j["owner"] = owner;
            j["knowledge"] = counts;
            j["index"] = toJson(index.value());
            j["embeddings"] = {{"count", embedded.value()},
                               {"dimension", embeddings.dimension()},
                               {"vector_index", embeddings.indexName()},
                               {"encoder", embeddings.canEmbed()}};
            std::cout << j.dump(2) << "\n";
            return {};
        }

        const auto& s = index.value();
        std::cout << "== MEMEX STATUS ==\n";
        std::cout << "DB    : " << cli_->database().path() << " (sqlite "
                  << metadata::Database::version() << ")\n";
        std::cout << "OWNER : " << owner << "  facts=" << counts["fact"].get<int64_t>()
                  << " goals=" << counts["goal"].get<int64_t>()
                  << " list=" << counts["list_item"].get<int64_t>() << "\n";
        std::cout << "EMBED : " << embedded.value() << " rows, dim=" << embeddings.dimension()
                  << ", index=" << embeddings.indexName()
                  << (embeddings.canEmbed() ? "" : " (encoder unavailable)") << "\n";
        if (!s.enabled) {
            std::cout << "INDEX : disabled\n";
            return {};
        }
        std::cout << "INDEX : " << s.filesIndexed << " files, " << s.totalChunks << " chunks ("
                  << s.embeddedChunks << " embedded), last run "
                  << s.lastIndexedAt.value_or("never") << "\n";
        for (const auto& root : s.roots) {
            std::cout << "ROOT  : " << root.string() << "\n";
        }
        return {};
    }

private:
    MemexCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

} // namespace memex::cli
