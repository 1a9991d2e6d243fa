#include <spdlog/spdlog.h>
#include <iostream>
#include <memex/cli/command.h>
#include <memex/cli/memex_cli.h>
#include <memex/cli/result_renderer.h>
#include <memex/indexing/file_indexer.h>
#include <memex/knowledge/knowledge_store.h>

namespace memex::cli {

class SearchCommand : public ICommand {
public:
    std::string getName() const override { return "search"; }

    std::string getDescription() const override {
        return "Search indexed files, or stored knowledge with --type";
    }

    void registerCommand(CLI::App& app, MemexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("search", getDescription());
        cmd->add_option("query", query_, "Search query")->required();
        cmd->add_option("-n,--limit", limit_, "Maximum number of results")
            ->check(CLI::PositiveNumber);
        cmd->add_option("--path", pathFilter_, "Only files under this path prefix");
        cmd->add_option("--type", type_, "Search knowledge items: fact, goal or list_item")
            ->check(CLI::IsMember({"fact", "goal", "list_item", "shopping_item"}));
        cmd->add_option("--min-confidence", minConfidence_, "Confidence floor for knowledge")
            ->check(CLI::Range(0.0, 1.0));

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Search failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto ready = cli_->ensureInitialized(); !ready) {
            return ready;
        }

        if (!type_.empty()) {
            auto type = knowledge::parseEntityType(type_);
            if (!type) {
                return Error{ErrorCode::InvalidArgument, "Unknown type: " + type_};
            }
            auto items = cli_->knowledge().search(cli_->ownerId(), *type, query_, limit_,
                                                  minConfidence_);
            if (!items) {
                return items.error();
            }
            if (cli_->getJsonOutput()) {
                json arr = json::array();
                for (const auto& item : items.value()) {
                    arr.push_back(toJson(item));
                }
                std::cout << arr.dump(2) << "\n";
            } else {
                renderItems(std::cout, items.value());
            }
            return {};
        }

        std::optional<std::string> prefix;
        if (!pathFilter_.empty()) {
            prefix = pathFilter_;
        }
        auto hits = cli_->indexer().search(query_, limit_, prefix);
        if (!hits) {
            return hits.error();
        }
        if (cli_->getJsonOutput()) {
            json arr = json::array();
            for (const auto& hit : hits.value()) {
                arr.push_back(toJson(hit));
            }
            std::cout << arr.dump(2) << "\n";
        } else {
            renderFileHits(std::cout, hits.value());
        }
        return {};
    }

private:
    MemexCLI* cli_ = nullptr;
    std::string query_;
    size_t limit_ = 5;
    std::string pathFilter_;
    std::string type_;
    double minConfidence_ = 0.0;
};

std::unique_ptr<ICommand> createSearchCommand() {
    return std::make_unique<SearchCommand>();
}

} // namespace memex::cli
