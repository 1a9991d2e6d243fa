#include <spdlog/spdlog.h>
#include <iostream>
#include <memex/cli/command.h>
#include <memex/cli/memex_cli.h>
#include <memex/cli/result_renderer.h>
#include <memex/knowledge/knowledge_store.h>

namespace memex::cli {

class ListCommand : public ICommand {
public:
    std::string getName() const override { return "list"; }

    std::string getDescription() const override { return "List recent items of one type"; }

    void registerCommand(CLI::App& app, MemexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("list", getDescription());
        cmd->alias("ls");
        cmd->add_option("type", type_, "fact, goal or list_item")
            ->check(CLI::IsMember({"fact", "goal", "list_item", "shopping_item"}));
        cmd->add_option("-n,--limit", limit_, "Maximum number of items")
            ->check(CLI::PositiveNumber);
        cmd->add_option("--min-confidence", minConfidence_, "Confidence floor")
            ->check(CLI::Range(0.0, 1.0));

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("List failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto ready = cli_->ensureInitialized(); !ready) {
            return ready;
        }
        auto type = knowledge::parseEntityType(type_);
        if (!type) {
            return Error{ErrorCode::InvalidArgument, "Unknown type: " + type_};
        }
        auto items = cli_->knowledge().getByType(cli_->ownerId(), *type, limit_, minConfidence_);
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

private:
    MemexCLI* cli_ = nullptr;
    std::string type_ = "fact";
    size_t limit_ = 20;
    double minConfidence_ = 0.0;
};

std::unique_ptr<ICommand> createListCommand() {
    return std::make_unique<ListCommand>();
}

} // namespace memex::cli
