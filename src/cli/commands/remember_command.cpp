#include <spdlog/spdlog.h>
#include <iostream>
#include <memex/cli/command.h>
#include <memex/cli/memex_cli.h>
#include <memex/knowledge/knowledge_store.h>

namespace memex::cli {

/**
 * Build typed metadata from the shared --category/--description/--status/--list flags
 */
knowledge::KnowledgeMetadata metadataFromFlags(knowledge::EntityType type,
                                               const std::string& category,
                                               const std::string& description,
                                               const std::string& status,
                                               const std::string& list) {
    auto meta = knowledge::KnowledgeMetadata::defaultFor(type);
    if (auto* fact = std::get_if<knowledge::FactMetadata>(&meta.typed)) {
        if (!category.empty()) {
            fact->category = category;
        }
    } else if (auto* goal = std::get_if<knowledge::GoalMetadata>(&meta.typed)) {
        if (!description.empty()) {
            goal->description = description;
        }
        if (!status.empty()) {
            goal->status = status;
        }
    } else if (auto* item = std::get_if<knowledge::ListItemMetadata>(&meta.typed)) {
        if (!list.empty()) {
            item->list = list;
        }
    }
    return meta;
}

class RememberCommand : public ICommand {
public:
    std::string getName() const override { return "remember"; }

    std::string getDescription() const override {
        return "Store a fact, goal or list item";
    }

    void registerCommand(CLI::App& app, MemexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("remember", getDescription());
        cmd->alias("add");
        cmd->add_option("type", type_, "fact, goal or list_item")
            ->required()
            ->check(CLI::IsMember({"fact", "goal", "list_item", "shopping_item"}));
        cmd->add_option("content", content_, "Text to remember")->required();
        cmd->add_option("--category", category_, "Fact category (e.g. project, preference)");
        cmd->add_option("--description", description_, "Goal description");
        cmd->add_option("--list", list_, "List name for list items");
        cmd->add_option("--confidence", confidence_, "Confidence between 0 and 1")
            ->check(CLI::Range(0.0, 1.0));
        cmd->add_flag("--wait", wait_, "Wait for the embedding to be written before exiting");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Remember failed: {}", result.error().message);
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
        auto& store = cli_->knowledge();
        auto id = store.addItem(cli_->ownerId(), *type, content_,
                                metadataFromFlags(*type, category_, description_, "", list_),
                                confidence_);
        if (!id) {
            if (id.error().code == ErrorCode::AlreadyExists) {
                std::cout << "Already remembered\n";
                return {};
            }
            return id.error();
        }
        if (wait_) {
            store.waitForPendingEmbeddings();
        }
        std::cout << "Remembered #" << id.value() << "\n";
        return {};
    }

private:
    MemexCLI* cli_ = nullptr;
    std::string type_;
    std::string content_;
    std::string category_;
    std::string description_;
    std::string list_;
    double confidence_ = 1.0;
    bool wait_ = false;
};

std::unique_ptr<ICommand> createRememberCommand() {
    return std::make_unique<RememberCommand>();
}

} // namespace memex::cli
