#include <spdlog/spdlog.h>
#include <iostream>
#include <type_traits>
#include <variant>
#include <memex/cli/command.h>
#include <memex/cli/memex_cli.h>
#include <memex/knowledge/knowledge_store.h>

namespace memex::cli {

knowledge::KnowledgeMetadata metadataFromFlags(knowledge::EntityType type,
                                               const std::string& category,
                                               const std::string& description,
                                               const std::string& status,
                                               const std::string& list);

class UpdateCommand : public ICommand {
public:
    std::string getName() const override { return "update"; }

    std::string getDescription() const override {
        return "Change the content or metadata of a stored item";
    }

    void registerCommand(CLI::App& app, MemexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("update", getDescription());
        cmd->add_option("id", id_, "Item id")->required()->check(CLI::PositiveNumber);
        cmd->add_option("--content", content_, "New content (re-embeds the item)");
        cmd->add_option("--category", category_, "Fact category");
        cmd->add_option("--description", description_, "Goal description");
        cmd->add_option("--status", status_, "Goal status")
            ->check(CLI::IsMember({"active", "completed", "abandoned"}));
        cmd->add_option("--list", list_, "List name for list items");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Update failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto ready = cli_->ensureInitialized(); !ready) {
            return ready;
        }
        auto& store = cli_->knowledge();
        const OwnerId owner = cli_->ownerId();
        auto existing = store.get(owner, id_);
        if (!existing) {
            return existing.error();
        }
        if (!existing.value()) {
            return Error{ErrorCode::NotFound, "No item #" + std::to_string(id_)};
        }
        const auto& item = *existing.value();

        std::optional<knowledge::KnowledgeMetadata> meta;
        if (!category_.empty() || !description_.empty() || !status_.empty() || !list_.empty()) {
            auto fresh = metadataFromFlags(item.type, category_, description_, status_, list_);
            // Keep fields the caller did not mention
            auto merged = item.metadata;
            merged.typed = std::visit(
                [&](auto current) -> decltype(merged.typed) {
                    using T = decltype(current);
                    const auto& given = std::get<T>(fresh.typed);
                    if constexpr (std::is_same_v<T, knowledge::FactMetadata>) {
                        if (!category_.empty())
                            current.category = given.category;
                    } else if constexpr (std::is_same_v<T, knowledge::GoalMetadata>) {
                        if (!description_.empty())
                            current.description = given.description;
                        if (!status_.empty())
                            current.status = given.status;
                    } else {
                        if (!list_.empty())
                            current.list = given.list;
                    }
                    return current;
                },
                item.metadata.typed);
            meta = std::move(merged);
        }

        std::optional<std::string> content;
        if (!content_.empty()) {
            content = content_;
        }
        auto updated = store.update(owner, id_, content, meta);
        if (!updated) {
            return updated.error();
        }
        std::cout << (updated.value() ? "Updated #" : "Nothing changed for #") << id_ << "\n";
        store.waitForPendingEmbeddings();
        return {};
    }

private:
    MemexCLI* cli_ = nullptr;
    RowId id_ = 0;
    std::string content_;
    std::string category_;
    std::string description_;
    std::string status_;
    std::string list_;
};

std::unique_ptr<ICommand> createUpdateCommand() {
    return std::make_unique<UpdateCommand>();
}

} // namespace memex::cli
