#include <spdlog/spdlog.h>
#include <iostream>
#include <memex/cli/command.h>
#include <memex/cli/memex_cli.h>
#include <memex/knowledge/knowledge_store.h>

namespace memex::cli {

class DeleteCommand : public ICommand {
public:
    std::string getName() const override { return "forget"; }

    std::string getDescription() const override { return "Delete stored items by id"; }

    void registerCommand(CLI::App& app, MemexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("forget", getDescription());
        cmd->alias("rm");
        cmd->add_option("ids", ids_, "Item ids")->required()->check(CLI::PositiveNumber);

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Delete failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto ready = cli_->ensureInitialized(); !ready) {
            return ready;
        }
        size_t missing = 0;
        for (RowId id : ids_) {
            auto removed = cli_->knowledge().deleteItem(cli_->ownerId(), id);
            if (!removed) {
                return removed.error();
            }
            if (removed.value()) {
                std::cout << "Forgot #" << id << "\n";
            } else {
                std::cout << "No item #" << id << "\n";
                ++missing;
            }
        }
        if (missing == ids_.size()) {
            return Error{ErrorCode::NotFound, "None of the given ids exist"};
        }
        return {};
    }

private:
    MemexCLI* cli_ = nullptr;
    std::vector<RowId> ids_;
};

std::unique_ptr<ICommand> createDeleteCommand() {
    return std::make_unique<DeleteCommand>();
}

} // namespace memex::cli
