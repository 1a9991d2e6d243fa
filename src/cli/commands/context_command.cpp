#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memex/cli/command.h>
#include <memex/cli/memex_cli.h>
#include <memex/context/memory_injector.h>

namespace memex::cli {

class ContextCommand : public ICommand {
public:
    std::string getName() const override { return "context"; }

    std::string getDescription() const override {
        return "Print the memory block (or full system prompt) for a message";
    }

    void registerCommand(CLI::App& app, MemexCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("context", getDescription());
        cmd->add_option("message", message_, "The incoming message")->required();
        auto* base = cmd->add_option("--base", baseText_, "Base system text to prepend");
        cmd->add_option("--base-file", baseFile_, "Read the base system text from a file")
            ->check(CLI::ExistingFile)
            ->excludes(base);
        cmd->add_option("--min-confidence", minConfidence_, "Confidence floor")
            ->check(CLI::Range(0.0, 1.0));

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Context failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto ready = cli_->ensureInitialized(); !ready) {
            return ready;
        }
        if (!baseFile_.empty()) {
            std::ifstream in(baseFile_, std::ios::binary);
            if (!in) {
                return Error{ErrorCode::FileNotFound, "Cannot read " + baseFile_};
            }
            baseText_.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        auto& injector = cli_->injector();
        Result<std::string> text = (baseText_.empty() && baseFile_.empty())
                                       ? injector.buildContext(cli_->ownerId(), message_,
                                                               minConfidence_)
                                       : injector.buildSystemPrompt(cli_->ownerId(), message_,
                                                                    baseText_, minConfidence_);
        if (!text) {
            return text.error();
        }
        if (text.value().empty()) {
            std::cerr << "No relevant memory\n";
            return {};
        }
        std::cout << text.value() << "\n";
        return {};
    }

private:
    MemexCLI* cli_ = nullptr;
    std::string message_;
    std::string baseText_;
    std::string baseFile_;
    std::optional<double> minConfidence_;
};

std::unique_ptr<ICommand> createContextCommand() {
    return std::make_unique<ContextCommand>();
}

} // namespace memex::cli
