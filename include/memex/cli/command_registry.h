#pragma once

#include <memex/cli/command.h>
#include <memory>

namespace memex::cli {

class MemexCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(MemexCLI* cli);

    static std::unique_ptr<ICommand> createIndexCommand();
    static std::unique_ptr<ICommand> createSearchCommand();
    static std::unique_ptr<ICommand> createStatusCommand();
    static std::unique_ptr<ICommand> createContextCommand();
    static std::unique_ptr<ICommand> createRememberCommand();
    static std::unique_ptr<ICommand> createUpdateCommand();
    static std::unique_ptr<ICommand> createListCommand();
    static std::unique_ptr<ICommand> createDeleteCommand();

    /**
     * Create gc command (orphaned embeddings, vector index rebuild)
     */
    static std::unique_ptr<ICommand> createGcCommand();
};

} // namespace memex::cli
