#include <memex/cli/command_registry.h>
#include <memex/cli/memex_cli.h>

namespace memex::cli {

// Factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createIndexCommand();
std::unique_ptr<ICommand> createSearchCommand();
std::unique_ptr<ICommand> createStatusCommand();
std::unique_ptr<ICommand> createContextCommand();
std::unique_ptr<ICommand> createRememberCommand();
std::unique_ptr<ICommand> createUpdateCommand();
std::unique_ptr<ICommand> createListCommand();
std::unique_ptr<ICommand> createDeleteCommand();
std::unique_ptr<ICommand> createGcCommand();

void CommandRegistry::registerAllCommands(MemexCLI* cli) {
    cli->registerCommand(CommandRegistry::createIndexCommand());
    cli->registerCommand(CommandRegistry::createSearchCommand());
    cli->registerCommand(CommandRegistry::createStatusCommand());
    cli->registerCommand(CommandRegistry::createContextCommand());
    cli->registerCommand(CommandRegistry::createRememberCommand());
    cli->registerCommand(CommandRegistry::createUpdateCommand());
    cli->registerCommand(CommandRegistry::createListCommand());
    cli->registerCommand(CommandRegistry::createDeleteCommand());
    cli->registerCommand(CommandRegistry::createGcCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createIndexCommand() {
    return ::memex::cli::createIndexCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createSearchCommand() {
    return ::memex::cli::createSearchCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createStatusCommand() {
    return ::memex::cli::createStatusCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createContextCommand() {
    return ::memex::cli::createContextCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createRememberCommand() {
    return ::memex::cli::createRememberCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createUpdateCommand() {
    return ::memex::cli::createUpdateCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createListCommand() {
    return ::memex::cli::createListCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createDeleteCommand() {
    return ::memex::cli::createDeleteCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createGcCommand() {
    return ::memex::cli::createGcCommand();
}

} // namespace memex::cli
