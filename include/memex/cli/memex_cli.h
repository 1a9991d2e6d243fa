#pragma once

#include <memex/cli/command.h>
#include <memex/config/memex_config.h>
#include <CLI/CLI.hpp>
#include <memory>
#include <string>
#include <vector>

namespace memex::metadata {
class Database;
}
namespace memex::vector {
class EmbeddingStore;
class VectorEncoder;
} // namespace memex::vector
namespace memex::knowledge {
class KnowledgeStore;
}
namespace memex::indexing {
class FileIndexer;
}
namespace memex::context {
class MemoryInjector;
}

namespace memex::cli {

/**
 * Main CLI application class
 *
 * Owns the store stack for the lifetime of one invocation. Commands call
 * ensureInitialized() before touching any accessor.
 */
class MemexCLI {
public:
    MemexCLI();
    ~MemexCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Open the database, build the encoder and wire the stores (lazy, once)
     */
    Result<void> ensureInitialized();

    void registerCommand(std::unique_ptr<ICommand> command);

    const config::MemexConfig& config() const { return config_; }
    /// Adjustable until ensureInitialized() has built the stores
    config::MemexConfig& mutableConfig() { return config_; }
    OwnerId ownerId() const { return owner_; }
    bool getJsonOutput() const { return jsonOutput_; }
    bool getVerbose() const { return verbose_; }

    metadata::Database& database() { return *database_; }
    vector::EmbeddingStore& embeddings() { return *embeddings_; }
    knowledge::KnowledgeStore& knowledge() { return *knowledge_; }
    indexing::FileIndexer& indexer() { return *indexer_; }
    context::MemoryInjector& injector() { return *injector_; }

private:
    Result<void> loadConfig();
    void applyLogLevel();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;

    std::string configPath_;
    std::string dataDirOverride_;
    OwnerId owner_ = 1;
    bool jsonOutput_ = false;
    bool verbose_ = false;
    config::MemexConfig config_;
    Result<void> configStatus_;

    std::unique_ptr<metadata::Database> database_;
    std::shared_ptr<vector::VectorEncoder> encoder_;
    std::unique_ptr<vector::EmbeddingStore> embeddings_;
    std::unique_ptr<knowledge::KnowledgeStore> knowledge_;
    std::unique_ptr<indexing::FileIndexer> indexer_;
    std::unique_ptr<context::MemoryInjector> injector_;
};

/**
 * Map a level name ("debug", "warn", ...) to spdlog; false when unrecognised.
 */
bool applyLogLevelName(const std::string& name);

} // namespace memex::cli
