#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <memex/cli/command_registry.h>
#include <memex/cli/memex_cli.h>
#include <memex/config/config_helpers.h>
#include <memex/context/memory_injector.h>
#include <memex/core/worker_pool.h>
#include <memex/indexing/file_indexer.h>
#include <memex/knowledge/knowledge_store.h>
#include <memex/metadata/database.h>
#include <memex/metadata/migration.h>
#include <memex/vector/embedding_store.h>
#include <memex/vector/vector_encoder.h>

namespace memex::cli {

namespace fs = std::filesystem;

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

bool applyLogLevelName(const std::string& name) {
    auto lvl = parseLevel(name);
    if (!lvl) {
        return false;
    }
    spdlog::set_level(*lvl);
    return true;
}

MemexCLI::MemexCLI() {
    // Conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("memex - personal memory and file retrieval", "memex");
    app_->require_subcommand(1);
    app_->add_option("--config", configPath_, "Path to config.toml");
    app_->add_option("--data-dir", dataDirOverride_, "Data directory (overrides config)");
    app_->add_option("--owner", owner_, "Owner id for knowledge commands")
        ->envname("MEMEX_OWNER")
        ->check(CLI::PositiveNumber);
    app_->add_flag("--json", jsonOutput_, "Output results as JSON");
    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");

    // Runs after all options are parsed and before any subcommand callback
    app_->parse_complete_callback([this]() {
        configStatus_ = loadConfig();
        applyLogLevel();
    });

    CommandRegistry::registerAllCommands(this);
}

MemexCLI::~MemexCLI() {
    // Tear down in dependency order; the knowledge store drains pending embeddings
    injector_.reset();
    indexer_.reset();
    knowledge_.reset();
    embeddings_.reset();
    encoder_.reset();
    database_.reset();
}

void MemexCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void MemexCLI::applyLogLevel() {
    // Precedence: env MEMEX_LOG_LEVEL > --verbose > config
    if (const char* envLvl = std::getenv("MEMEX_LOG_LEVEL"); envLvl && *envLvl) {
        if (applyLogLevelName(envLvl)) {
            return;
        }
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    if (!applyLogLevelName(config_.logLevel)) {
        spdlog::set_level(spdlog::level::warn);
    }
}

Result<void> MemexCLI::loadConfig() {
    auto loaded = config::MemexConfig::load(configPath_);
    if (!loaded) {
        return loaded.error();
    }
    config_ = std::move(loaded).value();
    if (!dataDirOverride_.empty()) {
        config_.dataDir = config::expand_tilde(dataDirOverride_);
        config_.databasePath = config_.dataDir / "memex.db";
    }
    return {};
}

Result<void> MemexCLI::ensureInitialized() {
    if (database_) {
        return {};
    }
    if (!configStatus_) {
        return configStatus_;
    }

    std::error_code ec;
    fs::create_directories(config_.databasePath.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied, "Cannot create " +
                                                      config_.databasePath.parent_path().string() +
                                                      ": " + ec.message()};
    }

    core::WorkerPool::configure(config_.embeddingThreads, config_.backgroundThreads);

    auto db = std::make_unique<metadata::Database>();
    if (auto opened = metadata::openAndMigrate(*db, config_.databasePath.string()); !opened) {
        return opened;
    }

    auto encoder = vector::sharedEncoder(config_.encoder);
    if (encoder) {
        encoder_ = encoder.value();
    } else {
        spdlog::warn("Embeddings disabled, falling back to keyword search: {}",
                     encoder.error().message);
    }

    if (config_.vectorIndex) {
        embeddings_ = vector::EmbeddingStore::create(*db, encoder_);
    } else {
        embeddings_ = std::make_unique<vector::EmbeddingStore>(*db, encoder_);
    }
    database_ = std::move(db);
    knowledge_ = std::make_unique<knowledge::KnowledgeStore>(
        *database_, embeddings_.get(), config_.knowledge, &core::WorkerPool::background());
    indexer_ = std::make_unique<indexing::FileIndexer>(*database_, embeddings_.get(),
                                                       config_.indexer);
    injector_ = std::make_unique<context::MemoryInjector>(*knowledge_, indexer_.get(),
                                                          config_.injector);
    spdlog::debug("Store ready at {} (vector index: {})", config_.databasePath.string(),
                  embeddings_->indexName());
    return {};
}

int MemexCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }
    // Commands run from their CLI11 callbacks during parse(); see registerCommand
    return 0;
}

} // namespace memex::cli
