#pragma once

#include <memex/context/memory_injector.h>
#include <memex/core/types.h>
#include <memex/indexing/file_indexer.h>
#include <memex/knowledge/knowledge_store.h>
#include <memex/vector/vector_encoder.h>
#include <filesystem>
#include <string>

namespace memex::config {

/**
 * @brief Resolved runtime configuration.
 *
 * Precedence: built-in defaults, then config.toml, then environment
 * (MEMEX_DATA_DIR, MEMEX_DB_PATH, MEMEX_INDEX_PATHS, MEMEX_LOG_LEVEL,
 * MEMEX_EMBEDDING_BACKEND).
 *
 * Example config.toml:
 * @code
 * [core]
 * data_dir = "~/.local/share/memex"
 * log_level = "info"
 *
 * [embeddings]
 * backend = "onnx"
 * model_path = "~/.local/share/memex/models/all-MiniLM-L6-v2"
 *
 * [index]
 * paths = ["~/Projects", "~/notes"]
 * max_file_size = 512000
 * @endcode
 */
struct MemexConfig {
    std::filesystem::path configFile;
    std::filesystem::path dataDir;
    std::filesystem::path databasePath;
    std::string logLevel = "warn";

    vector::EncoderConfig encoder;
    /// Attach the sqlite-vec index when available
    bool vectorIndex = true;
    size_t embeddingThreads = 2;
    size_t backgroundThreads = 1;

    knowledge::KnowledgeStoreConfig knowledge;
    indexing::FileIndexerConfig indexer;
    context::InjectorConfig injector;

    /**
     * @brief Load defaults, the config file (if present) and environment overrides.
     * @param overridePath explicit config file; empty selects get_config_path()
     * @return InvalidArgument when a value cannot be parsed
     */
    static Result<MemexConfig> load(const std::string& overridePath = "");
};

Result<bool> parse_bool(const std::string& raw);

} // namespace memex::config
