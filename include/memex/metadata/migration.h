#pragma once

#include <memex/metadata/database.h>
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace memex::metadata {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;      ///< Migration version number
    std::string name; ///< Human-readable name
    std::string upSQL;

    /**
     * @brief Custom migration function (for capability-dependent migrations)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Database migration manager
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create history table)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    Result<int> getCurrentVersion();
    int getLatestVersion() const;
    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations in version order
     */
    Result<void> migrate();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);
    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");
};

/**
 * @brief Built-in migrations for the memex store schema
 */
class MemexSchemaMigrations {
public:
    static std::vector<Migration> getAllMigrations();

private:
    // Version 1: knowledge, embeddings, file_chunks
    static Migration createInitialSchema();
    // Version 2: knowledge_fts with sync triggers (skipped without FTS5)
    static Migration createKnowledgeFts();
    // Version 3: secondary indexes for owner/type scans and orphan sweeps
    static Migration createLookupIndexes();
};

/**
 * @brief Open (or create) a store database and bring its schema up to date
 */
Result<void> openAndMigrate(Database& db, const std::string& path);

} // namespace memex::metadata
