#include <spdlog/spdlog.h>
#include <memex/metadata/migration.h>

namespace memex::metadata {

MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT,
            UNIQUE(version)
        )
    )");
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM migration_history WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return static_cast<int>(stmt.getInt64(0));
    }
    return 0;
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();
    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();
    const int targetVersion = getLatestVersion();
    if (currentVersion >= targetVersion) {
        spdlog::debug("Schema already at version {}", currentVersion);
        return {};
    }

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion) {
            continue;
        }
        spdlog::debug("Applying migration {} '{}'", version, migration.name);

        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            spdlog::error("Migration {} '{}' failed: {}", version, migration.name,
                          result.error().message);
            auto recorded = recordMigration(version, migration.name, duration, false,
                                            result.error().message);
            if (!recorded) {
                spdlog::warn("Could not record failed migration {}: {}", version,
                             recorded.error().message);
            }
            return result;
        }

        auto recordResult = recordMigration(version, migration.name, duration, true);
        if (!recordResult)
            return recordResult;
        currentVersion = version;
    }

    spdlog::debug("Migration complete. Now at version {}", currentVersion);
    return {};
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        if (migration.upFunc) {
            return migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            return db_.execute(migration.upSQL);
        }
        return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT OR REPLACE INTO migration_history "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();

    auto bindResult = stmt.bindAll(version, name, static_cast<int64_t>(seconds),
                                   static_cast<int64_t>(duration.count()), success ? 1 : 0, error);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

std::vector<Migration> MemexSchemaMigrations::getAllMigrations() {
    return {createInitialSchema(), createKnowledgeFts(), createLookupIndexes()};
}

Migration MemexSchemaMigrations::createInitialSchema() {
    Migration m;
    m.version = 1;
    m.name = "Create initial schema";
    m.upSQL = R"(
        CREATE TABLE knowledge (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            owner_id INTEGER NOT NULL,
            entity_type TEXT NOT NULL,
            content TEXT NOT NULL,
            metadata TEXT NOT NULL DEFAULT '{}',
            confidence REAL NOT NULL DEFAULT 1.0,
            embedding_id INTEGER,
            created_at TEXT NOT NULL DEFAULT (datetime('now')),
            updated_at TEXT NOT NULL DEFAULT (datetime('now')),
            last_referenced_at TEXT
        );

        CREATE TABLE embeddings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            owner_id INTEGER NOT NULL,
            source_type TEXT NOT NULL,
            source_id INTEGER NOT NULL,
            content_text TEXT NOT NULL,
            model_name TEXT NOT NULL,
            vector BLOB,
            created_at TEXT NOT NULL DEFAULT (datetime('now'))
        );

        CREATE TABLE file_chunks (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            path TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            content_text TEXT NOT NULL,
            embedding_id INTEGER,
            file_mtime REAL NOT NULL,
            indexed_at TEXT NOT NULL DEFAULT (datetime('now')),
            UNIQUE(path, chunk_index)
        );
    )";
    return m;
}

Migration MemexSchemaMigrations::createKnowledgeFts() {
    Migration m;
    m.version = 2;
    m.name = "Create knowledge FTS5 index";
    m.upFunc = [](Database& db) -> Result<void> {
        auto fts5Result = db.hasFTS5();
        if (!fts5Result)
            return fts5Result.error();

        if (!fts5Result.value()) {
            spdlog::warn("FTS5 not available, keyword search will return no results");
            return {};
        }

        return db.execute(R"(
            CREATE VIRTUAL TABLE knowledge_fts USING fts5(
                content,
                content='knowledge',
                content_rowid='id',
                tokenize='porter unicode61'
            );

            CREATE TRIGGER knowledge_fts_ai AFTER INSERT ON knowledge BEGIN
                INSERT INTO knowledge_fts(rowid, content) VALUES (new.id, new.content);
            END;

            CREATE TRIGGER knowledge_fts_ad AFTER DELETE ON knowledge BEGIN
                INSERT INTO knowledge_fts(knowledge_fts, rowid, content)
                VALUES ('delete', old.id, old.content);
            END;

            CREATE TRIGGER knowledge_fts_au AFTER UPDATE OF content ON knowledge BEGIN
                INSERT INTO knowledge_fts(knowledge_fts, rowid, content)
                VALUES ('delete', old.id, old.content);
                INSERT INTO knowledge_fts(rowid, content) VALUES (new.id, new.content);
            END;
        )");
    };
    return m;
}

Migration MemexSchemaMigrations::createLookupIndexes() {
    Migration m;
    m.version = 3;
    m.name = "Create lookup indexes";
    m.upSQL = R"(
        CREATE INDEX IF NOT EXISTS idx_knowledge_owner_type
            ON knowledge(owner_id, entity_type);
        CREATE INDEX IF NOT EXISTS idx_knowledge_embedding ON knowledge(embedding_id);
        CREATE INDEX IF NOT EXISTS idx_embeddings_owner_type
            ON embeddings(owner_id, source_type);
        CREATE INDEX IF NOT EXISTS idx_file_chunks_path ON file_chunks(path);
        CREATE INDEX IF NOT EXISTS idx_file_chunks_embedding ON file_chunks(embedding_id);
    )";
    return m;
}

Result<void> openAndMigrate(Database& db, const std::string& path) {
    auto openResult = db.open(path, path == ":memory:" ? ConnectionMode::Memory
                                                       : ConnectionMode::Create);
    if (!openResult)
        return openResult;

    if (path != ":memory:") {
        if (auto wal = db.enableWAL(); !wal) {
            spdlog::warn("Could not enable WAL on {}: {}", path, wal.error().message);
        }
    }
    if (auto fk = db.execute("PRAGMA foreign_keys=ON"); !fk)
        return fk;

    MigrationManager mm(db);
    if (auto init = mm.initialize(); !init)
        return init;
    mm.registerMigrations(MemexSchemaMigrations::getAllMigrations());
    return mm.migrate();
}

} // namespace memex::metadata
