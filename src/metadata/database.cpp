#include <spdlog/spdlog.h>
#include <chrono>
#include <cstring>
#include <thread>
#include <utility>
#include <memex/metadata/database.h>

namespace memex::metadata {

namespace {

constexpr int kMaxRetries = 5;
constexpr auto kInitialBackoff = std::chrono::milliseconds(10);
constexpr int kBusyTimeoutMs = 5000;

Result<void> bindStatus(int rc, const char* kind) {
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, std::string("Failed to bind ") + kind + ": " +
                                                   sqlite3_errstr(rc)};
    }
    return {};
}

ErrorCode codeFor(int rc) {
    switch (rc) {
        case SQLITE_FULL:
            return ErrorCode::StorageFull;
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return ErrorCode::CorruptedData;
        case SQLITE_READONLY:
        case SQLITE_PERM:
            return ErrorCode::PermissionDenied;
        default:
            return ErrorCode::DatabaseError;
    }
}

} // namespace

Statement::Statement(sqlite3* db, const std::string& sql) {
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : stmt_(std::exchange(other.stmt_, nullptr)), started_(std::exchange(other.started_, false)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
        started_ = std::exchange(other.started_, false);
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return bindStatus(sqlite3_bind_null(stmt_, index), "null");
}

Result<void> Statement::bind(int index, int value) {
    return bindStatus(sqlite3_bind_int(stmt_, index, value), "int");
}

Result<void> Statement::bind(int index, int64_t value) {
    return bindStatus(sqlite3_bind_int64(stmt_, index, value), "int64");
}

Result<void> Statement::bind(int index, double value) {
    return bindStatus(sqlite3_bind_double(stmt_, index, value), "double");
}

Result<void> Statement::bind(int index, const std::string& value) {
    return bind(index, std::string_view(value));
}

Result<void> Statement::bind(int index, std::string_view value) {
    return bindStatus(sqlite3_bind_text(stmt_, index, value.data(),
                                        static_cast<int>(value.size()), SQLITE_TRANSIENT),
                      "text");
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    return bindStatus(sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                                        SQLITE_TRANSIENT),
                      "blob");
}

int Statement::stepWithRetry() {
    auto backoff = kInitialBackoff;
    int rc = SQLITE_ERROR;
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            started_ = true;
            return rc;
        }
        // Resetting mid-result would replay rows already handed out
        if ((rc != SQLITE_BUSY && rc != SQLITE_LOCKED) || started_) {
            started_ = false;
            return rc;
        }
        sqlite3_reset(stmt_);
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
    return rc;
}

Result<void> Statement::execute() {
    int rc = stepWithRetry();
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
        return {};
    }
    std::string msg = "Failed to execute statement: " + std::string(sqlite3_errstr(rc));
    if (rc == SQLITE_CONSTRAINT) {
        if (const char* sql = sqlite3_sql(stmt_)) {
            std::string_view text(sql);
            msg += " [SQL: " + std::string(text.substr(0, 100)) +
                   (text.size() > 100 ? "...]" : "]");
        }
    }
    return Error{codeFor(rc), msg};
}

Result<bool> Statement::step() {
    int rc = stepWithRetry();
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return Error{codeFor(rc), "Failed to step statement: " + std::string(sqlite3_errstr(rc))};
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const void* blob = sqlite3_column_blob(stmt_, column);
    int size = sqlite3_column_bytes(stmt_, column);
    if (!blob || size <= 0) {
        return {};
    }
    std::vector<std::byte> out(static_cast<size_t>(size));
    std::memcpy(out.data(), blob, out.size());
    return out;
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Database::~Database() {
    close();
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    if (db_) {
        return Error{ErrorCode::InvalidState, "Database already open: " + path_};
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (mode == ConnectionMode::ReadOnly) {
        flags = SQLITE_OPEN_READONLY;
    } else if (mode == ConnectionMode::Memory) {
        flags |= SQLITE_OPEN_MEMORY;
    }
    // Connection is shared with the background embedding pool
    flags |= SQLITE_OPEN_FULLMUTEX;

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        return Error{rc == SQLITE_CANTOPEN ? ErrorCode::FileNotFound : codeFor(rc),
                     "Failed to open database " + path + ": " + error};
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    path_ = path;
    spdlog::debug("Opened database {} (sqlite {})", path, version());
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    try {
        return Statement(db_, sql);
    } catch (const std::exception& e) {
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        spdlog::debug("SQL exec failed ({}): {}", error, sql);
        return Error{codeFor(rc), "Failed to execute SQL: " + error};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    }
    auto begun = execute("BEGIN");
    inTransaction_ = static_cast<bool>(begun);
    return begun;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }
    auto done = execute("COMMIT");
    if (done) {
        inTransaction_ = false;
    }
    return done;
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }
    inTransaction_ = false;
    return execute("ROLLBACK");
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type IN ('table','view') AND name = ?");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bind(1, table); !b) {
        return b.error();
    }
    return s.step();
}

Result<bool> Database::hasFTS5() {
    return sqlite3_compileoption_used("ENABLE_FTS5") == 1;
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

std::string Database::version() {
    return sqlite3_libversion();
}

} // namespace memex::metadata
