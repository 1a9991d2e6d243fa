#pragma once

#include <memex/core/types.h>
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <cstddef>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace memex::metadata {

enum class ConnectionMode {
    Create,   ///< Read-write, creating the file when missing
    ReadOnly, ///< Fails when the file does not exist
    Memory    ///< Private in-memory database (tests, ":memory:")
};

/**
 * @brief Prepared statement, finalized on destruction
 *
 * Parameters are 1-based as in SQLite, columns 0-based. Text and blobs are
 * copied at bind time so temporaries are safe to pass.
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /// Binds NULL for an empty optional
    template <typename T> Result<void> bind(int index, const std::optional<T>& value) {
        return value ? bind(index, *value) : bind(index, nullptr);
    }

    /// Binds each argument to consecutive parameters starting at 1
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 1;
        Result<void> status;
        ((status = status ? bind(index++, std::forward<Args>(args)) : status), ...);
        return status;
    }

    /// Run to completion, ignoring any rows
    Result<void> execute();

    /// Advance one row; false once the result set is exhausted
    Result<bool> step();

    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    bool isNull(int column) const;

private:
    /// sqlite3_step with bounded backoff on SQLITE_BUSY / SQLITE_LOCKED,
    /// only until the first row has been returned
    int stepWithRetry();

    sqlite3_stmt* stmt_ = nullptr;
    bool started_ = false;
};

/**
 * @brief The store's single SQLite connection
 *
 * Every store in a process shares one connection, opened in serialized
 * mode. Multi-statement operations hold acquire() so writers on the
 * background pool cannot interleave with a read-modify-write.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::Create);
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /// One or more statements without parameters (DDL, PRAGMA)
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    /**
     * @brief Run func inside BEGIN/COMMIT; an error result or exception rolls back
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto guard = acquire();
        if (auto begun = beginTransaction(); !begun) {
            return begun;
        }
        try {
            auto result = func();
            if (!result) {
                rollbackQuietly();
                return result;
            }
            return commit();
        } catch (...) {
            rollbackQuietly();
            throw;
        }
    }

    [[nodiscard]] std::unique_lock<std::recursive_mutex> acquire() {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    int64_t lastInsertRowId() const;
    /// Rows touched by the most recent INSERT/UPDATE/DELETE
    int changes() const;

    Result<bool> tableExists(const std::string& table);
    /// Whether the linked SQLite was compiled with FTS5
    Result<bool> hasFTS5();
    Result<void> enableWAL();

    /// For extension registration (sqlite-vec)
    sqlite3* nativeHandle() const { return db_; }

    static std::string version();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    void rollbackQuietly() {
        if (auto rb = rollback(); !rb) {
            spdlog::warn("Rollback failed on {}: {}", path_, rb.error().message);
        }
    }

    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
    std::recursive_mutex mutex_;
};

} // namespace memex::metadata
