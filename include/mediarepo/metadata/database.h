#pragma once

#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <mediarepo/core/types.h>

namespace mediarepo::metadata {

enum class ConnectionMode {
    ReadWrite, ///< Existing database only
    ReadOnly,
    Create ///< Create the file when missing (default)
};

/**
 * @brief Locking behaviour of BEGIN
 *
 * Deferred transactions take the write lock on the first write, which can fail with
 * SQLITE_BUSY without invoking the busy handler when another connection already holds it.
 * Transactions that read and then write use Immediate.
 */
enum class TransactionMode { Deferred, Immediate };

/**
 * @brief Prepared statement, finalized on destruction
 *
 * Constraint violations surface as ErrorCode::Conflict, every other SQLite failure as
 * ErrorCode::DatabaseError.
 */
class Statement {
public:
    Statement() = default;

    // 1-based parameter index
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    // NULL when empty
    Result<void> bind(int index, const std::optional<std::string>& value);
    Result<void> bind(int index, const std::optional<int64_t>& value);

    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 1;
        Result<void> result;
        auto bindNext = [&](auto&& value) {
            if (result) {
                result = bind(index++, std::forward<decltype(value)>(value));
            }
        };
        (bindNext(std::forward<Args>(args)), ...);
        return result;
    }

    /**
     * @brief Run to completion, for statements that return no rows
     */
    Result<void> execute();

    /**
     * @brief Advance to the next row
     * @return true while a row is available
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;
    std::optional<std::string> getOptionalString(int column) const;

    /**
     * @brief Rewind for another execution; bindings are kept until clearBindings()
     */
    Result<void> reset();
    Result<void> clearBindings();

private:
    friend class Database;

    struct Finalizer {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };

    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    Result<void> checkBind(int rc, int index) const;

    std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
};

/**
 * @brief One SQLite connection
 */
class Database {
public:
    Database() = default;
    ~Database() = default;

    Database(Database&& other) noexcept = default;
    Database& operator=(Database&& other) noexcept = default;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::Create);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(std::string_view sql);

    /**
     * @brief Run one or more statements that return no rows
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction(TransactionMode mode = TransactionMode::Deferred);
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Run func inside BEGIN/COMMIT; rolls back when it returns an error or throws
     */
    template <typename Func>
    Result<void> transaction(Func&& func, TransactionMode mode = TransactionMode::Deferred) {
        MEDIAREPO_TRY(beginTransaction(mode));

        try {
            Result<void> result = func();
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

    int64_t lastInsertRowId() const;
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    struct Closer {
        void operator()(sqlite3* db) const { sqlite3_close(db); }
    };

    std::unique_ptr<sqlite3, Closer> db_;
    std::string path_;
    bool inTransaction_ = false;

    void rollbackQuietly();
};

} // namespace mediarepo::metadata
