#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <mediarepo/metadata/database.h>

namespace mediarepo::metadata {

struct ConnectionPoolConfig {
    size_t minConnections = 1; ///< Opened by initialize()
    size_t maxConnections = 8;
    std::chrono::milliseconds busyTimeout{5000};
    std::chrono::milliseconds acquireTimeout{30000};
    bool enableWAL = true;
};

class ConnectionPool;

/**
 * @brief A leased connection; goes back to its pool when released or destroyed
 */
class PooledConnection {
public:
    PooledConnection() = default;
    PooledConnection(ConnectionPool* pool, std::unique_ptr<Database> db)
        : pool_(pool), db_(std::move(db)) {}
    ~PooledConnection() { release(); }

    PooledConnection(PooledConnection&& other) noexcept
        : pool_(std::exchange(other.pool_, nullptr)), db_(std::move(other.db_)) {}
    PooledConnection& operator=(PooledConnection&& other) noexcept {
        if (this != &other) {
            release();
            pool_ = std::exchange(other.pool_, nullptr);
            db_ = std::move(other.db_);
        }
        return *this;
    }
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database* operator->() { return db_.get(); }
    Database& operator*() { return *db_; }

    [[nodiscard]] bool isValid() const { return db_ != nullptr; }

    void release();

private:
    ConnectionPool* pool_ = nullptr;
    std::unique_ptr<Database> db_;
};

/**
 * @brief Bounded set of SQLite connections to one database file
 *
 * The pool is the shared handle to the relational store. drain() stops new acquisitions and
 * waits for the connections already leased to come back.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(std::string dbPath, const ConnectionPoolConfig& config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Result<void> initialize();

    /**
     * @brief Stop leasing and close idle connections; leased ones close when released
     */
    void shutdown();

    /**
     * @brief shutdown(), then wait up to timeout for every leased connection to come back
     */
    Result<void> drain(std::chrono::milliseconds timeout);

    Result<PooledConnection> acquire();
    Result<PooledConnection> acquire(std::chrono::milliseconds timeout);

    /**
     * @brief Run func with a leased connection; exceptions become DatabaseError
     */
    template <typename Func>
    auto withConnection(Func&& func) -> std::invoke_result_t<Func, Database&> {
        MEDIAREPO_TRY_UNWRAP(conn, acquire());
        try {
            return func(*conn);
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

    struct Stats {
        size_t openConnections = 0;
        size_t idleConnections = 0;
        size_t activeConnections = 0;
        size_t totalAcquired = 0;
        size_t failedAcquisitions = 0;
    };

    [[nodiscard]] Stats getStats() const;

    [[nodiscard]] bool isShutdown() const { return shutdown_.load(); }
    [[nodiscard]] const std::string& path() const { return dbPath_; }

private:
    friend class PooledConnection;

    std::string dbPath_;
    ConnectionPoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<Database>> idle_;
    Stats stats_;
    std::atomic<bool> shutdown_{false};

    Result<std::unique_ptr<Database>> openConnection();
    void giveBack(std::unique_ptr<Database> db);
};

} // namespace mediarepo::metadata
