#include <spdlog/spdlog.h>
#include <mediarepo/metadata/connection_pool.h>

namespace mediarepo::metadata {

void PooledConnection::release() {
    if (pool_ && db_) {
        pool_->giveBack(std::move(db_));
    }
    pool_ = nullptr;
}

ConnectionPool::ConnectionPool(std::string dbPath, const ConnectionPoolConfig& config)
    : dbPath_(std::move(dbPath)), config_(config) {}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

Result<void> ConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    while (stats_.openConnections < config_.minConnections) {
        MEDIAREPO_TRY_UNWRAP(db, openConnection());
        idle_.push_back(std::move(db));
        ++stats_.openConnections;
    }

    spdlog::debug("Connection pool for {} initialized with {} connections", dbPath_,
                  stats_.openConnections);
    return {};
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
    stats_.openConnections -= idle_.size();
    idle_.clear();
    cv_.notify_all();
}

Result<void> ConnectionPool::drain(std::chrono::milliseconds timeout) {
    shutdown();

    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return stats_.activeConnections == 0; })) {
        spdlog::warn("Connection pool for {} drained with {} connections still active", dbPath_,
                     stats_.activeConnections);
        return Error{ErrorCode::Timeout,
                     fmt::format("{} connections still in use", stats_.activeConnections)};
    }
    spdlog::debug("Connection pool for {} drained", dbPath_);
    return {};
}

Result<PooledConnection> ConnectionPool::acquire() {
    return acquire(config_.acquireTimeout);
}

Result<PooledConnection> ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (shutdown_) {
            ++stats_.failedAcquisitions;
            return Error{ErrorCode::InvalidState, "Pool is shut down"};
        }

        if (!idle_.empty()) {
            auto db = std::move(idle_.back());
            idle_.pop_back();
            ++stats_.activeConnections;
            ++stats_.totalAcquired;
            return PooledConnection(this, std::move(db));
        }

        if (stats_.openConnections < config_.maxConnections) {
            // Reserve the slot, open outside the lock
            ++stats_.openConnections;
            lock.unlock();
            auto opened = openConnection();
            lock.lock();

            if (!opened) {
                --stats_.openConnections;
                ++stats_.failedAcquisitions;
                cv_.notify_one();
                return opened.error();
            }
            ++stats_.activeConnections;
            ++stats_.totalAcquired;
            return PooledConnection(this, std::move(opened).value());
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout && idle_.empty() &&
            !shutdown_ && stats_.openConnections >= config_.maxConnections) {
            ++stats_.failedAcquisitions;
            return Error{ErrorCode::ResourceExhausted,
                         fmt::format("No connection available within {}ms", timeout.count())};
        }
    }
}

ConnectionPool::Stats ConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats = stats_;
    stats.idleConnections = idle_.size();
    return stats;
}

Result<std::unique_ptr<Database>> ConnectionPool::openConnection() {
    auto db = std::make_unique<Database>();
    MEDIAREPO_TRY(db->open(dbPath_, ConnectionMode::Create));
    MEDIAREPO_TRY(db->setBusyTimeout(config_.busyTimeout));

    if (config_.enableWAL) {
        auto wal = db->enableWAL();
        if (!wal) {
            spdlog::warn("WAL not enabled for {}: {}", dbPath_, wal.error().message);
        }
    }
    MEDIAREPO_TRY(db->execute("PRAGMA foreign_keys = ON"));
    MEDIAREPO_TRY(db->execute("PRAGMA synchronous = NORMAL"));
    return db;
}

void ConnectionPool::giveBack(std::unique_ptr<Database> db) {
    // A connection must never go back into the pool with an open transaction
    bool reusable = db && db->isOpen();
    if (reusable && db->inTransaction()) {
        auto rb = db->rollback();
        if (!rb) {
            spdlog::warn("Discarding connection after failed rollback: {}", rb.error().message);
            reusable = false;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --stats_.activeConnections;
    if (shutdown_ || !reusable) {
        --stats_.openConnections;
    } else {
        idle_.push_back(std::move(db));
    }
    cv_.notify_all();
}

} // namespace mediarepo::metadata
