#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <mediarepo/core/types.h>

namespace mediarepo::api {

enum class BufferMode {
    OneShot,   ///< Removed by the first successful read
    Persistent ///< Kept until a sweep finds it older than the TTL
};

struct BufferEntry {
    std::string mimeType;
    ByteVector bytes;
    std::chrono::steady_clock::time_point created;
    BufferMode mode = BufferMode::OneShot;
};

/**
 * @brief Keyed transient payloads staged for a second fetch
 *
 * Thread-safe; the map lock is never held across I/O.
 */
class BufferCache {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Insert or overwrite the entry for key
     */
    void put(const std::string& key, std::string mimeType, ByteVector bytes, BufferMode mode,
             Clock::time_point now = Clock::now());

    /**
     * @brief Entry for key; a OneShot entry is removed by this read
     */
    std::optional<BufferEntry> get(const std::string& key);

    /**
     * @brief Remove Persistent entries older than ttl; OneShot entries are left alone
     * @return Number of entries removed
     */
    size_t sweep(Clock::time_point now, std::chrono::milliseconds ttl);

    /**
     * @brief Remove OneShot entries nobody fetched within maxAge
     */
    size_t sweepOneShot(Clock::time_point now, std::chrono::milliseconds maxAge);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool contains(const std::string& key) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, BufferEntry> entries_;

    size_t eraseOlderThan(Clock::time_point now, std::chrono::milliseconds age, BufferMode mode);
};

/**
 * @brief Periodic sweep of a BufferCache on an Asio executor
 */
class BufferSweeper {
public:
    struct Config {
        std::chrono::milliseconds interval{10000};
        std::chrono::milliseconds ttl{30000};
        std::chrono::milliseconds oneShotMaxAge{300000};
    };

    BufferSweeper(std::shared_ptr<BufferCache> cache, boost::asio::any_io_executor executor,
                  Config config);
    ~BufferSweeper();

    BufferSweeper(const BufferSweeper&) = delete;
    BufferSweeper& operator=(const BufferSweeper&) = delete;

    void start();
    void stop();

    /**
     * @brief One sweep pass over both modes
     */
    size_t sweepNow(BufferCache::Clock::time_point now = BufferCache::Clock::now());

    bool isRunning() const noexcept { return running_->load(std::memory_order_acquire); }
    uint64_t sweepCount() const noexcept { return sweeps_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<BufferCache> cache_;
    boost::asio::any_io_executor executor_;
    Config config_;
    std::shared_ptr<std::atomic<bool>> running_ = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<std::atomic<uint64_t>> sweeps_ = std::make_shared<std::atomic<uint64_t>>(0);
    std::shared_ptr<boost::asio::steady_timer> timer_;
};

} // namespace mediarepo::api
