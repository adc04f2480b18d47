// awaitable.hpp uses std::exchange without including <utility> (Boost 1.74)
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>
#include <mediarepo/api/buffer_cache.h>

namespace mediarepo::api {

namespace {

size_t sweepExpired(BufferCache& cache, const BufferSweeper::Config& config,
                    BufferCache::Clock::time_point now) {
    size_t removed = cache.sweep(now, config.ttl);
    removed += cache.sweepOneShot(now, config.oneShotMaxAge);
    if (removed > 0) {
        spdlog::debug("[BufferSweeper] Removed {} expired buffers", removed);
    }
    return removed;
}

} // namespace

void BufferCache::put(const std::string& key, std::string mimeType, ByteVector bytes,
                      BufferMode mode, Clock::time_point now) {
    BufferEntry entry{std::move(mimeType), std::move(bytes), now, mode};
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert_or_assign(key, std::move(entry));
}

std::optional<BufferEntry> BufferCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (it->second.mode == BufferMode::OneShot) {
        BufferEntry entry = std::move(it->second);
        entries_.erase(it);
        return entry;
    }
    return it->second;
}

size_t BufferCache::eraseOlderThan(Clock::time_point now, std::chrono::milliseconds age,
                                   BufferMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::erase_if(entries_, [&](const auto& item) {
        const auto& entry = item.second;
        return entry.mode == mode && now - entry.created > age;
    });
}

size_t BufferCache::sweep(Clock::time_point now, std::chrono::milliseconds ttl) {
    return eraseOlderThan(now, ttl, BufferMode::Persistent);
}

size_t BufferCache::sweepOneShot(Clock::time_point now, std::chrono::milliseconds maxAge) {
    return eraseOlderThan(now, maxAge, BufferMode::OneShot);
}

size_t BufferCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool BufferCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(key) != entries_.end();
}

void BufferCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

BufferSweeper::BufferSweeper(std::shared_ptr<BufferCache> cache,
                             boost::asio::any_io_executor executor, Config config)
    : cache_(std::move(cache)), executor_(std::move(executor)), config_(config) {}

BufferSweeper::~BufferSweeper() {
    if (running_->load(std::memory_order_acquire)) {
        stop();
    }
}

size_t BufferSweeper::sweepNow(BufferCache::Clock::time_point now) {
    size_t removed = sweepExpired(*cache_, config_, now);
    sweeps_->fetch_add(1, std::memory_order_relaxed);
    return removed;
}

void BufferSweeper::start() {
    bool expected = false;
    if (!running_->compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::debug("[BufferSweeper] Already running, skipping start");
        return;
    }

    spdlog::info("[BufferSweeper] Starting (interval={}ms, ttl={}ms)", config_.interval.count(),
                 config_.ttl.count());

    timer_ = std::make_shared<boost::asio::steady_timer>(executor_);
    auto timer = timer_;
    auto running = running_;
    auto sweeps = sweeps_;
    auto cache = cache_;
    auto config = config_;

    boost::asio::co_spawn(
        executor_,
        [timer, running, sweeps, cache, config]() -> boost::asio::awaitable<void> {
            while (running->load(std::memory_order_acquire)) {
                timer->expires_after(config.interval);
                try {
                    co_await timer->async_wait(boost::asio::use_awaitable);
                } catch (const boost::system::system_error& e) {
                    if (e.code() == boost::asio::error::operation_aborted) {
                        break;
                    }
                    throw;
                }
                if (!running->load(std::memory_order_acquire)) {
                    break;
                }

                sweepExpired(*cache, config, BufferCache::Clock::now());
                sweeps->fetch_add(1, std::memory_order_relaxed);
            }

            spdlog::debug("[BufferSweeper] Sweep loop stopped");
            co_return;
        },
        boost::asio::detached);
}

void BufferSweeper::stop() {
    bool expected = true;
    if (!running_->compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        spdlog::debug("[BufferSweeper] Not running, skipping stop");
        return;
    }

    spdlog::info("[BufferSweeper] Stopping");
    if (auto timer = std::move(timer_)) {
        // Cancel on the timer's own executor; the loop may be waiting on it there
        boost::asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
    }
}

} // namespace mediarepo::api
