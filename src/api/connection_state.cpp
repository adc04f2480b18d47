#include <spdlog/spdlog.h>
#include <algorithm>
#include <mediarepo/api/connection_state.h>

namespace mediarepo::api {

RepositoryHandle::RepositoryHandle(std::unique_ptr<Repository> repository)
    : repository_(std::move(repository)) {}

RepositoryHandle::~RepositoryHandle() = default;

bool RepositoryHandle::enter() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closing_) {
        return false;
    }
    ++inFlight_;
    return true;
}

void RepositoryHandle::leave() {
    std::lock_guard<std::mutex> lock(mutex_);
    --inFlight_;
    if (inFlight_ == 0) {
        cv_.notify_all();
    }
}

Result<void> RepositoryHandle::close(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            return {};
        }
        closing_ = true;
        drained = cv_.wait_until(lock, deadline, [this] { return inFlight_ == 0; });
        closed_ = true;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    auto poolResult = repository_->close(std::max(remaining, std::chrono::milliseconds(0)));

    if (!drained) {
        return Error{ErrorCode::Timeout,
                     fmt::format("{} repository calls still running after {}ms", inFlight(),
                                 timeout.count())};
    }
    return poolResult;
}

bool RepositoryHandle::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closing_;
}

size_t RepositoryHandle::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_;
}

ConnectionState::ConnectionState(std::chrono::milliseconds drainTimeout)
    : drainTimeout_(drainTimeout) {}

ConnectionState::~ConnectionState() {
    if (auto result = disconnect(); !result) {
        spdlog::warn("Closing repository connection on shutdown: {}", result.error().message);
    }
}

void ConnectionState::connect(std::shared_ptr<RepositoryHandle> handle) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (handle_ && handle_ != handle) {
        if (auto result = handle_->close(drainTimeout_); !result) {
            spdlog::warn("Previous repository connection did not drain cleanly: {}",
                         result.error().message);
        }
    }
    handle_ = std::move(handle);
    spdlog::info("Repository connection {}", handle_ ? "established" : "cleared");
}

Result<void> ConnectionState::disconnect() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!handle_) {
        return {};
    }
    auto handle = std::move(handle_);
    handle_.reset();
    spdlog::info("Repository connection closed");
    return handle->close(drainTimeout_);
}

Result<std::shared_ptr<RepositoryHandle>> ConnectionState::current() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!handle_) {
        return Error{ErrorCode::UpstreamDisconnected, "No repository connected"};
    }
    return handle_;
}

bool ConnectionState::isConnected() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return handle_ != nullptr;
}

} // namespace mediarepo::api
