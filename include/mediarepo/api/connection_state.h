#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <mediarepo/api/repository.h>
#include <mediarepo/core/types.h>

namespace mediarepo::api {

/**
 * @brief A live repository connection that counts the calls running through it
 *
 * Once close() begins, new calls fail with UpstreamDisconnected; close() waits for the
 * in-flight ones and then drains the connection pool.
 */
class RepositoryHandle {
public:
    explicit RepositoryHandle(std::unique_ptr<Repository> repository);
    ~RepositoryHandle();

    RepositoryHandle(const RepositoryHandle&) = delete;
    RepositoryHandle& operator=(const RepositoryHandle&) = delete;

    template <typename Func>
    auto with(Func&& func) -> std::invoke_result_t<Func, Repository&> {
        if (!enter()) {
            return Error{ErrorCode::UpstreamDisconnected, "Repository connection is closed"};
        }
        CallGuard guard(*this);
        return func(*repository_);
    }

    Result<void> close(std::chrono::milliseconds timeout);

    [[nodiscard]] bool isClosed() const;
    [[nodiscard]] size_t inFlight() const;

private:
    struct CallGuard {
        explicit CallGuard(RepositoryHandle& handle) : handle(handle) {}
        ~CallGuard() { handle.leave(); }
        RepositoryHandle& handle;
    };

    std::unique_ptr<Repository> repository_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t inFlight_ = 0;
    bool closing_ = false;
    bool closed_ = false;

    bool enter();
    void leave();
};

/**
 * @brief The currently active repository connection, if any
 *
 * connect() on a connected state drains the previous handle under the exclusive lock before
 * publishing the new one, so callers never see two live handles or an empty gap. Drain errors
 * are logged and do not keep the new handle from becoming active.
 */
class ConnectionState {
public:
    explicit ConnectionState(std::chrono::milliseconds drainTimeout = std::chrono::seconds(5));
    ~ConnectionState();

    ConnectionState(const ConnectionState&) = delete;
    ConnectionState& operator=(const ConnectionState&) = delete;

    void connect(std::shared_ptr<RepositoryHandle> handle);

    /**
     * @brief Drain and clear the active handle; the state is Disconnected afterwards even
     * when the drain reports an error
     */
    Result<void> disconnect();

    Result<std::shared_ptr<RepositoryHandle>> current() const;
    [[nodiscard]] bool isConnected() const;

    template <typename Func>
    auto with(Func&& func) -> std::invoke_result_t<Func, Repository&> {
        auto handle = current();
        if (!handle) {
            return handle.error();
        }
        return handle.value()->with(std::forward<Func>(func));
    }

private:
    std::chrono::milliseconds drainTimeout_;
    mutable std::shared_mutex mutex_;
    std::shared_ptr<RepositoryHandle> handle_;
};

} // namespace mediarepo::api
