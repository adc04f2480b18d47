#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <mediarepo/api/connection_state.h>
#include "../../common/repository_fixture.h"

using namespace mediarepo;
using namespace mediarepo::api;
using namespace std::chrono_literals;

class ConnectionStateTest : public ::testing::Test {
protected:
    std::shared_ptr<RepositoryHandle> openHandle(const std::string& name) {
        auto root = dir_ / name;
        auto repo = Repository::open(tests::make_repository_config(root), renderer_);
        EXPECT_TRUE(repo.has_value());
        return std::make_shared<RepositoryHandle>(std::move(repo).value());
    }

    tests::TempDir dir_;
    std::shared_ptr<tests::FakeRenderer> renderer_ = std::make_shared<tests::FakeRenderer>();
};

TEST_F(ConnectionStateTest, DisconnectedCallsFail) {
    ConnectionState state;
    EXPECT_FALSE(state.isConnected());

    auto current = state.current();
    ASSERT_FALSE(current.has_value());
    EXPECT_EQ(current.error().code, ErrorCode::UpstreamDisconnected);

    auto files = state.with([](Repository& repo) { return repo.files(); });
    ASSERT_FALSE(files.has_value());
    EXPECT_EQ(files.error().code, ErrorCode::UpstreamDisconnected);
}

TEST_F(ConnectionStateTest, ReconnectClosesPreviousHandle) {
    ConnectionState state(1s);
    auto first = openHandle("first");
    auto second = openHandle("second");

    state.connect(first);
    ASSERT_TRUE(state.isConnected());
    ASSERT_TRUE(first->with([](Repository& repo) { return repo.files(); }).has_value());

    state.connect(second);
    EXPECT_TRUE(first->isClosed());
    EXPECT_FALSE(second->isClosed());

    auto stale = first->with([](Repository& repo) { return repo.files(); });
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().code, ErrorCode::UpstreamDisconnected);

    auto current = state.current();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current.value(), second);
}

TEST_F(ConnectionStateTest, ReconnectWaitsForInFlightCalls) {
    ConnectionState state(5s);
    auto first = openHandle("first");
    state.connect(first);

    std::promise<void> entered;
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();
    std::atomic<bool> callFinished{false};

    std::thread caller([&] {
        auto result = state.with([&](Repository& repo) {
            entered.set_value();
            releaseFuture.wait();
            auto files = repo.files();
            callFinished = true;
            return files;
        });
        EXPECT_TRUE(result.has_value());
    });
    entered.get_future().wait();
    EXPECT_EQ(first->inFlight(), 1u);

    std::thread releaser([&] {
        std::this_thread::sleep_for(50ms);
        release.set_value();
    });

    state.connect(openHandle("second"));
    EXPECT_TRUE(callFinished.load());
    EXPECT_EQ(first->inFlight(), 0u);

    caller.join();
    releaser.join();
}

TEST_F(ConnectionStateTest, DrainTimeoutDoesNotBlockNewHandle) {
    ConnectionState state(20ms);
    auto first = openHandle("first");
    state.connect(first);

    std::promise<void> entered;
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();
    std::thread caller([&] {
        auto result = first->with([&](Repository& repo) {
            entered.set_value();
            releaseFuture.wait();
            return repo.tags();
        });
        (void)result;
    });
    entered.get_future().wait();

    auto second = openHandle("second");
    state.connect(second);
    auto current = state.current();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current.value(), second);

    release.set_value();
    caller.join();
}

TEST_F(ConnectionStateTest, DisconnectDrainsAndClears) {
    ConnectionState state;
    auto handle = openHandle("only");
    state.connect(handle);

    ASSERT_TRUE(state.disconnect().has_value());
    EXPECT_FALSE(state.isConnected());
    EXPECT_TRUE(handle->isClosed());
    EXPECT_TRUE(handle->close(10ms).has_value());
}
