#include "taskrelay/services/auth/refresh_coordinator.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace taskrelay;
using namespace std::chrono_literals;

namespace {

core::Credential make_credential(const std::string& token) {
    core::Credential credential;
    credential.access_token = token;
    return credential;
}

} // anonymous namespace

TEST(RefreshCoordinatorTest, ConcurrentCallersShareOneRefresh) {
    services::RefreshCoordinator coordinator;
    std::atomic<int> calls{0};
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();

    auto refresh_fn = [&]() -> services::RefreshCoordinator::RefreshOutcome {
        ++calls;
        gate_future.wait();
        return make_credential("fresh");
    };

    std::vector<std::future<services::RefreshCoordinator::RefreshOutcome>> callers;
    for (int i = 0; i < 6; ++i) {
        callers.push_back(std::async(std::launch::async, [&]() { return coordinator.with_mutex(refresh_fn); }));
    }

    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(coordinator.in_progress());
    gate.set_value();

    for (auto& caller : callers) {
        auto outcome = caller.get();
        ASSERT_TRUE(outcome);
        EXPECT_EQ(outcome->access_token, "fresh");
    }
    EXPECT_EQ(calls.load(), 1);
    EXPECT_FALSE(coordinator.in_progress());
}

TEST(RefreshCoordinatorTest, WaitersReceiveSameFailure) {
    services::RefreshCoordinator coordinator;
    std::atomic<int> calls{0};

    auto refresh_fn = [&]() -> services::RefreshCoordinator::RefreshOutcome {
        ++calls;
        std::this_thread::sleep_for(100ms);
        return std::unexpected(core::auth_error("Token refresh failed: 400"));
    };

    auto first = std::async(std::launch::async, [&]() { return coordinator.with_mutex(refresh_fn); });
    std::this_thread::sleep_for(20ms);
    auto second = std::async(std::launch::async, [&]() { return coordinator.with_mutex(refresh_fn); });

    auto a = first.get();
    auto b = second.get();
    ASSERT_FALSE(a);
    ASSERT_FALSE(b);
    EXPECT_EQ(a.error().message, b.error().message);
    EXPECT_EQ(calls.load(), 1);
}

TEST(RefreshCoordinatorTest, SlotClearsAfterSettling) {
    services::RefreshCoordinator coordinator;
    int calls = 0;

    auto refresh_fn = [&]() -> services::RefreshCoordinator::RefreshOutcome {
        ++calls;
        return make_credential("token-" + std::to_string(calls));
    };

    auto first = coordinator.with_mutex(refresh_fn);
    auto second = coordinator.with_mutex(refresh_fn);

    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first->access_token, "token-1");
    EXPECT_EQ(second->access_token, "token-2");
    EXPECT_FALSE(coordinator.in_progress());
}

TEST(RefreshCoordinatorTest, ThrowingRefreshBecomesAuthError) {
    services::RefreshCoordinator coordinator;

    auto outcome = coordinator.with_mutex([]() -> services::RefreshCoordinator::RefreshOutcome {
        throw std::runtime_error("disk full");
    });

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().kind, core::ErrorKind::Auth);
    EXPECT_EQ(outcome.error().message, "Credential refresh failed: disk full");
    EXPECT_FALSE(coordinator.in_progress());

    auto retry = coordinator.with_mutex([]() -> services::RefreshCoordinator::RefreshOutcome {
        return make_credential("ok");
    });
    EXPECT_TRUE(retry);
}

TEST(RefreshCoordinatorTest, NonStandardThrowFreesSlot) {
    services::RefreshCoordinator coordinator;

    auto outcome = coordinator.with_mutex([]() -> services::RefreshCoordinator::RefreshOutcome {
        throw 1;
    });

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().kind, core::ErrorKind::Auth);
    EXPECT_EQ(outcome.error().message, "Credential refresh failed: unknown exception");
    EXPECT_FALSE(coordinator.in_progress());

    auto retry = coordinator.with_mutex([]() -> services::RefreshCoordinator::RefreshOutcome {
        return make_credential("ok");
    });
    ASSERT_TRUE(retry);
    EXPECT_EQ(retry->access_token, "ok");
}

TEST(RefreshCoordinatorTest, InstanceIsShared) {
    EXPECT_EQ(&services::RefreshCoordinator::instance(), &services::RefreshCoordinator::instance());
}
