#include <gtest/gtest.h>
#include "sync/SyncState.hpp"

using namespace sl::sync;

TEST(SyncStateTest, GuardHoldsRunningUntilDestroyed) {
    SyncState state;
    EXPECT_FALSE(state.isRunning());

    {
        auto guard = state.tryBegin("sync_project");
        ASSERT_TRUE(guard.has_value());
        EXPECT_TRUE(state.isRunning());
        EXPECT_EQ(state.currentOperation(), "sync_project");
        EXPECT_FALSE(state.tryBegin("upload_events").has_value());
    }

    EXPECT_FALSE(state.isRunning());
    EXPECT_EQ(state.currentOperation(), "");
    EXPECT_TRUE(state.tryBegin("upload_events").has_value());
}

TEST(SyncStateTest, ListenersSeeBothTransitions) {
    SyncState state;
    std::vector<std::pair<std::string, std::string>> seen;
    state.subscribe([&](const SyncState::Phase phase, const std::string& op) {
        seen.emplace_back(to_string(phase), op);
    });

    { auto guard = state.tryBegin("clean_storage"); }

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], std::make_pair(std::string("running"), std::string("clean_storage")));
    EXPECT_EQ(seen[1], std::make_pair(std::string("idle"), std::string("clean_storage")));
}

TEST(SyncStateTest, RejectedBeginDoesNotNotify) {
    SyncState state;
    auto guard = state.tryBegin("a");
    int calls = 0;
    state.subscribe([&](SyncState::Phase, const std::string&) { ++calls; });

    EXPECT_FALSE(state.tryBegin("b").has_value());
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(state.currentOperation(), "a");
}

TEST(SyncStateTest, MovedGuardReleasesOnce) {
    SyncState state;
    int idles = 0;
    state.subscribe([&](const SyncState::Phase p, const std::string&) { if (p == SyncState::Phase::Idle) ++idles; });

    {
        auto first = state.tryBegin("a");
        ASSERT_TRUE(first.has_value());
        auto moved = std::move(first);
        EXPECT_TRUE(state.isRunning());
    }

    EXPECT_EQ(idles, 1);
    EXPECT_FALSE(state.isRunning());
}

TEST(SyncStateTest, ThrowingListenerDoesNotEscapeGuard) {
    SyncState state;
    int calls = 0;
    state.subscribe([](SyncState::Phase, const std::string&) { throw std::runtime_error("listener broke"); });
    state.subscribe([&](SyncState::Phase, const std::string&) { ++calls; });

    EXPECT_NO_THROW({
        auto guard = state.tryBegin("sync all");
        EXPECT_TRUE(guard.has_value());
    });

    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(state.isRunning());
}
