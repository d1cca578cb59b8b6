#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "kernel/session_tracker.hpp"

using namespace pocket::kernel;
using namespace std::chrono_literals;

TEST(SessionTracker, TrackStartsActive) {
    SessionTracker tracker;
    tracker.track("s1", "agentA");

    auto state = tracker.state("s1");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->alias, "agentA");
    EXPECT_EQ(state->status, SessionStatus::ACTIVE);
    EXPECT_FALSE(tracker.is_idle("s1"));
}

TEST(SessionTracker, TrackDoesNotOverrideExistingState) {
    SessionTracker tracker;
    tracker.track("s1", "agentA");
    tracker.mark_idle("s1");
    tracker.track("s1", "agentA");
    EXPECT_TRUE(tracker.is_idle("s1"));
}

TEST(SessionTracker, IdleActiveTransitions) {
    SessionTracker tracker;
    tracker.mark_idle("s1", "agentA");
    EXPECT_TRUE(tracker.is_idle("s1"));

    tracker.mark_active("s1");
    EXPECT_FALSE(tracker.is_idle("s1"));
    EXPECT_EQ(tracker.state("s1")->alias, "agentA");
}

TEST(SessionTracker, TryActivateOnlyFromIdle) {
    SessionTracker tracker;
    EXPECT_FALSE(tracker.try_activate("unknown"));

    tracker.track("s1", "agentA");
    EXPECT_FALSE(tracker.try_activate("s1"));

    tracker.mark_idle("s1");
    EXPECT_TRUE(tracker.try_activate("s1"));
    // Second caller loses the race
    EXPECT_FALSE(tracker.try_activate("s1"));
    EXPECT_FALSE(tracker.is_idle("s1"));
}

TEST(SessionTracker, WaitAllIdleReturnsWhenAllIdle) {
    SessionTracker tracker;
    tracker.track("a", "agentA");
    tracker.track("b", "agentB");

    std::thread worker([&]() {
        std::this_thread::sleep_for(20ms);
        tracker.mark_idle("a");
        std::this_thread::sleep_for(20ms);
        tracker.mark_idle("b");
    });

    auto busy = tracker.wait_all_idle({"a", "b"}, 5s, 10ms);
    worker.join();
    EXPECT_TRUE(busy.empty());
}

TEST(SessionTracker, WaitAllIdleTimesOut) {
    SessionTracker tracker;
    tracker.track("a", "agentA");
    tracker.mark_idle("b", "agentB");

    auto start = std::chrono::steady_clock::now();
    auto busy = tracker.wait_all_idle({"a", "b", "unknown"}, 50ms, 10ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(busy.size(), 2u);
    EXPECT_EQ(busy[0], "a");
    EXPECT_EQ(busy[1], "unknown");
    EXPECT_GE(elapsed, 50ms);
}

TEST(SessionTracker, ResetForgetsStates) {
    SessionTracker tracker;
    tracker.mark_idle("s1", "agentA");
    tracker.reset();
    EXPECT_EQ(tracker.size(), 0u);
    EXPECT_FALSE(tracker.state("s1").has_value());
}
