#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "kernel/mailbox.hpp"
#include "kernel/parent_cache.hpp"
#include "kernel/reaper.hpp"

using namespace pocket::kernel;
using namespace std::chrono_literals;

TEST(ParentCache, HitMissAndExpiry) {
    ParentCache cache(5min, 1min);
    auto now = Clock::now();

    EXPECT_FALSE(cache.get("s1", now).has_value());

    cache.put("s1", std::string("main"), now);
    cache.put("main", std::nullopt, now);

    auto s1 = cache.get("s1", now);
    ASSERT_TRUE(s1.has_value());
    EXPECT_EQ(*s1, "main");

    auto top = cache.get("main", now);
    ASSERT_TRUE(top.has_value());
    EXPECT_FALSE(top->has_value());

    EXPECT_FALSE(cache.get("s1", now + 6min).has_value());
}

TEST(ParentCache, FailuresExpireSooner) {
    ParentCache cache(5min, 1min);
    auto now = Clock::now();

    cache.put_failure("s1", now);
    cache.put("s2", std::string("main"), now);

    EXPECT_TRUE(cache.get("s1", now + 30s).has_value());
    EXPECT_EQ(cache.expire(now + 2min), 1u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.expire(now + 6min), 1u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(Reaper, SweepExpiresMailAndCache) {
    MailboxConfig config;
    config.handled_ttl = 30min;
    config.unhandled_ttl = 2h;
    MailboxStore mailbox(config);
    ParentCache parents(5min, 1min);
    Reaper reaper(mailbox, parents, 60s);

    auto now = Clock::now();
    mailbox.send("agentA", "sB", "handled");
    mailbox.send("agentA", "sB", "unhandled");
    mailbox.mark_handled("sB", {1});
    parents.put("sB", std::string("main"), now);

    auto stats = reaper.sweep(now + 31min);
    EXPECT_EQ(stats.messages_removed, 1u);
    EXPECT_EQ(stats.parents_expired, 1u);
    EXPECT_EQ(mailbox.size("sB"), 1u);

    reaper.sweep(now + 3h);
    auto totals = reaper.totals();
    EXPECT_EQ(totals.sweeps, 2u);
    EXPECT_EQ(totals.messages_removed, 2u);
    EXPECT_EQ(mailbox.mailbox_count(), 0u);
}

TEST(Reaper, CapacityTrimKeepsUnhandled) {
    MailboxConfig config;
    config.capacity = 5;
    MailboxStore mailbox(config);
    ParentCache parents(5min, 1min);
    Reaper reaper(mailbox, parents, 60s);

    for (int i = 0; i < 5; ++i) {
        mailbox.send("agentA", "sB", "m" + std::to_string(i + 1));
    }
    mailbox.mark_handled("sB", {1, 2, 3});

    // Nothing to trim at capacity
    EXPECT_EQ(reaper.sweep(Clock::now()).messages_removed, 0u);
    EXPECT_EQ(mailbox.size("sB"), 5u);
    EXPECT_EQ(mailbox.unhandled("sB").size(), 2u);
}

TEST(Reaper, BackgroundThreadStartsAndStops) {
    MailboxStore mailbox;
    ParentCache parents(5min, 1min);
    Reaper reaper(mailbox, parents, 10ms);

    reaper.start();
    EXPECT_TRUE(reaper.running());
    std::this_thread::sleep_for(60ms);
    reaper.stop();

    EXPECT_FALSE(reaper.running());
    EXPECT_GE(reaper.totals().sweeps, 1u);
}
