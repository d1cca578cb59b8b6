#include <gtest/gtest.h>

#include <string>

#include "kernel/mailbox.hpp"

using namespace pocket::kernel;

namespace {

MailboxConfig small_config(size_t capacity) {
    MailboxConfig config;
    config.capacity = capacity;
    return config;
}

} // namespace

TEST(Mailbox, HiByeScenario) {
    MailboxStore mailbox;

    auto hi = mailbox.send("agentA", "sB", "hi");
    EXPECT_EQ(hi.seq, 1u);
    ASSERT_EQ(mailbox.needing_wake("sB").size(), 1u);

    // B replies to #1
    auto handled = mailbox.mark_handled("sB", {1});
    ASSERT_EQ(handled.size(), 1u);
    EXPECT_EQ(handled[0].from, "agentA");
    EXPECT_EQ(handled[0].body, "hi");
    EXPECT_TRUE(mailbox.unhandled("sB").empty());
    EXPECT_TRUE(mailbox.needing_wake("sB").empty());

    auto bye = mailbox.send("agentB", "sA", "bye");
    EXPECT_EQ(bye.seq, 1u);
    auto unread = mailbox.unhandled("sA");
    ASSERT_EQ(unread.size(), 1u);
    EXPECT_EQ(unread[0].from, "agentB");
    EXPECT_EQ(unread[0].body, "bye");
}

TEST(Mailbox, SeqIsStrictlyIncreasingPerRecipient) {
    MailboxStore mailbox(small_config(3));

    uint64_t last = 0;
    for (int i = 0; i < 10; ++i) {
        auto m = mailbox.send("agentA", "sB", "m" + std::to_string(i));
        EXPECT_GT(m.seq, last);
        last = m.seq;
    }
    // Other recipients have their own counter
    EXPECT_EQ(mailbox.send("agentA", "sC", "x").seq, 1u);
}

TEST(Mailbox, MarkHandledIsIdempotent) {
    MailboxStore mailbox;
    mailbox.send("agentA", "sB", "one");

    EXPECT_EQ(mailbox.mark_handled("sB", {1}).size(), 1u);
    EXPECT_TRUE(mailbox.mark_handled("sB", {1}).empty());
    EXPECT_TRUE(mailbox.mark_handled("sB", {42}).empty());
    EXPECT_TRUE(mailbox.mark_handled("nobody", {1}).empty());
}

TEST(Mailbox, PresentedMessagesDoNotWakeButStayUnhandled) {
    MailboxStore mailbox;
    mailbox.send("agentA", "sB", "one");
    mailbox.send("agentA", "sB", "two");

    mailbox.mark_presented("sB", {1});

    auto wake = mailbox.needing_wake("sB");
    ASSERT_EQ(wake.size(), 1u);
    EXPECT_EQ(wake[0].seq, 2u);
    EXPECT_EQ(mailbox.unhandled("sB").size(), 2u);

    mailbox.mark_presented("sB", {2});
    EXPECT_TRUE(mailbox.needing_wake("sB").empty());
}

TEST(Mailbox, BodyIsTruncated) {
    MailboxConfig config;
    config.max_message_length = 5;
    MailboxStore mailbox(config);

    auto m = mailbox.send("agentA", "sB", "abcdefghij");
    EXPECT_EQ(m.body, "abcde... [truncated]");
    EXPECT_EQ(MailboxStore::truncate_body("abc", 5), "abc");
}

TEST(Mailbox, TruncationKeepsUtf8Intact) {
    MailboxConfig config;
    config.max_message_length = 5;
    MailboxStore mailbox(config);

    auto m = mailbox.send("agentA", "sB", "abcd\xC3\xA9xyz");
    EXPECT_EQ(m.body, "abcd... [truncated]");
}

TEST(Mailbox, FullMailboxEvictsHandledFirst) {
    MailboxStore mailbox(small_config(3));
    mailbox.send("agentA", "sB", "m1");
    mailbox.send("agentA", "sB", "m2");
    mailbox.send("agentA", "sB", "m3");
    mailbox.mark_handled("sB", {2});

    mailbox.send("agentA", "sB", "m4");

    EXPECT_EQ(mailbox.size("sB"), 3u);
    auto unread = mailbox.unhandled("sB");
    ASSERT_EQ(unread.size(), 3u);
    EXPECT_EQ(unread[0].body, "m1");
    EXPECT_EQ(unread[1].body, "m3");
    EXPECT_EQ(unread[2].body, "m4");
}

TEST(Mailbox, FullMailboxWithoutHandledDropsOldest) {
    MailboxStore mailbox(small_config(2));
    mailbox.send("agentA", "sB", "m1");
    mailbox.send("agentA", "sB", "m2");
    mailbox.send("agentA", "sB", "m3");

    auto unread = mailbox.unhandled("sB");
    ASSERT_EQ(unread.size(), 2u);
    EXPECT_EQ(unread[0].body, "m2");
    EXPECT_EQ(unread[1].body, "m3");
}

TEST(Mailbox, ExpireAppliesSeparateTtls) {
    MailboxConfig config;
    config.handled_ttl = std::chrono::minutes(30);
    config.unhandled_ttl = std::chrono::hours(2);
    MailboxStore mailbox(config);

    mailbox.send("agentA", "sB", "handled");
    mailbox.send("agentA", "sB", "unhandled");
    mailbox.mark_handled("sB", {1});

    auto now = Clock::now();
    EXPECT_EQ(mailbox.expire(now), 0u);

    EXPECT_EQ(mailbox.expire(now + std::chrono::minutes(31)), 1u);
    auto left = mailbox.unhandled("sB");
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].body, "unhandled");

    EXPECT_EQ(mailbox.expire(now + std::chrono::hours(3)), 1u);
    EXPECT_EQ(mailbox.size("sB"), 0u);
    EXPECT_EQ(mailbox.mailbox_count(), 0u);
}

TEST(Mailbox, ResetClearsEverything) {
    MailboxStore mailbox;
    mailbox.send("agentA", "sB", "one");
    mailbox.mark_presented("sB", {1});

    mailbox.reset();
    EXPECT_EQ(mailbox.mailbox_count(), 0u);
    // Sequence numbering starts over
    auto m = mailbox.send("agentA", "sB", "two");
    EXPECT_EQ(m.seq, 1u);
    EXPECT_EQ(mailbox.needing_wake("sB").size(), 1u);
}

TEST(Mailbox, IdsAreRandomTokens) {
    MailboxStore mailbox;
    auto a = mailbox.send("agentA", "sB", "one");
    auto b = mailbox.send("agentA", "sB", "two");
    EXPECT_EQ(a.id.size(), 8u);
    EXPECT_NE(a.id, b.id);
}
