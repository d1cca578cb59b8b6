#include <gtest/gtest.h>

#include <chrono>

#include "host/local_host.hpp"
#include "kernel/async_task_manager.hpp"
#include "kernel/config.hpp"
#include "kernel/delivery.hpp"
#include "kernel/event_bus.hpp"
#include "kernel/identity_registry.hpp"
#include "kernel/mailbox.hpp"
#include "kernel/prompts.hpp"
#include "kernel/resume_engine.hpp"
#include "kernel/session_tracker.hpp"
#include "kernel/session_updates.hpp"

using namespace pocket;
using namespace pocket::kernel;
using namespace std::chrono_literals;

namespace {

class DeliveryTest : public ::testing::Test {
protected:
    DeliveryTest()
        : tasks(2)
        , updates(bus, host, tasks, registry, SessionUpdateConfig{})
        , resume(host, tracker, mailbox, registry, tasks, updates, ResumeConfig{}) {
        host.add_session("main");
        host.add_session("caller", "main");
        host.add_session("sub", "main");
        registry.register_session("caller", "main");
        registry.register_session("sub", "main");
        tracker.track("caller", "agentA");
    }

    ~DeliveryTest() override {
        tasks.shutdown();
    }

    SubagentCompletion completion() const {
        return SubagentCompletion{"caller", "sub", "agentB", "the answer"};
    }

    host::LocalHost host;
    IdentityRegistry registry;
    SessionTracker tracker;
    MailboxStore mailbox;
    EventBus bus;
    AsyncTaskManager tasks;
    SessionUpdates updates;
    ResumeEngine resume;
};

} // namespace

TEST_F(DeliveryTest, FactoryFollowsForcedAttention) {
    SubagentConfig config;
    EXPECT_STREQ(make_delivery_strategy(config, host, mailbox, tracker, resume)->name(), "inbox");

    config.forced_attention = false;
    EXPECT_STREQ(make_delivery_strategy(config, host, mailbox, tracker, resume)->name(), "user_message");
}

TEST_F(DeliveryTest, InboxDeliveryQueuesForActiveCaller) {
    InboxDelivery delivery(mailbox, resume);
    delivery.deliver(completion());
    ASSERT_TRUE(tasks.wait_idle(5s));

    auto unread = mailbox.unhandled("caller");
    ASSERT_EQ(unread.size(), 1u);
    EXPECT_EQ(unread[0].from, "agentB");
    EXPECT_EQ(unread[0].body, prompts::received_subagent_output("agentB", "the answer"));
    EXPECT_TRUE(host.prompts_for("caller").empty());
    EXPECT_FALSE(delivery.take_pending("caller").has_value());
}

TEST_F(DeliveryTest, InboxDeliveryResumesIdleCaller) {
    tracker.mark_idle("caller");
    InboxDelivery delivery(mailbox, resume);
    delivery.deliver(completion());
    ASSERT_TRUE(tasks.wait_idle(5s));

    // Queued and woken
    EXPECT_EQ(mailbox.unhandled("caller").size(), 1u);
    auto prompts_seen = host.prompts_for("caller");
    ASSERT_EQ(prompts_seen.size(), 1u);
    EXPECT_EQ(prompts_seen[0], prompts::resume_broadcast("agentB"));
}

TEST_F(DeliveryTest, UserMessagePersistsIntoActiveCaller) {
    UserMessageDelivery delivery(host, tracker, resume);
    delivery.deliver(completion());

    auto persisted = host.persisted();
    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted[0].session_id, "caller");
    EXPECT_FALSE(persisted[0].synthetic);
    EXPECT_EQ(persisted[0].text, prompts::format_subagent_output("agentB", "the answer"));
    EXPECT_FALSE(delivery.take_pending("caller").has_value());
    EXPECT_TRUE(mailbox.unhandled("caller").empty());
}

TEST_F(DeliveryTest, UserMessageHoldsOutputWhenPersistFails) {
    host.fail_persist(true);
    UserMessageDelivery delivery(host, tracker, resume);

    delivery.deliver(completion());
    delivery.deliver(SubagentCompletion{"caller", "sub2", "agentC", "second"});

    auto held = delivery.take_pending("caller");
    ASSERT_TRUE(held.has_value());
    EXPECT_EQ(*held, prompts::format_subagent_output("agentB", "the answer") + "\n\n" +
                     prompts::format_subagent_output("agentC", "second"));
    EXPECT_FALSE(delivery.take_pending("caller").has_value());
}

TEST_F(DeliveryTest, UserMessageResumesIdleCaller) {
    tracker.mark_idle("caller");
    UserMessageDelivery delivery(host, tracker, resume);
    delivery.deliver(completion());
    ASSERT_TRUE(tasks.wait_idle(5s));

    auto prompts_seen = host.prompts_for("caller");
    ASSERT_EQ(prompts_seen.size(), 1u);
    EXPECT_EQ(prompts_seen[0], prompts::format_subagent_output("agentB", "the answer"));
    EXPECT_FALSE(delivery.take_pending("caller").has_value());
    EXPECT_TRUE(tracker.is_idle("caller"));
}

TEST_F(DeliveryTest, ResetDropsHeldOutput) {
    host.fail_persist(true);
    UserMessageDelivery delivery(host, tracker, resume);
    delivery.deliver(completion());
    delivery.reset();
    EXPECT_FALSE(delivery.take_pending("caller").has_value());
}
