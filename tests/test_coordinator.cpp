#include <gtest/gtest.h>

#include <chrono>
#include <nlohmann/json.hpp>

#include "host/local_host.hpp"
#include "kernel/async_task_manager.hpp"
#include "kernel/coordinator.hpp"
#include "kernel/identity_registry.hpp"
#include "kernel/mailbox.hpp"
#include "kernel/prompts.hpp"
#include "kernel/session_tracker.hpp"
#include "kernel/status_ledger.hpp"
#include "kernel/universe.hpp"

using namespace pocket;
using namespace pocket::kernel;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

CoordinatorConfig fast_config() {
    CoordinatorConfig config;
    config.worker_count = 2;
    config.barrier.child_wait_timeout = 2s;
    config.barrier.poll_interval = 5ms;
    return config;
}

class CoordinatorTest : public ::testing::Test {
protected:
    CoordinatorTest()
        : coord(host, fast_config()) {
        host.add_session("main");
        host.add_session("c1", "main");
        host.add_session("c2", "main");
        host.set_responder([this](const std::string& session_id, const std::string& prompt) {
            coord.on_messages_transform(session_id);
            return "done: " + prompt;
        });
    }

    void start_children() {
        coord.on_system_transform("c1");
        coord.on_system_transform("c2");
    }

    std::string call(const std::string& tool, const std::string& session_id, json args) {
        ToolCall tool_call;
        tool_call.tool = tool;
        tool_call.session_id = session_id;
        tool_call.args = std::move(args);
        return coord.handle_tool(tool_call);
    }

    void drain() {
        ASSERT_TRUE(coord.tasks().wait_idle(5s));
    }

    host::LocalHost host;
    Coordinator coord;
};

} // namespace

TEST(PocketCommand, ParsesTargetAndMessage) {
    auto command = parse_pocket_command("  @agentB wrap it up  ");
    ASSERT_TRUE(command.has_value());
    ASSERT_TRUE(command->target.has_value());
    EXPECT_EQ(*command->target, "agentB");
    EXPECT_EQ(command->message, "wrap it up");
}

TEST(PocketCommand, WithoutTargetGoesToCoordinator) {
    auto command = parse_pocket_command("wrap it up");
    ASSERT_TRUE(command.has_value());
    EXPECT_FALSE(command->target.has_value());
    EXPECT_EQ(command->message, "wrap it up");

    // A bare mention is not a target
    auto mention = parse_pocket_command("@agentB");
    ASSERT_TRUE(mention.has_value());
    EXPECT_FALSE(mention->target.has_value());
    EXPECT_EQ(mention->message, "@agentB");
}

TEST(PocketCommand, EmptyInput) {
    EXPECT_FALSE(parse_pocket_command("").has_value());
    EXPECT_FALSE(parse_pocket_command(" \n\t").has_value());
}

TEST_F(CoordinatorTest, SystemTransformRegistersChildren) {
    EXPECT_TRUE(coord.on_system_transform("main").empty());

    auto injected = coord.on_system_transform("c1");
    ASSERT_EQ(injected.size(), 1u);
    EXPECT_TRUE(contains(injected[0], "Pocket Universe"));
    EXPECT_TRUE(contains(injected[0], "Use `subagent` to create new sibling agents"));

    EXPECT_EQ(coord.registry().alias("c1"), "agentA");
    EXPECT_TRUE(coord.tracker().state("c1").has_value());
    EXPECT_EQ(coord.universe().pocket_id().value_or(""), "c1");

    auto coordinator = coord.universe().coordinator("main");
    ASSERT_TRUE(coordinator.has_value());
    EXPECT_EQ(coordinator->alias, "agentA");

    // Repeated transforms keep the identity
    coord.on_system_transform("c1");
    EXPECT_EQ(coord.registry().size(), 1u);
}

TEST_F(CoordinatorTest, TaskDescriptionBecomesInitialStatus) {
    ToolCall task;
    task.tool = "task";
    task.session_id = "main";
    task.args = {{"description", "write the parser"}, {"prompt", "..."}};
    coord.on_tool_before(task);

    coord.on_system_transform("c1");
    EXPECT_EQ(coord.ledger().history("agentA"), (std::vector<std::string>{"write the parser"}));

    // Consumed once
    coord.on_system_transform("c2");
    EXPECT_TRUE(coord.ledger().history("agentB").empty());
}

TEST_F(CoordinatorTest, InboxInjectionPresentsMessages) {
    start_children();
    call("broadcast", "c1", {{"send_to", "agentB"}, {"message", "need the schema"}});

    auto injection = coord.on_messages_transform("c2");
    ASSERT_TRUE(injection.inbox.has_value());
    const auto& inbox = *injection.inbox;
    EXPECT_EQ(inbox["you_are"], "agentB");
    EXPECT_EQ(inbox["hint"], prompts::ANNOUNCE_HINT);
    ASSERT_EQ(inbox["agents"].size(), 1u);
    EXPECT_EQ(inbox["agents"][0]["name"], "agentA");
    ASSERT_EQ(inbox["messages"].size(), 1u);
    EXPECT_EQ(inbox["messages"][0]["from"], "agentA");
    EXPECT_EQ(inbox["messages"][0]["content"], "need the schema");

    // Seen, so no wake, but still unanswered
    EXPECT_TRUE(coord.mailbox().needing_wake("c2").empty());
    EXPECT_EQ(coord.mailbox().unhandled("c2").size(), 1u);

    call("broadcast", "c2", {{"message", "designing the schema"}});
    auto later = coord.on_messages_transform("c2");
    ASSERT_TRUE(later.inbox.has_value());
    EXPECT_FALSE(later.inbox->contains("hint"));
}

TEST_F(CoordinatorTest, MainSessionGetsNoInbox) {
    start_children();
    auto injection = coord.on_messages_transform("main");
    EXPECT_TRUE(injection.empty());
}

TEST_F(CoordinatorTest, SubagentNoticeReachesCaller) {
    start_children();
    call("subagent", "c1", {{"prompt", "look into caching"}, {"description", "caching"}});
    drain();

    auto injection = coord.on_messages_transform("c1");
    EXPECT_EQ(injection.subagent_notices,
              (std::vector<std::string>{prompts::subagent_running("agentC", "caching")}));
    EXPECT_TRUE(coord.on_messages_transform("c1").subagent_notices.empty());
}

TEST_F(CoordinatorTest, BeforeCompleteResumesOnUnreadMail) {
    start_children();
    call("broadcast", "c2", {{"send_to", "agentA"}, {"message", "check this"}});

    auto outcome = coord.on_before_complete("c1");
    EXPECT_EQ(outcome.kind, BarrierOutcome::Kind::RESUME);
    EXPECT_EQ(outcome.resume_prompt, prompts::resume_broadcast("agentB"));
    EXPECT_TRUE(coord.universe().pocket_id().has_value());

    EXPECT_EQ(coord.on_before_complete("c1").kind, BarrierOutcome::Kind::SATISFIED);
}

TEST_F(CoordinatorTest, BeforeCompleteWaitsForSubagent) {
    start_children();
    call("subagent", "c1", {{"prompt", "look into caching"}});

    // First round hands the caller its subagent's output
    auto outcome = coord.on_before_complete("c1");
    EXPECT_EQ(outcome.kind, BarrierOutcome::Kind::RESUME);
    EXPECT_FALSE(coord.barrier().has_pending("c1"));

    auto inbox = coord.mailbox().unhandled("c1");
    ASSERT_EQ(inbox.size(), 1u);
    EXPECT_EQ(inbox[0].from, "agentC");
}

TEST_F(CoordinatorTest, UnregisteredSessionCompletesImmediately) {
    auto outcome = coord.on_before_complete("main");
    EXPECT_EQ(outcome.kind, BarrierOutcome::Kind::SATISFIED);
    EXPECT_EQ(outcome.iterations, 0);
}

TEST_F(CoordinatorTest, LastFirstLevelChildEndsUniverse) {
    start_children();
    call("broadcast", "c1", {{"message", "parser done"}});
    call("broadcast", "c2", {{"message", "lexer done"}});

    EXPECT_EQ(coord.on_before_complete("c1").kind, BarrierOutcome::Kind::SATISFIED);
    EXPECT_TRUE(coord.universe().pocket_id().has_value());
    EXPECT_FALSE(coord.registry().is_retired("c1"));

    EXPECT_EQ(coord.on_before_complete("c2").kind, BarrierOutcome::Kind::SATISFIED);
    drain();

    auto persisted = host.persisted();
    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted[0].session_id, "main");
    EXPECT_TRUE(persisted[0].synthetic);
    EXPECT_TRUE(contains(persisted[0].text, "[Pocket Universe Summary]"));
    EXPECT_TRUE(contains(persisted[0].text, "## agentA"));
    EXPECT_TRUE(contains(persisted[0].text, "  → lexer done"));

    EXPECT_TRUE(coord.registry().is_retired("c1"));
    EXPECT_TRUE(coord.registry().is_retired("c2"));
    EXPECT_EQ(coord.registry().size(), 0u);
    EXPECT_FALSE(coord.universe().pocket_id().has_value());

    // Archive survives the reset
    EXPECT_TRUE(coord.ledger().is_archived("agentA"));
    EXPECT_TRUE(coord.ledger().is_archived("agentB"));

    auto cover = coord.on_messages_transform("main").summary_cover;
    ASSERT_TRUE(cover.has_value());
    EXPECT_EQ(*cover, persisted[0].text);
}

TEST_F(CoordinatorTest, RetiredSessionsStayRetired) {
    start_children();
    coord.on_before_complete("c1");
    coord.on_before_complete("c2");
    drain();

    ToolExecuteAfter after;
    after.tool = "task";
    after.session_id = "main";
    after.child_session_id = "c1";
    coord.on_tool_after(after);

    EXPECT_FALSE(coord.registry().find_alias("c1").has_value());
    EXPECT_FALSE(coord.tracker().state("c1").has_value());
    EXPECT_TRUE(coord.on_system_transform("c1").empty());
    EXPECT_EQ(call("broadcast", "c1", {{"message", "still here"}}), prompts::BROADCAST_NOT_REGISTERED);
}

TEST_F(CoordinatorTest, NextUniverseContinuesAliases) {
    start_children();
    coord.on_before_complete("c1");
    coord.on_before_complete("c2");
    drain();

    host.add_session("c3", "main");
    coord.on_system_transform("c3");
    EXPECT_EQ(coord.registry().alias("c3"), "agentC");
    EXPECT_EQ(coord.universe().pocket_id().value_or(""), "c3");
}

TEST_F(CoordinatorTest, ToolAfterMarksChildIdle) {
    start_children();
    ToolExecuteAfter after = ToolExecuteAfter::from_json(
        {{"tool", "task"}, {"sessionID", "main"}, {"metadata", {{"sessionId", "c1"}}}});
    coord.on_tool_after(after);
    EXPECT_TRUE(coord.tracker().is_idle("c1"));
}

TEST_F(CoordinatorTest, PocketCommandWithoutUniverse) {
    auto result = coord.pocket_command("main", "wrap it up");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, prompts::POCKET_NO_UNIVERSE);

    auto empty = coord.pocket_command("main", "   ");
    EXPECT_FALSE(empty.success);
    EXPECT_EQ(empty.message, prompts::POCKET_EMPTY_INPUT);
}

TEST_F(CoordinatorTest, PocketCommandGoesToCoordinator) {
    start_children();
    auto result = coord.pocket_command("main", "wrap it up");
    drain();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, prompts::pocket_sent("agentA"));
    EXPECT_EQ(host.prompts_for("c1"), (std::vector<std::string>{prompts::user_message("wrap it up")}));
    EXPECT_TRUE(host.prompts_for("c2").empty());
}

TEST_F(CoordinatorTest, PocketCommandToNamedAgent) {
    start_children();
    coord.on_session_idle("c2");

    auto result = coord.pocket_command("main", "@agentB ship it");
    drain();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, prompts::pocket_sent("agentB"));
    EXPECT_EQ(host.prompts_for("c2"), (std::vector<std::string>{prompts::user_message("ship it")}));
    EXPECT_TRUE(coord.tracker().is_idle("c2"));
}

TEST_F(CoordinatorTest, PocketCommandUnknownAgent) {
    start_children();
    auto result = coord.pocket_command("main", "@agentZ ship it");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, prompts::pocket_agent_not_found("agentZ"));
}
