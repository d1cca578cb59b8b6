#include <gtest/gtest.h>

#include "kernel/prompts.hpp"

using namespace pocket::kernel;

TEST(Prompts, BroadcastResultListsAgentsAndRecipients) {
    std::vector<ParallelAgent> agents{{"agentB", {"reading docs", "writing code"}, false}};
    auto text = prompts::broadcast_result("agentA", {"agentB"}, agents, std::nullopt);

    EXPECT_EQ(text,
              "You are: agentA\n\n"
              "Available agents:\n"
              "  - agentB\n"
              "      → reading docs\n"
              "      → writing code\n"
              "Message sent to: agentB");
}

TEST(Prompts, BroadcastResultForReply) {
    HandledMessage handled{3, "agentB", "hi"};
    auto text = prompts::broadcast_result("agentA", {"agentB"}, {}, handled);

    EXPECT_NE(text.find("No other agents available yet."), std::string::npos);
    EXPECT_NE(text.find("Replied to #3 from agentB:\n  \"hi\""), std::string::npos);
}

TEST(Prompts, UnknownRecipientListsKnownAgents) {
    EXPECT_EQ(prompts::unknown_recipient("agentZ", {"agentB", "agentC"}),
              "Error: Unknown recipient \"agentZ\". Known agents: agentB, agentC");
    EXPECT_NE(prompts::unknown_recipient("agentZ", {}).find("No agents available yet."), std::string::npos);
}

TEST(Prompts, SubagentOutputIsTrimmed) {
    EXPECT_EQ(prompts::format_subagent_output("agentC", "  result\n\n"),
              "[agentC completed]\n\n<output=agentC>\nresult\n</output>");
    EXPECT_EQ(prompts::received_subagent_output("agentC", "result"),
              "[Received agentC completed task]\nresult");
}

TEST(Prompts, UniverseSummary) {
    EXPECT_FALSE(prompts::universe_summary({}).has_value());

    auto summary = prompts::universe_summary({{"agentA", {"started", "finished"}}, {"agentB", {}}});
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->rfind("[Pocket Universe Summary]", 0), 0u);
    EXPECT_NE(summary->find("## agentA\nStatus history:\n  → started\n  → finished\n"), std::string::npos);
    EXPECT_NE(summary->find("## agentB\n\n"), std::string::npos);
}

TEST(Prompts, SystemPromptFollowsDepth) {
    prompts::SystemPromptOptions options;
    options.depth = 1;
    options.max_depth = 3;
    auto spawning = prompts::system_prompt(options);
    EXPECT_NE(spawning.find("## Spawning Agents"), std::string::npos);
    EXPECT_NE(spawning.find("## Querying Agent History"), std::string::npos);

    options.allow_subagent = false;
    options.depth = 3;
    auto capped = prompts::system_prompt(options);
    EXPECT_EQ(capped.find("## Spawning Agents"), std::string::npos);
    EXPECT_NE(capped.find("maximum subagent depth (3/3)"), std::string::npos);

    options.recall_enabled = false;
    EXPECT_EQ(prompts::system_prompt(options).find("recall()"), std::string::npos);
}

TEST(Prompts, UserMessage) {
    EXPECT_EQ(prompts::user_message("wrap it up"), "**Message from user:**\n\nwrap it up");
}
