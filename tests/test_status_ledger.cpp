#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "kernel/prompts.hpp"
#include "kernel/status_ledger.hpp"

using namespace pocket::kernel;

TEST(StatusLedger, AppendTruncatesAndTrimsHistory) {
    LedgerConfig config;
    config.max_status_length = 5;
    config.max_status_history = 2;
    StatusLedger ledger(config);

    EXPECT_EQ(ledger.append_status("agentA", "first status"), "first");
    ledger.append_status("agentA", "two");
    ledger.append_status("agentA", "three");

    auto history = ledger.history("agentA");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0], "two");
    EXPECT_EQ(history[1], "three");
    EXPECT_EQ(ledger.latest("agentA"), "three");
    EXPECT_FALSE(ledger.latest("agentB").has_value());
}

TEST(StatusLedger, ArchiveIsIdempotent) {
    StatusLedger ledger;
    ledger.append_status("agentA", "working");
    ledger.archive("agentA", "first output");
    ledger.archive("agentA", "final output");

    EXPECT_EQ(ledger.archived_count(), 1u);
    auto record = ledger.archived("agentA");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->final_output, "final output");
    ASSERT_EQ(record->status_history.size(), 1u);
    EXPECT_EQ(record->status_history[0], "working");
    EXPECT_GT(record->completed_at_ms, 0);
}

TEST(StatusLedger, QueryMergesArchivedAndLive) {
    StatusLedger ledger;
    ledger.append_status("agentA", "done soon");
    ledger.archive("agentA", "A output");
    ledger.append_status("agentB", "still going");

    auto result = ledger.query(std::nullopt, true,
                               {{"agentA", SessionStatus::IDLE}, {"agentB", SessionStatus::ACTIVE}});
    const auto& agents = result["agents"];
    ASSERT_EQ(agents.size(), 2u);
    EXPECT_EQ(agents[0]["name"], "agentA");
    EXPECT_EQ(agents[0]["state"], "completed");
    EXPECT_EQ(agents[1]["name"], "agentB");
    EXPECT_EQ(agents[1]["state"], "active");
    EXPECT_EQ(agents[1]["status_history"][0], "still going");

    // No output without a specific agent name
    EXPECT_FALSE(agents[0].contains("output"));
}

TEST(StatusLedger, OutputOnlyForNamedAgent) {
    StatusLedger ledger;
    ledger.archive("agentA", "A output");

    auto without = ledger.query(std::string("agentA"), false, {});
    EXPECT_FALSE(without["agents"][0].contains("output"));

    auto with = ledger.query(std::string("agentA"), true, {});
    ASSERT_EQ(with["agents"].size(), 1u);
    EXPECT_EQ(with["agents"][0]["output"], "A output");

    auto missing = ledger.query(std::string("agentZ"), true, {});
    EXPECT_TRUE(missing["agents"].empty());
}

TEST(StatusLedger, LiveAgentsReportPlaceholders) {
    StatusLedger ledger;

    auto active = ledger.query(std::string("agentB"), true, {{"agentB", SessionStatus::ACTIVE}});
    EXPECT_EQ(active["agents"][0]["output"], prompts::RECALL_AGENT_ACTIVE);

    auto idle = ledger.query(std::string("agentB"), true, {{"agentB", SessionStatus::IDLE}});
    EXPECT_EQ(idle["agents"][0]["output"], prompts::RECALL_AGENT_IDLE_NO_OUTPUT);

    ledger.record_output("agentB", "partial work");
    auto recorded = ledger.query(std::string("agentB"), true, {{"agentB", SessionStatus::IDLE}});
    EXPECT_EQ(recorded["agents"][0]["output"], "partial work");
}

TEST(StatusLedger, ArchiveSurvivesClearLive) {
    StatusLedger ledger;
    ledger.append_status("agentA", "status");
    ledger.archive("agentA", "output");
    ledger.append_status("agentB", "live only");

    ledger.clear_live();

    EXPECT_TRUE(ledger.history("agentB").empty());
    EXPECT_TRUE(ledger.is_archived("agentA"));
    EXPECT_EQ(ledger.universe(), 1u);
}

TEST(StatusLedger, CrossPocketFilter) {
    StatusLedger ledger;
    ledger.archive("agentA", "old universe");
    ledger.clear_live();
    ledger.archive("agentC", "this universe");

    auto all = ledger.query(std::nullopt, false, {}, true);
    EXPECT_EQ(all["agents"].size(), 2u);

    auto current = ledger.query(std::nullopt, false, {}, false);
    ASSERT_EQ(current["agents"].size(), 1u);
    EXPECT_EQ(current["agents"][0]["name"], "agentC");
}

TEST(StatusLedger, TruncationKeepsQueryDumpable) {
    LedgerConfig config;
    config.max_status_length = 5;
    StatusLedger ledger(config);

    EXPECT_EQ(ledger.append_status("agentA", "abcd\xC3\xA9 done"), "abcd");
    ledger.archive("agentA", "ok");

    auto result = ledger.query(std::nullopt, false, {}, true);
    EXPECT_NO_THROW(result.dump());
    EXPECT_EQ(result["agents"][0]["status_history"][0], "abcd");
}
