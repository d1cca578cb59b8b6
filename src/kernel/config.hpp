#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace pocket::kernel {

struct MailboxConfig {
    size_t capacity = 100;                       // Max messages per recipient
    size_t max_message_length = 10000;           // Longer bodies are truncated
    std::chrono::milliseconds handled_ttl = std::chrono::minutes(30);
    std::chrono::milliseconds unhandled_ttl = std::chrono::hours(2);
};

struct LedgerConfig {
    size_t max_status_length = 300;
    size_t max_status_history = 50;              // Keep last N status updates per agent
};

struct BarrierConfig {
    int max_iterations = 100;
    std::chrono::milliseconds child_wait_timeout = std::chrono::minutes(5);
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100);
};

struct ResumeConfig {
    int max_chain_length = 16;                   // Resumes per chain before giving up
};

struct ReaperConfig {
    std::chrono::milliseconds interval = std::chrono::seconds(60);
    std::chrono::milliseconds parent_cache_ttl = std::chrono::minutes(5);
    std::chrono::milliseconds parent_failure_ttl = std::chrono::minutes(1);
};

struct SubagentConfig {
    bool enabled = true;
    int max_depth = 3;                           // Sessions at this depth cannot spawn
    bool forced_attention = true;                // true = inbox delivery, false = user message
};

struct RecallConfig {
    bool enabled = true;
    bool cross_pocket = true;                    // Include agents archived by earlier universes
};

struct ToolsConfig {
    bool broadcast = true;
    SubagentConfig subagent;
    RecallConfig recall;
};

// Which agent events are mirrored into the root session as notifications
struct SessionUpdateConfig {
    bool status_update = false;
    bool message_sent = false;
    bool subagent_spawned = false;
    bool subagent_completed = false;
    bool session_resumed = false;
    bool user_message_sent = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;                            // Optional debug log file
};

// Coordinator configuration
struct CoordinatorConfig {
    MailboxConfig mailbox;
    LedgerConfig ledger;
    BarrierConfig barrier;
    ResumeConfig resume;
    ReaperConfig reaper;
    ToolsConfig tools;
    SessionUpdateConfig session_update;
    LoggingConfig logging;
    size_t worker_count = 4;
};

// Overlay the keys present in j onto base. Throws nlohmann::json::exception on type mismatch.
CoordinatorConfig config_from_json(const nlohmann::json& j, CoordinatorConfig base = {});

// Load from an explicit path or the default search locations, then apply
// POCKET_LOG_LEVEL. Falls back to defaults when nothing usable is found.
CoordinatorConfig load_coordinator_config(const std::optional<std::filesystem::path>& path = std::nullopt);

} // namespace pocket::kernel
