/**
 * Pocket Coordinator
 *
 * Owns and wires the coordination engine for one host process:
 * - IdentityRegistry, MailboxStore, SessionTracker (agent state)
 * - CompletionBarrier and ResumeEngine (who waits, who gets woken)
 * - StatusLedger (status history and completed agents)
 * - Reaper (periodic TTL sweep)
 * - ToolRouter with the broadcast, subagent and recall tools
 *
 * Host lifecycle events and tool calls enter through the on_* hooks.
 */
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/completion_barrier.hpp"
#include "kernel/config.hpp"
#include "kernel/host_events.hpp"
#include "kernel/module.hpp"
#include "kernel/tool_router.hpp"

namespace pocket::kernel {

class AsyncTaskManager;
class DeliveryStrategy;
class EventBus;
class IdentityRegistry;
class MailboxStore;
class ParentCache;
class Reaper;
class ResumeEngine;
class SessionHost;
class SessionLookup;
class SessionTracker;
class SessionUpdates;
class StatusLedger;
class Universe;
struct CoordinatorContext;

// What to add to a session's context before its next model call
struct ContextInjection {
    std::optional<nlohmann::json> inbox;        // Synthetic broadcast result, child sessions only
    std::vector<std::string> pending_outputs;   // Held subagent output
    std::vector<std::string> subagent_notices;
    std::optional<std::string> summary_cover;   // Main sessions once the summary is posted

    bool empty() const {
        return !inbox && pending_outputs.empty() && subagent_notices.empty() && !summary_cover;
    }
};

struct PocketCommand {
    std::optional<std::string> target;          // Alias, empty for the coordinator
    std::string message;
};

// "@agentB wrap it up" or "wrap it up". Empty input gives nullopt.
std::optional<PocketCommand> parse_pocket_command(const std::string& input);

struct CommandResult {
    bool success = false;
    std::string message;
};

class Coordinator {
public:
    explicit Coordinator(SessionHost& host, CoordinatorConfig config = {});
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Start the reaper thread
    void start();

    // Stop the reaper and drain the task pool
    void shutdown();

    // Tool calls
    std::string handle_tool(const ToolCall& call);
    nlohmann::json handle_tool_json(const nlohmann::json& payload);
    std::vector<std::string> tools() const { return router_.tools(); }

    // Host lifecycle hooks
    std::vector<std::string> on_system_transform(const std::string& session_id);
    void on_tool_before(const ToolCall& call);
    void on_tool_after(const ToolExecuteAfter& event);
    void on_session_idle(const std::string& session_id);
    BarrierOutcome on_before_complete(const std::string& session_id);
    ContextInjection on_messages_transform(const std::string& session_id);

    CommandResult pocket_command(const std::string& main_session_id, const std::string& input);

    // Register a child session under its root. Empty for main or retired sessions.
    std::optional<std::string> ensure_registered(const std::string& session_id);

    // End the current universe: retire identities and clear live state
    void reset_universe(const std::string& main_session_id);

    const CoordinatorConfig& config() const { return config_; }
    IdentityRegistry& registry() { return *registry_; }
    MailboxStore& mailbox() { return *mailbox_; }
    SessionTracker& tracker() { return *tracker_; }
    CompletionBarrier& barrier() { return *barrier_; }
    StatusLedger& ledger() { return *ledger_; }
    ParentCache& parents() { return *parents_; }
    Reaper& reaper() { return *reaper_; }
    AsyncTaskManager& tasks() { return *tasks_; }
    DeliveryStrategy& delivery() { return *delivery_; }
    Universe& universe() { return *universe_; }

private:
    void finish_first_level(const std::string& session_id, const std::string& alias);
    void finish_universe(const std::string& main_session_id);

    CoordinatorConfig config_;
    SessionHost& host_;

    std::unique_ptr<IdentityRegistry> registry_;
    std::unique_ptr<MailboxStore> mailbox_;
    std::unique_ptr<SessionTracker> tracker_;
    std::unique_ptr<CompletionBarrier> barrier_;
    std::unique_ptr<StatusLedger> ledger_;
    std::unique_ptr<ParentCache> parents_;
    std::unique_ptr<SessionLookup> lookup_;
    std::unique_ptr<Universe> universe_;
    std::unique_ptr<EventBus> bus_;
    std::unique_ptr<AsyncTaskManager> tasks_;
    std::unique_ptr<SessionUpdates> updates_;
    std::unique_ptr<ResumeEngine> resume_;
    std::unique_ptr<DeliveryStrategy> delivery_;
    std::unique_ptr<Reaper> reaper_;

    std::unique_ptr<CoordinatorContext> context_;
    std::vector<std::unique_ptr<ToolModule>> modules_;
    ToolRouter router_;
};

} // namespace pocket::kernel
