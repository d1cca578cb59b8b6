#pragma once
#include <string>
#include "kernel/config.hpp"
#include "kernel/event_bus.hpp"

namespace pocket::kernel {

class AsyncTaskManager;
class IdentityRegistry;
class SessionHost;

// Mirrors agent activity into the agent's main session as ignored lines,
// e.g. "[14:02:11] [agentA] -> [agentB]: found it". Each event kind is
// switched on separately in config. Delivery happens on the worker pool.
class SessionUpdates {
public:
    SessionUpdates(EventBus& bus, SessionHost& host, AsyncTaskManager& tasks,
                   IdentityRegistry& registry, SessionUpdateConfig config);

    void status_update(const std::string& session_id, const std::string& alias, const std::string& status);
    void message_sent(const std::string& session_id, const std::string& from_alias,
                      const std::string& to_alias, const std::string& preview);
    void subagent_spawned(const std::string& session_id, const std::string& spawner_alias,
                          const std::string& new_alias, const std::string& description);
    void subagent_completed(const std::string& session_id, const std::string& alias);
    void session_resumed(const std::string& session_id, const std::string& alias,
                         const std::string& resumed_by, const std::string& reason);
    void user_message_sent(const std::string& main_session_id, const std::string& target_alias,
                           const std::string& preview);

    // Deliver queued events now. Returns the number delivered.
    size_t flush();

    static std::string format_line(const CoordinatorEvent& event);

private:
    void publish(CoordinatorEventType type, nlohmann::json data,
                 const std::string& session_id, const std::string& main_session_id);

    EventBus& bus_;
    SessionHost& host_;
    AsyncTaskManager& tasks_;
    IdentityRegistry& registry_;
    SessionUpdateConfig config_;
};

} // namespace pocket::kernel
