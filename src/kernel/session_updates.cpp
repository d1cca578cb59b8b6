#include "kernel/session_updates.hpp"
#include "kernel/async_task_manager.hpp"
#include "kernel/host.hpp"
#include "kernel/identity_registry.hpp"
#include <ctime>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace pocket::kernel {

namespace {

constexpr const char* SUBSCRIBER = "session_updates";

std::string clock_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return buf;
}

} // namespace

SessionUpdates::SessionUpdates(EventBus& bus, SessionHost& host, AsyncTaskManager& tasks,
                               IdentityRegistry& registry, SessionUpdateConfig config)
    : bus_(bus)
    , host_(host)
    , tasks_(tasks)
    , registry_(registry)
    , config_(config) {
    std::vector<CoordinatorEventType> types;
    if (config_.status_update)      types.push_back(CoordinatorEventType::STATUS_UPDATE);
    if (config_.message_sent)       types.push_back(CoordinatorEventType::MESSAGE_SENT);
    if (config_.subagent_spawned)   types.push_back(CoordinatorEventType::SUBAGENT_SPAWNED);
    if (config_.subagent_completed) types.push_back(CoordinatorEventType::SUBAGENT_COMPLETED);
    if (config_.session_resumed)    types.push_back(CoordinatorEventType::SESSION_RESUMED);
    if (config_.user_message_sent)  types.push_back(CoordinatorEventType::USER_MESSAGE_SENT);
    if (!types.empty()) {
        bus_.subscribe(SUBSCRIBER, types);
    }
}

std::string SessionUpdates::format_line(const CoordinatorEvent& event) {
    const auto ts = clock_time(event.timestamp);
    const auto& d = event.data;
    const std::string agent = d.value("agent", "unknown");

    switch (event.type) {
        case CoordinatorEventType::STATUS_UPDATE:
            return fmt::format("[{}] [{}] status: {}", ts, agent, d.value("status", "unknown"));
        case CoordinatorEventType::MESSAGE_SENT:
            return fmt::format("[{}] [{}] -> [{}]: {}", ts, agent, d.value("recipient", "unknown"),
                               d.value("preview", ""));
        case CoordinatorEventType::SUBAGENT_SPAWNED:
            return fmt::format("[{}] [{}] spawned {}: {}", ts, agent, d.value("new_agent", "unknown"),
                               d.value("description", "no description"));
        case CoordinatorEventType::SUBAGENT_COMPLETED:
            return fmt::format("[{}] [{}] idle", ts, agent);
        case CoordinatorEventType::SESSION_RESUMED: {
            std::string line = fmt::format("[{}] [{}] resumed", ts, agent);
            std::string by = d.value("resumed_by", "");
            std::string reason = d.value("reason", "");
            if (!by.empty()) line += " by " + by;
            if (!reason.empty()) line += " (" + reason + ")";
            return line;
        }
        case CoordinatorEventType::USER_MESSAGE_SENT:
            return fmt::format("[{}] [user] -> [{}]: {}", ts, d.value("target", "unknown"),
                               d.value("preview", ""));
        default:
            return fmt::format("[{}] [{}] {}", ts, agent, event_type_to_string(event.type));
    }
}

void SessionUpdates::publish(CoordinatorEventType type, json data,
                             const std::string& session_id, const std::string& main_session_id) {
    std::string main = main_session_id;
    if (main.empty()) {
        main = registry_.root_of(session_id).value_or("");
    }
    if (main.empty()) {
        spdlog::debug("No main session for {} update from {}", event_type_to_string(type), session_id);
        return;
    }

    data["main_session"] = main;
    bus_.emit(type, data, session_id);
    tasks_.submit("session-update", [this]() { flush(); });
}

size_t SessionUpdates::flush() {
    size_t delivered = 0;
    while (true) {
        auto events = bus_.poll(SUBSCRIBER, 32);
        if (events.empty()) {
            return delivered;
        }
        for (const auto& event : events) {
            std::string main = event.data.value("main_session", "");
            auto line = format_line(event);
            auto status = host_.notify(main, line);
            if (!status.success) {
                spdlog::warn("Session update to {} failed: {}", main, status.error);
                continue;
            }
            spdlog::debug("Session update -> {}: {}", main, line);
            ++delivered;
        }
    }
}

void SessionUpdates::status_update(const std::string& session_id, const std::string& alias,
                                   const std::string& status) {
    if (!config_.status_update) return;
    publish(CoordinatorEventType::STATUS_UPDATE, {{"agent", alias}, {"status", status}}, session_id, "");
}

void SessionUpdates::message_sent(const std::string& session_id, const std::string& from_alias,
                                  const std::string& to_alias, const std::string& preview) {
    if (!config_.message_sent) return;
    publish(CoordinatorEventType::MESSAGE_SENT,
            {{"agent", from_alias}, {"recipient", to_alias}, {"preview", preview}}, session_id, "");
}

void SessionUpdates::subagent_spawned(const std::string& session_id, const std::string& spawner_alias,
                                      const std::string& new_alias, const std::string& description) {
    if (!config_.subagent_spawned) return;
    publish(CoordinatorEventType::SUBAGENT_SPAWNED,
            {{"agent", spawner_alias}, {"new_agent", new_alias}, {"description", description}},
            session_id, "");
}

void SessionUpdates::subagent_completed(const std::string& session_id, const std::string& alias) {
    if (!config_.subagent_completed) return;
    publish(CoordinatorEventType::SUBAGENT_COMPLETED, {{"agent", alias}}, session_id, "");
}

void SessionUpdates::session_resumed(const std::string& session_id, const std::string& alias,
                                     const std::string& resumed_by, const std::string& reason) {
    if (!config_.session_resumed) return;
    publish(CoordinatorEventType::SESSION_RESUMED,
            {{"agent", alias}, {"resumed_by", resumed_by}, {"reason", reason}}, session_id, "");
}

void SessionUpdates::user_message_sent(const std::string& main_session_id, const std::string& target_alias,
                                       const std::string& preview) {
    if (!config_.user_message_sent) return;
    publish(CoordinatorEventType::USER_MESSAGE_SENT,
            {{"agent", "user"}, {"target", target_alias}, {"preview", preview}}, "", main_session_id);
}

} // namespace pocket::kernel
