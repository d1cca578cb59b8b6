#pragma once
#include <chrono>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace pocket::kernel {

// Agent activity worth mirroring into a main session
enum class CoordinatorEventType {
    STATUS_UPDATE,          // broadcast without a recipient
    MESSAGE_SENT,           // broadcast to one agent
    SUBAGENT_SPAWNED,
    SUBAGENT_COMPLETED,
    SESSION_RESUMED,
    USER_MESSAGE_SENT       // /pocket command
};

struct CoordinatorEvent {
    CoordinatorEventType type;
    nlohmann::json data;
    std::chrono::system_clock::time_point timestamp;
    std::string source_session;     // Session that triggered it, may be empty
};

inline std::string event_type_to_string(CoordinatorEventType type) {
    switch (type) {
        case CoordinatorEventType::STATUS_UPDATE:      return "STATUS_UPDATE";
        case CoordinatorEventType::MESSAGE_SENT:       return "MESSAGE_SENT";
        case CoordinatorEventType::SUBAGENT_SPAWNED:   return "SUBAGENT_SPAWNED";
        case CoordinatorEventType::SUBAGENT_COMPLETED: return "SUBAGENT_COMPLETED";
        case CoordinatorEventType::SESSION_RESUMED:    return "SESSION_RESUMED";
        case CoordinatorEventType::USER_MESSAGE_SENT:  return "USER_MESSAGE_SENT";
        default: return "UNKNOWN";
    }
}

class EventBus {
public:
    void emit(CoordinatorEventType type, const nlohmann::json& data, const std::string& source_session);
    void subscribe(const std::string& subscriber, const std::vector<CoordinatorEventType>& types);
    std::vector<CoordinatorEvent> poll(const std::string& subscriber, int max_events);

private:
    std::unordered_map<std::string, std::set<CoordinatorEventType>> subscriptions_;
    std::unordered_map<std::string, std::queue<CoordinatorEvent>> queues_;
    std::mutex mutex_;
};

} // namespace pocket::kernel
