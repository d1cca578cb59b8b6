#include "kernel/event_bus.hpp"
#include <spdlog/spdlog.h>

namespace pocket::kernel {

void EventBus::emit(CoordinatorEventType type, const nlohmann::json& data, const std::string& source_session) {
    std::lock_guard<std::mutex> lock(mutex_);

    CoordinatorEvent event;
    event.type = type;
    event.data = data;
    event.timestamp = std::chrono::system_clock::now();
    event.source_session = source_session;

    for (const auto& [subscriber, types] : subscriptions_) {
        if (types.count(type) > 0) {
            queues_[subscriber].push(event);
            spdlog::debug("Event {} queued for {}", event_type_to_string(type), subscriber);
        }
    }
}

void EventBus::subscribe(const std::string& subscriber, const std::vector<CoordinatorEventType>& types) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& subs = subscriptions_[subscriber];
    for (auto type : types) {
        subs.insert(type);
    }
}

std::vector<CoordinatorEvent> EventBus::poll(const std::string& subscriber, int max_events) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<CoordinatorEvent> events;
    auto it = queues_.find(subscriber);
    if (it == queues_.end()) {
        return events;
    }

    auto& queue = it->second;
    while (!queue.empty() && static_cast<int>(events.size()) < max_events) {
        events.push_back(std::move(queue.front()));
        queue.pop();
    }
    return events;
}

} // namespace pocket::kernel
