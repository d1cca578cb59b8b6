#include "kernel/session_tracker.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace pocket::kernel {

void SessionTracker::track(const std::string& session_id, const std::string& alias) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (states_.count(session_id) > 0) {
        return;
    }
    states_[session_id] = SessionState{session_id, alias, SessionStatus::ACTIVE, Clock::now()};
}

void SessionTracker::mark_active(const std::string& session_id, const std::string& alias) {
    set_status(session_id, alias, SessionStatus::ACTIVE);
}

void SessionTracker::mark_idle(const std::string& session_id, const std::string& alias) {
    set_status(session_id, alias, SessionStatus::IDLE);
    idle_cv_.notify_all();
}

void SessionTracker::set_status(const std::string& session_id, const std::string& alias,
                                SessionStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = states_[session_id];
    state.session_id = session_id;
    if (!alias.empty()) {
        state.alias = alias;
    }
    state.status = status;
    state.last_activity_at = Clock::now();
    spdlog::debug("Session {} ({}) -> {}", session_id, state.alias, session_status_to_string(status));
}

bool SessionTracker::try_activate(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(session_id);
    if (it == states_.end() || it->second.status != SessionStatus::IDLE) {
        return false;
    }
    it->second.status = SessionStatus::ACTIVE;
    it->second.last_activity_at = Clock::now();
    return true;
}

bool SessionTracker::is_idle(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(session_id);
    return it != states_.end() && it->second.status == SessionStatus::IDLE;
}

std::optional<SessionState> SessionTracker::state(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(session_id);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> SessionTracker::not_idle_locked(const std::vector<std::string>& session_ids) const {
    std::vector<std::string> waiting;
    for (const auto& id : session_ids) {
        auto it = states_.find(id);
        if (it == states_.end() || it->second.status != SessionStatus::IDLE) {
            waiting.push_back(id);
        }
    }
    return waiting;
}

std::vector<std::string> SessionTracker::wait_all_idle(const std::vector<std::string>& session_ids,
                                                       std::chrono::milliseconds timeout,
                                                       std::chrono::milliseconds poll) {
    auto deadline = Clock::now() + timeout;
    if (poll.count() <= 0) {
        poll = std::chrono::milliseconds(1);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        auto waiting = not_idle_locked(session_ids);
        if (waiting.empty()) {
            return waiting;
        }

        auto now = Clock::now();
        if (now >= deadline) {
            return waiting;
        }

        auto slice = std::min<Clock::duration>(poll, deadline - now);
        idle_cv_.wait_for(lock, slice);
    }
}

size_t SessionTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

void SessionTracker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.clear();
}

} // namespace pocket::kernel
