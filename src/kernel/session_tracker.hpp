#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "kernel/types.hpp"

namespace pocket::kernel {

// Coarse active/idle state per session.
class SessionTracker {
public:
    // Start tracking as active unless a state already exists
    void track(const std::string& session_id, const std::string& alias);

    void mark_active(const std::string& session_id, const std::string& alias = "");
    void mark_idle(const std::string& session_id, const std::string& alias = "");

    // idle -> active in one step. False if the session is not idle.
    bool try_activate(const std::string& session_id);

    bool is_idle(const std::string& session_id) const;
    std::optional<SessionState> state(const std::string& session_id) const;

    // Block until every id is idle or the timeout passes, waking at least every
    // poll interval. Returns the ids still not idle.
    std::vector<std::string> wait_all_idle(const std::vector<std::string>& session_ids,
                                           std::chrono::milliseconds timeout,
                                           std::chrono::milliseconds poll);

    size_t size() const;
    void reset();

private:
    void set_status(const std::string& session_id, const std::string& alias, SessionStatus status);
    std::vector<std::string> not_idle_locked(const std::vector<std::string>& session_ids) const;

    std::unordered_map<std::string, SessionState> states_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
};

} // namespace pocket::kernel
