#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "kernel/types.hpp"

namespace pocket::kernel {

// Parent cache entry
struct CachedParent {
    std::optional<std::string> parent_id;   // Empty = top-level session
    Clock::time_point expires_at;
    bool lookup_failed = false;             // Negative entry, retried sooner

    bool is_expired(Clock::time_point now) const {
        return now >= expires_at;
    }
};

// Short-lived session -> parent lookups, so parent walks do not hit the host
// on every hook.
class ParentCache {
public:
    ParentCache(std::chrono::milliseconds ttl, std::chrono::milliseconds failure_ttl);

    // Outer empty = miss. Inner empty = known top-level session.
    std::optional<std::optional<std::string>> get(const std::string& session_id,
                                                  Clock::time_point now = Clock::now());

    void put(const std::string& session_id, const std::optional<std::string>& parent_id,
             Clock::time_point now = Clock::now());

    // Remember a failed lookup as "no parent" for the failure ttl
    void put_failure(const std::string& session_id, Clock::time_point now = Clock::now());

    size_t expire(Clock::time_point now);
    size_t size() const;

private:
    std::chrono::milliseconds ttl_;
    std::chrono::milliseconds failure_ttl_;
    std::unordered_map<std::string, CachedParent> entries_;
    mutable std::mutex mutex_;
};

} // namespace pocket::kernel
