#include "kernel/parent_cache.hpp"

namespace pocket::kernel {

ParentCache::ParentCache(std::chrono::milliseconds ttl, std::chrono::milliseconds failure_ttl)
    : ttl_(ttl)
    , failure_ttl_(failure_ttl) {}

std::optional<std::optional<std::string>> ParentCache::get(const std::string& session_id,
                                                           Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(session_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (it->second.is_expired(now)) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.parent_id;
}

void ParentCache::put(const std::string& session_id, const std::optional<std::string>& parent_id,
                      Clock::time_point now) {
    CachedParent entry;
    entry.parent_id = parent_id;
    entry.expires_at = now + ttl_;

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[session_id] = std::move(entry);
}

void ParentCache::put_failure(const std::string& session_id, Clock::time_point now) {
    CachedParent entry;
    entry.expires_at = now + failure_ttl_;
    entry.lookup_failed = true;

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[session_id] = std::move(entry);
}

size_t ParentCache::expire(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->second.is_expired(now)) {
            it = entries_.erase(it);
            ++removed;
            continue;
        }
        ++it;
    }
    return removed;
}

size_t ParentCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace pocket::kernel
