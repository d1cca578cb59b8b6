#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "kernel/types.hpp"

namespace pocket::kernel {

// Alias <-> session id registry for the live universe.
//
// Aliases come from a single counter that survives reset(), so an alias is
// never handed out twice in one process. Sessions dropped by reset() are
// retired for good: a late callback cannot register them again.
class IdentityRegistry {
public:
    // Returns the alias (existing or new). Empty for retired sessions.
    std::optional<std::string> register_session(const std::string& session_id,
                                                const std::string& root_id);

    // Alias, or the raw session id if unknown
    std::string alias(const std::string& session_id) const;
    std::optional<std::string> find_alias(const std::string& session_id) const;

    // Alias table first, then a live raw session id
    std::optional<std::string> resolve(const std::string& alias_or_session_id) const;

    std::optional<std::string> root_of(const std::string& session_id) const;

    // Live identities sharing the session's root, self excluded, in registration order
    std::vector<AgentIdentity> peers(const std::string& session_id) const;
    std::vector<AgentIdentity> live() const;

    bool is_live(const std::string& session_id) const;
    bool is_retired(const std::string& session_id) const;

    // Spawn-chain depth used for subagent limits. First-level children are 1.
    void set_depth(const std::string& session_id, int depth);
    int depth(const std::string& session_id) const;

    void mark_announced(const std::string& session_id);
    bool announced(const std::string& session_id) const;

    // Retire every live session and clear the live tables. Returns retired ids.
    std::vector<std::string> reset();

    size_t size() const;

    static std::string alias_for_index(uint64_t index);

private:
    std::vector<AgentIdentity> identities_;                  // Registration order
    std::unordered_map<std::string, std::string> session_to_alias_;
    std::unordered_map<std::string, std::string> alias_to_session_;
    std::unordered_map<std::string, std::string> session_root_;
    std::unordered_map<std::string, int> depths_;
    std::unordered_set<std::string> announced_;
    std::unordered_set<std::string> retired_;
    uint64_t next_index_ = 0;
    mutable std::mutex mutex_;
};

} // namespace pocket::kernel
