#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "kernel/types.hpp"

namespace pocket::kernel {

struct CoordinatorRef {
    std::string session_id;
    std::string alias;
};

// Bookkeeping for one batch of agents under a main session: spawned
// subagents, task descriptions waiting for their child, first-level
// children still running, and the summary once they are all done.
class Universe {
public:
    // Spawned subagents
    void add_subagent(const SubagentInfo& info);
    std::optional<SubagentInfo> subagent(const std::string& session_id) const;
    // Returns false if unknown or already completed
    bool complete_subagent(const std::string& session_id, const std::string& output);
    // Subagents spawned by caller not yet announced in its context
    std::vector<SubagentInfo> take_subagent_notices(const std::string& caller_session);

    // task tool descriptions, applied to children in call order
    void push_task_description(const std::string& parent_session, const std::string& description);
    std::optional<std::string> pop_task_description(const std::string& parent_session);

    // First-level children of a main session. Returns false if the child already completed.
    bool track_first_level(const std::string& main_session, const std::string& child_session,
                           const std::string& child_alias);
    // Returns the number still running, or empty if the main session was not tracked
    std::optional<size_t> complete_first_level(const std::string& main_session,
                                               const std::string& child_session);
    std::optional<CoordinatorRef> coordinator(const std::string& main_session) const;

    // Universe id is the first first-level child's session id
    std::optional<std::string> pocket_id() const;

    void set_summary(const std::string& main_session, const std::string& summary);
    std::optional<std::string> summary(const std::string& main_session) const;

    // Clears everything tied to the live universe. Summaries stay.
    void reset();

private:
    std::unordered_map<std::string, SubagentInfo> subagents_;
    std::unordered_map<std::string, std::vector<std::string>> notices_;    // caller -> subagent ids
    std::unordered_map<std::string, std::vector<std::string>> task_descriptions_;
    std::unordered_map<std::string, std::unordered_set<std::string>> active_children_;
    std::unordered_map<std::string, std::unordered_set<std::string>> completed_children_;
    std::unordered_map<std::string, CoordinatorRef> coordinators_;
    std::unordered_map<std::string, std::string> summaries_;
    std::optional<std::string> pocket_id_;
    mutable std::mutex mutex_;
};

} // namespace pocket::kernel
