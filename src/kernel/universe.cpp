#include "kernel/universe.hpp"
#include <spdlog/spdlog.h>

namespace pocket::kernel {

void Universe::add_subagent(const SubagentInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    subagents_[info.session_id] = info;
    notices_[info.parent_session_id].push_back(info.session_id);
}

std::optional<SubagentInfo> Universe::subagent(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subagents_.find(session_id);
    if (it == subagents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Universe::complete_subagent(const std::string& session_id, const std::string& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subagents_.find(session_id);
    if (it == subagents_.end() || it->second.completed) {
        return false;
    }
    it->second.completed = true;
    it->second.output = output;
    return true;
}

std::vector<SubagentInfo> Universe::take_subagent_notices(const std::string& caller_session) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SubagentInfo> result;
    auto it = notices_.find(caller_session);
    if (it == notices_.end()) {
        return result;
    }
    for (const auto& id : it->second) {
        auto info = subagents_.find(id);
        if (info != subagents_.end()) {
            result.push_back(info->second);
        }
    }
    notices_.erase(it);
    return result;
}

void Universe::push_task_description(const std::string& parent_session, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    task_descriptions_[parent_session].push_back(description);
}

std::optional<std::string> Universe::pop_task_description(const std::string& parent_session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = task_descriptions_.find(parent_session);
    if (it == task_descriptions_.end() || it->second.empty()) {
        return std::nullopt;
    }
    std::string description = it->second.front();
    it->second.erase(it->second.begin());
    if (it->second.empty()) {
        task_descriptions_.erase(it);
    }
    return description;
}

bool Universe::track_first_level(const std::string& main_session, const std::string& child_session,
                                 const std::string& child_alias) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!pocket_id_) {
        pocket_id_ = child_session;
        spdlog::info("Pocket universe started under {} by {}", main_session, child_alias);
    }
    if (coordinators_.count(main_session) == 0) {
        coordinators_[main_session] = CoordinatorRef{child_session, child_alias};
        spdlog::info("Coordinator for {} is {}", main_session, child_alias);
    }

    auto done = completed_children_.find(main_session);
    if (done != completed_children_.end() && done->second.count(child_session) > 0) {
        return false;
    }

    auto& children = active_children_[main_session];
    if (children.insert(child_session).second) {
        spdlog::info("Tracking first-level child {} of {} ({} active)",
                     child_alias, main_session, children.size());
    }
    return true;
}

std::optional<size_t> Universe::complete_first_level(const std::string& main_session,
                                                     const std::string& child_session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_children_.find(main_session);
    if (it == active_children_.end()) {
        return std::nullopt;
    }
    it->second.erase(child_session);
    completed_children_[main_session].insert(child_session);

    size_t remaining = it->second.size();
    if (remaining == 0) {
        active_children_.erase(it);
    }
    return remaining;
}

std::optional<CoordinatorRef> Universe::coordinator(const std::string& main_session) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = coordinators_.find(main_session);
    if (it == coordinators_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> Universe::pocket_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pocket_id_;
}

void Universe::set_summary(const std::string& main_session, const std::string& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    summaries_[main_session] = summary;
}

std::optional<std::string> Universe::summary(const std::string& main_session) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = summaries_.find(main_session);
    if (it == summaries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Universe::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    subagents_.clear();
    notices_.clear();
    task_descriptions_.clear();
    active_children_.clear();
    completed_children_.clear();
    coordinators_.clear();
    pocket_id_.reset();
}

} // namespace pocket::kernel
