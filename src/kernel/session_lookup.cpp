#include "kernel/session_lookup.hpp"
#include "kernel/host.hpp"
#include "kernel/parent_cache.hpp"
#include "kernel/prompts.hpp"
#include <spdlog/spdlog.h>

namespace pocket::kernel {

SessionLookup::SessionLookup(SessionHost& host, ParentCache& cache)
    : host_(host)
    , cache_(cache) {}

std::optional<std::string> SessionLookup::parent_of(const std::string& session_id) {
    if (auto cached = cache_.get(session_id)) {
        return *cached;
    }

    auto result = host_.get_parent(session_id);
    if (!result.success) {
        spdlog::warn("Failed to get parent of {}: {}", session_id, result.error);
        cache_.put_failure(session_id);
        return std::nullopt;
    }

    std::optional<std::string> parent;
    if (!result.parent_id.empty()) {
        parent = result.parent_id;
    }
    cache_.put(session_id, parent);
    spdlog::debug("Parent of {} is {}", session_id, parent ? *parent : "none");
    return parent;
}

bool SessionLookup::is_child(const std::string& session_id) {
    return parent_of(session_id).has_value();
}

bool SessionLookup::is_first_level(const std::string& session_id) {
    auto parent = parent_of(session_id);
    return parent && !parent_of(*parent);
}

std::string SessionLookup::root_of(const std::string& session_id) {
    std::string current = session_id;
    for (int hop = 0; hop < MAX_HOPS; ++hop) {
        auto parent = parent_of(current);
        if (!parent) {
            return current;
        }
        current = *parent;
    }
    spdlog::warn("Session tree above {} deeper than {} hops, using {} as root",
                 session_id, MAX_HOPS, current);
    return current;
}

std::string SessionLookup::final_output(const std::string& session_id, const std::string& alias) {
    auto result = host_.list_messages(session_id);
    if (!result.success) {
        spdlog::warn("Failed to list messages of {}: {}", session_id, result.error);
        return prompts::agent_completed(alias);
    }

    const HostMessage* last_assistant = nullptr;
    for (const auto& message : result.messages) {
        if (message.role == "assistant") {
            last_assistant = &message;
        }
    }
    if (!last_assistant) {
        spdlog::warn("No assistant messages in session {} ({})", session_id, alias);
        return prompts::agent_completed(alias);
    }

    std::string text;
    std::string tool_summary;
    for (const auto& part : last_assistant->parts) {
        if (part.type == "text" && !part.text.empty()) {
            text = part.text;
        } else if (part.type == "tool") {
            if (!tool_summary.empty()) {
                tool_summary += "\n";
            }
            tool_summary += "- " + part.tool + ": " + (part.text.empty() ? "completed" : part.text);
        }
    }

    if (!text.empty()) {
        spdlog::info("Extracted {} chars of output from {} ({})", text.size(), session_id, alias);
        return text;
    }
    if (!tool_summary.empty()) {
        return prompts::agent_completed_with_summary(alias, tool_summary);
    }
    return prompts::agent_completed(alias);
}

} // namespace pocket::kernel
