#include "kernel/identity_registry.hpp"
#include <spdlog/spdlog.h>

namespace pocket::kernel {

std::string IdentityRegistry::alias_for_index(uint64_t index) {
    std::string alias = "agent";
    alias += static_cast<char>('A' + index % 26);
    if (index >= 26) {
        alias += std::to_string(index / 26);
    }
    return alias;
}

std::optional<std::string> IdentityRegistry::register_session(const std::string& session_id,
                                                              const std::string& root_id) {
    if (session_id.empty()) {
        return std::nullopt;
    }

    // Held across lookup and allocation so racing callers see one alias.
    std::lock_guard<std::mutex> lock(mutex_);

    if (retired_.count(session_id) > 0) {
        spdlog::debug("Skipping registration for retired session {}", session_id);
        return std::nullopt;
    }

    auto it = session_to_alias_.find(session_id);
    if (it != session_to_alias_.end()) {
        return it->second;
    }

    std::string alias = alias_for_index(next_index_++);
    session_to_alias_[session_id] = alias;
    alias_to_session_[alias] = session_id;
    session_root_[session_id] = root_id;
    identities_.push_back(AgentIdentity{session_id, alias, root_id});

    spdlog::info("Session {} registered as {} (root={}, live={})",
                 session_id, alias, root_id, identities_.size());
    return alias;
}

std::string IdentityRegistry::alias(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = session_to_alias_.find(session_id);
    return it != session_to_alias_.end() ? it->second : session_id;
}

std::optional<std::string> IdentityRegistry::find_alias(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = session_to_alias_.find(session_id);
    if (it == session_to_alias_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> IdentityRegistry::resolve(const std::string& alias_or_session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = alias_to_session_.find(alias_or_session_id);
    if (it != alias_to_session_.end()) {
        return it->second;
    }
    if (session_to_alias_.count(alias_or_session_id) > 0) {
        return alias_or_session_id;
    }
    return std::nullopt;
}

std::optional<std::string> IdentityRegistry::root_of(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = session_root_.find(session_id);
    if (it == session_root_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AgentIdentity> IdentityRegistry::peers(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string self_root;
    auto root_it = session_root_.find(session_id);
    if (root_it != session_root_.end()) {
        self_root = root_it->second;
    }

    std::vector<AgentIdentity> result;
    for (const auto& identity : identities_) {
        if (identity.session_id == session_id) {
            continue;
        }
        // Agents never see across main sessions
        if (!self_root.empty() && identity.root_id != self_root) {
            continue;
        }
        result.push_back(identity);
    }
    return result;
}

std::vector<AgentIdentity> IdentityRegistry::live() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return identities_;
}

bool IdentityRegistry::is_live(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_to_alias_.count(session_id) > 0;
}

bool IdentityRegistry::is_retired(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retired_.count(session_id) > 0;
}

void IdentityRegistry::set_depth(const std::string& session_id, int depth) {
    std::lock_guard<std::mutex> lock(mutex_);
    depths_[session_id] = depth;
}

int IdentityRegistry::depth(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = depths_.find(session_id);
    return it != depths_.end() ? it->second : 1;
}

void IdentityRegistry::mark_announced(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    announced_.insert(session_id);
}

bool IdentityRegistry::announced(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return announced_.count(session_id) > 0;
}

std::vector<std::string> IdentityRegistry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> retired;
    retired.reserve(identities_.size());
    for (const auto& identity : identities_) {
        retired_.insert(identity.session_id);
        retired.push_back(identity.session_id);
    }

    identities_.clear();
    session_to_alias_.clear();
    alias_to_session_.clear();
    session_root_.clear();
    depths_.clear();
    announced_.clear();

    spdlog::info("Identity registry reset, {} sessions retired (next alias {})",
                 retired.size(), alias_for_index(next_index_));
    return retired;
}

size_t IdentityRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return identities_.size();
}

} // namespace pocket::kernel
