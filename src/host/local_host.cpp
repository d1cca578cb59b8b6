#include "host/local_host.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace pocket::host {

using kernel::CreateSessionResult;
using kernel::HostMessage;
using kernel::HostPart;
using kernel::HostStatus;
using kernel::MessagesResult;
using kernel::ParentResult;

LocalHost::LocalHost()
    : responder_([](const std::string&, const std::string& prompt) {
          return "Done: " + prompt.substr(0, 40);
      }) {}

LocalHost::LocalHost(Responder responder)
    : responder_(std::move(responder)) {}

void LocalHost::set_responder(Responder responder) {
    std::lock_guard<std::mutex> lock(mutex_);
    responder_ = std::move(responder);
}

void LocalHost::add_session(const std::string& session_id, const std::string& parent_id,
                            const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(session_id) == 0) {
        order_.push_back(session_id);
    }
    auto& session = sessions_[session_id];
    session.id = session_id;
    session.parent_id = parent_id;
    session.title = title;
}

void LocalHost::add_message(const std::string& session_id, const HostMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session_id].messages.push_back(message);
}

std::string LocalHost::next_message_id() {
    return fmt::format("msg_{:04}", next_message_++);
}

CreateSessionResult LocalHost::create_session(const std::string& parent_id, const std::string& title) {
    CreateSessionResult result;
    if (fail_create_) {
        result.error = "session creation disabled";
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!parent_id.empty() && sessions_.count(parent_id) == 0) {
        result.error = "parent session not found: " + parent_id;
        return result;
    }

    std::string id = fmt::format("ses_{:04}", next_session_++);
    Session session;
    session.id = id;
    session.parent_id = parent_id;
    session.title = title;
    sessions_[id] = std::move(session);
    order_.push_back(id);

    spdlog::debug("LocalHost created session {} under {} ({})", id, parent_id, title);
    result.success = true;
    result.session_id = id;
    return result;
}

ParentResult LocalHost::get_parent(const std::string& session_id) {
    ++parent_lookups_;
    ParentResult result;
    if (fail_parent_lookups_) {
        result.error = "host unavailable";
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        result.error = "session not found: " + session_id;
        return result;
    }
    result.success = true;
    result.parent_id = it->second.parent_id;
    return result;
}

MessagesResult LocalHost::list_messages(const std::string& session_id) {
    MessagesResult result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        result.error = "session not found: " + session_id;
        return result;
    }
    result.success = true;
    result.messages = it->second.messages;
    return result;
}

HostStatus LocalHost::prompt(const std::string& session_id, const std::string& text) {
    HostStatus status;
    Responder responder;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            status.error = "session not found: " + session_id;
            return status;
        }
        it->second.prompts.push_back(text);
        it->second.messages.push_back(HostMessage{next_message_id(), "user", {HostPart{"text", text, ""}}});
        responder = responder_;
    }

    if (fail_prompts_) {
        status.error = "prompt rejected";
        return status;
    }

    std::string reply = responder ? responder(session_id, text) : std::string();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[session_id].messages.push_back(
            HostMessage{next_message_id(), "assistant", {HostPart{"text", reply, ""}}});
    }
    status.success = true;
    return status;
}

HostStatus LocalHost::persist(const std::string& session_id, const std::string& text, bool synthetic) {
    HostStatus status;
    if (fail_persist_) {
        status.error = "persist rejected";
        return status;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(session_id) == 0) {
        status.error = "session not found: " + session_id;
        return status;
    }
    persisted_.push_back(PersistedMessage{session_id, text, synthetic});
    status.success = true;
    return status;
}

HostStatus LocalHost::notify(const std::string& session_id, const std::string& text) {
    HostStatus status;
    std::lock_guard<std::mutex> lock(mutex_);
    notices_.push_back(HostNotice{session_id, text});
    status.success = true;
    return status;
}

std::vector<PersistedMessage> LocalHost::persisted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return persisted_;
}

std::vector<HostNotice> LocalHost::notices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notices_;
}

std::vector<std::string> LocalHost::prompts_for(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return {};
    }
    return it->second.prompts;
}

std::vector<std::string> LocalHost::children_of(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> children;
    for (const auto& id : order_) {
        auto it = sessions_.find(id);
        if (it != sessions_.end() && it->second.parent_id == session_id) {
            children.push_back(id);
        }
    }
    return children;
}

std::string LocalHost::title(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() ? it->second.title : std::string();
}

size_t LocalHost::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace pocket::host
