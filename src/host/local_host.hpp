#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "kernel/host.hpp"

namespace pocket::host {

struct PersistedMessage {
    std::string session_id;
    std::string text;
    bool synthetic = false;
};

struct HostNotice {
    std::string session_id;
    std::string text;
};

// In-process session host. Sessions answer prompts through a responder
// callback that runs on the prompting thread, outside the host lock.
class LocalHost : public kernel::SessionHost {
public:
    // Returns the assistant reply for a prompt
    using Responder = std::function<std::string(const std::string& session_id, const std::string& prompt)>;

    LocalHost();
    explicit LocalHost(Responder responder);

    void set_responder(Responder responder);

    // Add a session with a fixed id, e.g. the main session
    void add_session(const std::string& session_id, const std::string& parent_id = "",
                     const std::string& title = "");
    void add_message(const std::string& session_id, const kernel::HostMessage& message);

    // Failure injection
    void fail_prompts(bool fail) { fail_prompts_ = fail; }
    void fail_create(bool fail) { fail_create_ = fail; }
    void fail_persist(bool fail) { fail_persist_ = fail; }
    void fail_parent_lookups(bool fail) { fail_parent_lookups_ = fail; }

    // SessionHost
    kernel::CreateSessionResult create_session(const std::string& parent_id, const std::string& title) override;
    kernel::ParentResult get_parent(const std::string& session_id) override;
    kernel::MessagesResult list_messages(const std::string& session_id) override;
    kernel::HostStatus prompt(const std::string& session_id, const std::string& text) override;
    kernel::HostStatus persist(const std::string& session_id, const std::string& text, bool synthetic) override;
    kernel::HostStatus notify(const std::string& session_id, const std::string& text) override;

    // Inspection
    std::vector<PersistedMessage> persisted() const;
    std::vector<HostNotice> notices() const;
    std::vector<std::string> prompts_for(const std::string& session_id) const;
    std::vector<std::string> children_of(const std::string& session_id) const;
    std::string title(const std::string& session_id) const;
    size_t session_count() const;
    uint64_t parent_lookups() const { return parent_lookups_; }

private:
    struct Session {
        std::string id;
        std::string parent_id;
        std::string title;
        std::vector<kernel::HostMessage> messages;
        std::vector<std::string> prompts;
    };

    std::string next_message_id();

    std::unordered_map<std::string, Session> sessions_;
    std::vector<std::string> order_;
    std::vector<PersistedMessage> persisted_;
    std::vector<HostNotice> notices_;
    Responder responder_;
    uint64_t next_session_ = 1;
    uint64_t next_message_ = 1;
    mutable std::mutex mutex_;

    std::atomic<bool> fail_prompts_{false};
    std::atomic<bool> fail_create_{false};
    std::atomic<bool> fail_persist_{false};
    std::atomic<bool> fail_parent_lookups_{false};
    std::atomic<uint64_t> parent_lookups_{0};
};

} // namespace pocket::host
