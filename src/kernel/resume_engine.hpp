#pragma once
#include <string>
#include "kernel/config.hpp"

namespace pocket::kernel {

class AsyncTaskManager;
class IdentityRegistry;
class MailboxStore;
class SessionHost;
class SessionTracker;
class SessionUpdates;

// Wakes idle sessions.
//
// A resume flips the session to active right away, then runs on the worker
// pool: prompt, mark idle, and if wake-worthy mail arrived meanwhile, flip it
// back to active, mark the first message presented and prompt again. A
// session is never idle with its wake mail already marked presented. A chain stops after
// max_chain_length prompts.
class ResumeEngine {
public:
    ResumeEngine(SessionHost& host, SessionTracker& tracker, MailboxStore& mailbox,
                 IdentityRegistry& registry, AsyncTaskManager& tasks,
                 SessionUpdates& updates, ResumeConfig config);

    // Notify an idle session that sender_alias wrote to it.
    // False if the session is not idle, retired, or the pool refused the work.
    bool resume(const std::string& session_id, const std::string& sender_alias);

    // Same, with the first prompt supplied by the caller
    bool resume_with_prompt(const std::string& session_id, const std::string& prompt,
                            const std::string& resumed_by, const std::string& reason);

    // Resume an idle session if it has mail it has neither replied to nor seen
    bool resume_if_needed(const std::string& session_id);

private:
    // Session already switched to active by the caller
    bool launch(const std::string& session_id, const std::string& prompt,
                const std::string& resumed_by, const std::string& reason);
    void settle(const std::string& session_id);
    void run_chain(const std::string& session_id, std::string prompt, std::string resumed_by);

    SessionHost& host_;
    SessionTracker& tracker_;
    MailboxStore& mailbox_;
    IdentityRegistry& registry_;
    AsyncTaskManager& tasks_;
    SessionUpdates& updates_;
    ResumeConfig config_;
};

} // namespace pocket::kernel
