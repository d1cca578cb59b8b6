#include "kernel/resume_engine.hpp"
#include "kernel/async_task_manager.hpp"
#include "kernel/host.hpp"
#include "kernel/identity_registry.hpp"
#include "kernel/mailbox.hpp"
#include "kernel/prompts.hpp"
#include "kernel/session_tracker.hpp"
#include "kernel/session_updates.hpp"
#include <spdlog/spdlog.h>

namespace pocket::kernel {

ResumeEngine::ResumeEngine(SessionHost& host, SessionTracker& tracker, MailboxStore& mailbox,
                           IdentityRegistry& registry, AsyncTaskManager& tasks,
                           SessionUpdates& updates, ResumeConfig config)
    : host_(host)
    , tracker_(tracker)
    , mailbox_(mailbox)
    , registry_(registry)
    , tasks_(tasks)
    , updates_(updates)
    , config_(config) {
    if (config_.max_chain_length < 1) {
        config_.max_chain_length = 1;
    }
}

bool ResumeEngine::resume(const std::string& session_id, const std::string& sender_alias) {
    return resume_with_prompt(session_id, prompts::resume_broadcast(sender_alias), sender_alias, "message");
}

bool ResumeEngine::resume_with_prompt(const std::string& session_id, const std::string& prompt,
                                      const std::string& resumed_by, const std::string& reason) {
    if (registry_.is_retired(session_id)) {
        spdlog::debug("Not resuming retired session {}", session_id);
        return false;
    }
    if (!tracker_.try_activate(session_id)) {
        spdlog::debug("Session {} is not idle, message will be read in context", session_id);
        return false;
    }
    return launch(session_id, prompt, resumed_by, reason);
}

bool ResumeEngine::resume_if_needed(const std::string& session_id) {
    if (!tracker_.is_idle(session_id) || registry_.is_retired(session_id)) {
        return false;
    }
    auto unread = mailbox_.needing_wake(session_id);
    if (unread.empty()) {
        return false;
    }
    if (!tracker_.try_activate(session_id)) {
        return false;
    }

    const auto first = unread.front();
    spdlog::info("Session {} idle with {} unread message(s), resuming",
                 registry_.alias(session_id), unread.size());
    mailbox_.mark_presented(session_id, {first.seq});
    return launch(session_id, prompts::resume_broadcast(first.from), first.from, "message");
}

bool ResumeEngine::launch(const std::string& session_id, const std::string& prompt,
                          const std::string& resumed_by, const std::string& reason) {
    const std::string alias = registry_.alias(session_id);
    spdlog::info("Resuming idle session {} ({}) for {}", alias, session_id, resumed_by);
    updates_.session_resumed(session_id, alias, resumed_by, reason);

    bool submitted = tasks_.submit("resume:" + alias, [this, session_id, prompt, resumed_by]() {
        run_chain(session_id, prompt, resumed_by);
    });
    if (!submitted) {
        settle(session_id);
        return false;
    }
    return true;
}

void ResumeEngine::settle(const std::string& session_id) {
    // A reset may have retired the session while it was prompted
    if (registry_.is_retired(session_id)) {
        return;
    }
    tracker_.mark_idle(session_id);
}

void ResumeEngine::run_chain(const std::string& session_id, std::string prompt, std::string resumed_by) {
    const std::string alias = registry_.alias(session_id);

    for (int link = 1; link <= config_.max_chain_length; ++link) {
        auto status = host_.prompt(session_id, prompt);
        settle(session_id);

        if (!status.success) {
            spdlog::error("Resume of {} failed: {}", alias, status.error);
            return;
        }
        spdlog::info("Resumed session {} completed, marked idle", alias);

        if (registry_.is_retired(session_id)) {
            return;
        }

        auto unread = mailbox_.needing_wake(session_id);
        if (unread.empty()) {
            return;
        }

        if (link == config_.max_chain_length) {
            spdlog::warn("Resume chain for {} stopped after {} prompts, {} message(s) left for context",
                         alias, link, unread.size());
            return;
        }

        if (!tracker_.try_activate(session_id)) {
            // Someone else picked the session up in the meantime
            return;
        }
        const auto& first = unread.front();
        // Presented before prompting again so it cannot trigger another wake
        mailbox_.mark_presented(session_id, {first.seq});

        spdlog::info("Session {} has {} new unread message(s), resuming again", alias, unread.size());
        resumed_by = first.from;
        prompt = prompts::resume_broadcast(first.from);
        updates_.session_resumed(session_id, alias, resumed_by, "message");
    }
}

} // namespace pocket::kernel
