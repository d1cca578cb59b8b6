#include "kernel/delivery.hpp"
#include "kernel/config.hpp"
#include "kernel/host.hpp"
#include "kernel/mailbox.hpp"
#include "kernel/prompts.hpp"
#include "kernel/resume_engine.hpp"
#include "kernel/session_tracker.hpp"
#include <spdlog/spdlog.h>

namespace pocket::kernel {

InboxDelivery::InboxDelivery(MailboxStore& mailbox, ResumeEngine& resume)
    : mailbox_(mailbox)
    , resume_(resume) {}

void InboxDelivery::deliver(const SubagentCompletion& completion) {
    auto text = prompts::received_subagent_output(completion.subagent_alias, completion.output);
    mailbox_.send(completion.subagent_alias, completion.caller_session, text);

    if (resume_.resume_if_needed(completion.caller_session)) {
        spdlog::info("Piped {} output to idle caller {} via resume",
                     completion.subagent_alias, completion.caller_session);
    } else {
        spdlog::info("Piped {} output to caller {} via inbox",
                     completion.subagent_alias, completion.caller_session);
    }
}

UserMessageDelivery::UserMessageDelivery(SessionHost& host, SessionTracker& tracker, ResumeEngine& resume)
    : host_(host)
    , tracker_(tracker)
    , resume_(resume) {}

void UserMessageDelivery::deliver(const SubagentCompletion& completion) {
    auto formatted = prompts::format_subagent_output(completion.subagent_alias, completion.output);
    const auto& caller = completion.caller_session;

    if (tracker_.is_idle(caller)) {
        if (resume_.resume_with_prompt(caller, formatted, completion.subagent_alias, "subagent output")) {
            spdlog::info("Resumed idle caller {} with {} output", caller, completion.subagent_alias);
            return;
        }
        hold(caller, formatted);
        return;
    }

    auto status = host_.persist(caller, formatted, false);
    if (status.success) {
        spdlog::info("Persisted {} output into active caller {}", completion.subagent_alias, caller);
        return;
    }

    spdlog::warn("Failed to persist {} output into {}: {}, holding it",
                 completion.subagent_alias, caller, status.error);
    hold(caller, formatted);
}

void UserMessageDelivery::hold(const std::string& session_id, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& held = pending_[session_id];
    if (!held.empty()) {
        held += "\n\n";
    }
    held += text;
    spdlog::info("Holding subagent output for {} ({} chars)", session_id, held.size());
}

std::optional<std::string> UserMessageDelivery::take_pending(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(session_id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    std::string text = std::move(it->second);
    pending_.erase(it);
    return text;
}

void UserMessageDelivery::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();
}

std::unique_ptr<DeliveryStrategy> make_delivery_strategy(const SubagentConfig& config,
                                                         SessionHost& host,
                                                         MailboxStore& mailbox,
                                                         SessionTracker& tracker,
                                                         ResumeEngine& resume) {
    if (config.forced_attention) {
        return std::make_unique<InboxDelivery>(mailbox, resume);
    }
    return std::make_unique<UserMessageDelivery>(host, tracker, resume);
}

} // namespace pocket::kernel
