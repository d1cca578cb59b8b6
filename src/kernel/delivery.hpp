#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pocket::kernel {

class IdentityRegistry;
class MailboxStore;
class ResumeEngine;
class SessionHost;
class SessionTracker;
struct SubagentConfig;

struct SubagentCompletion {
    std::string caller_session;
    std::string subagent_session;
    std::string subagent_alias;
    std::string output;
};

// How a finished subagent's output reaches the agent that spawned it
class DeliveryStrategy {
public:
    virtual ~DeliveryStrategy() = default;

    virtual const char* name() const = 0;
    virtual void deliver(const SubagentCompletion& completion) = 0;

    // Output held back for the session, removed on read
    virtual std::optional<std::string> take_pending(const std::string& session_id) {
        (void)session_id;
        return std::nullopt;
    }

    virtual void reset() {}
};

// Output lands in the caller's mailbox. An idle caller is woken for it.
class InboxDelivery : public DeliveryStrategy {
public:
    InboxDelivery(MailboxStore& mailbox, ResumeEngine& resume);

    const char* name() const override { return "inbox"; }
    void deliver(const SubagentCompletion& completion) override;

private:
    MailboxStore& mailbox_;
    ResumeEngine& resume_;
};

// Output is shown as a user message. An active caller gets it persisted into
// its session; an idle caller is resumed with it. Whatever cannot be
// delivered that way is held until the caller's next context assembly or
// completion barrier.
class UserMessageDelivery : public DeliveryStrategy {
public:
    UserMessageDelivery(SessionHost& host, SessionTracker& tracker, ResumeEngine& resume);

    const char* name() const override { return "user_message"; }
    void deliver(const SubagentCompletion& completion) override;
    std::optional<std::string> take_pending(const std::string& session_id) override;
    void reset() override;

private:
    void hold(const std::string& session_id, const std::string& text);

    SessionHost& host_;
    SessionTracker& tracker_;
    ResumeEngine& resume_;
    std::unordered_map<std::string, std::string> pending_;
    std::mutex mutex_;
};

std::unique_ptr<DeliveryStrategy> make_delivery_strategy(const SubagentConfig& config,
                                                         SessionHost& host,
                                                         MailboxStore& mailbox,
                                                         SessionTracker& tracker,
                                                         ResumeEngine& resume);

} // namespace pocket::kernel
