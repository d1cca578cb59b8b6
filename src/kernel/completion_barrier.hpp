#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "kernel/config.hpp"

namespace pocket::kernel {

class SessionTracker;
class MailboxStore;
class IdentityRegistry;

struct BarrierOutcome {
    enum class Kind {
        SATISFIED,      // Nothing left to wait for
        RESUME,         // Host must re-run the caller with resume_prompt, then call again
        ABANDONED       // Iteration cap hit, caller completes anyway
    };

    Kind kind = Kind::SATISFIED;
    std::string resume_prompt;
    int iterations = 0;
};

std::string barrier_outcome_to_string(BarrierOutcome::Kind kind);

// Holds a caller's completion until its fire-and-forget children are idle
// with no wake-worthy mail, and the caller itself has nothing left to read.
// Level-triggered: state is re-read every iteration, so children or mail
// added between polls are picked up.
class CompletionBarrier {
public:
    // Returns and clears a held output for the caller, if any
    using PendingOutputFn = std::function<std::optional<std::string>(const std::string&)>;

    CompletionBarrier(SessionTracker& tracker, MailboxStore& mailbox,
                      IdentityRegistry& registry, BarrierConfig config = {});

    void add_pending(const std::string& caller, const std::string& child);
    void remove_pending(const std::string& caller, const std::string& child);
    std::vector<std::string> pending(const std::string& caller) const;
    bool has_pending(const std::string& caller) const;

    void set_pending_output_source(PendingOutputFn fn);

    BarrierOutcome await(const std::string& caller);

    void reset();

private:
    SessionTracker& tracker_;
    MailboxStore& mailbox_;
    IdentityRegistry& registry_;
    BarrierConfig config_;
    PendingOutputFn pending_output_;

    std::unordered_map<std::string, std::vector<std::string>> pending_;
    mutable std::mutex mutex_;
};

} // namespace pocket::kernel
