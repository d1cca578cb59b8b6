#include "kernel/completion_barrier.hpp"
#include "kernel/identity_registry.hpp"
#include "kernel/mailbox.hpp"
#include "kernel/prompts.hpp"
#include "kernel/session_tracker.hpp"
#include <algorithm>
#include <thread>
#include <spdlog/spdlog.h>

namespace pocket::kernel {

std::string barrier_outcome_to_string(BarrierOutcome::Kind kind) {
    switch (kind) {
        case BarrierOutcome::Kind::SATISFIED: return "SATISFIED";
        case BarrierOutcome::Kind::RESUME:    return "RESUME";
        case BarrierOutcome::Kind::ABANDONED: return "ABANDONED";
        default: return "UNKNOWN";
    }
}

CompletionBarrier::CompletionBarrier(SessionTracker& tracker, MailboxStore& mailbox,
                                     IdentityRegistry& registry, BarrierConfig config)
    : tracker_(tracker)
    , mailbox_(mailbox)
    , registry_(registry)
    , config_(config) {}

void CompletionBarrier::add_pending(const std::string& caller, const std::string& child) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& children = pending_[caller];
    if (std::find(children.begin(), children.end(), child) == children.end()) {
        children.push_back(child);
    }
}

void CompletionBarrier::remove_pending(const std::string& caller, const std::string& child) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(caller);
    if (it == pending_.end()) {
        return;
    }
    auto& children = it->second;
    children.erase(std::remove(children.begin(), children.end(), child), children.end());
    if (children.empty()) {
        pending_.erase(it);
    }
}

std::vector<std::string> CompletionBarrier::pending(const std::string& caller) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(caller);
    if (it == pending_.end()) {
        return {};
    }
    return it->second;
}

bool CompletionBarrier::has_pending(const std::string& caller) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(caller);
    return it != pending_.end() && !it->second.empty();
}

void CompletionBarrier::set_pending_output_source(PendingOutputFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_output_ = std::move(fn);
}

BarrierOutcome CompletionBarrier::await(const std::string& caller) {
    const std::string alias = registry_.alias(caller);
    BarrierOutcome outcome;

    PendingOutputFn pending_output;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_output = pending_output_;
    }

    for (int iteration = 1; iteration <= config_.max_iterations; ++iteration) {
        outcome.iterations = iteration;

        auto children = pending(caller);
        if (!children.empty()) {
            spdlog::info("Barrier for {}: waiting on {} child(ren) (iteration {})",
                         alias, children.size(), iteration);

            auto still_busy = tracker_.wait_all_idle(children, config_.child_wait_timeout,
                                                     config_.poll_interval);

            size_t drained = 0;
            for (const auto& child : children) {
                bool busy = std::find(still_busy.begin(), still_busy.end(), child) != still_busy.end();
                // Idle but with unread mail means it will be resumed again
                if (!mailbox_.needing_wake(child).empty()) {
                    continue;
                }
                // Read after the mail: a wake activates the child before marking its mail presented
                if (!busy && !tracker_.is_idle(child)) {
                    continue;
                }
                if (busy) {
                    spdlog::warn("Barrier for {}: gave up waiting on {} after {} ms",
                                 alias, registry_.alias(child), config_.child_wait_timeout.count());
                }
                remove_pending(caller, child);
                ++drained;
            }

            spdlog::info("Barrier for {}: {} of {} child(ren) drained",
                         alias, drained, children.size());

            if (drained == 0) {
                std::this_thread::sleep_for(config_.poll_interval);
            }
            continue;
        }

        if (pending_output) {
            auto output = pending_output(caller);
            if (output) {
                spdlog::info("Barrier for {}: resuming with held subagent output ({} chars)",
                             alias, output->size());
                outcome.kind = BarrierOutcome::Kind::RESUME;
                outcome.resume_prompt = *output;
                return outcome;
            }
        }

        auto unread = mailbox_.needing_wake(caller);
        if (!unread.empty()) {
            const auto& first = unread.front();
            // Presented before the resume so the resume itself cannot re-trigger it
            mailbox_.mark_presented(caller, {first.seq});
            spdlog::info("Barrier for {}: {} unread message(s), resuming", alias, unread.size());
            outcome.kind = BarrierOutcome::Kind::RESUME;
            outcome.resume_prompt = prompts::resume_broadcast(first.from);
            return outcome;
        }

        spdlog::info("Barrier for {}: all done after {} iteration(s)", alias, iteration);
        outcome.kind = BarrierOutcome::Kind::SATISFIED;
        return outcome;
    }

    spdlog::error("Barrier for {}: abandoned after {} iterations, {} child(ren) still pending",
                  alias, config_.max_iterations, pending(caller).size());
    outcome.kind = BarrierOutcome::Kind::ABANDONED;
    return outcome;
}

void CompletionBarrier::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();
}

} // namespace pocket::kernel
