#include "kernel/reaper.hpp"
#include "kernel/mailbox.hpp"
#include "kernel/parent_cache.hpp"
#include <spdlog/spdlog.h>

namespace pocket::kernel {

Reaper::Reaper(MailboxStore& mailbox, ParentCache& parents, std::chrono::milliseconds interval)
    : mailbox_(mailbox)
    , parents_(parents)
    , interval_(interval) {
    if (interval_.count() <= 0) {
        interval_ = std::chrono::seconds(60);
    }
}

Reaper::~Reaper() {
    stop();
}

void Reaper::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    stopping_ = false;
    running_ = true;
    thread_ = std::thread([this]() { run(); });
    spdlog::debug("Reaper started (interval {} ms)", interval_.count());
}

void Reaper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    spdlog::debug("Reaper stopped after {} sweep(s)", totals_.sweeps);
}

bool Reaper::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

SweepStats Reaper::sweep(Clock::time_point now) {
    SweepStats stats;
    stats.messages_removed = mailbox_.expire(now);
    stats.parents_expired = parents_.expire(now);
    stats.sweeps = 1;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        totals_.messages_removed += stats.messages_removed;
        totals_.parents_expired += stats.parents_expired;
        totals_.sweeps += 1;
    }

    if (stats.messages_removed > 0 || stats.parents_expired > 0) {
        spdlog::debug("Sweep removed {} message(s), {} parent cache entrie(s)",
                      stats.messages_removed, stats.parents_expired);
    }
    return stats;
}

SweepStats Reaper::totals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totals_;
}

void Reaper::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval_, [this]() { return stopping_; })) {
                return;
            }
        }
        try {
            sweep(Clock::now());
        } catch (const std::exception& e) {
            spdlog::error("Sweep failed: {}", e.what());
        }
    }
}

} // namespace pocket::kernel
