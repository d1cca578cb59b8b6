#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include "kernel/types.hpp"

namespace pocket::kernel {

class MailboxStore;
class ParentCache;

struct SweepStats {
    size_t messages_removed = 0;
    size_t parents_expired = 0;
    size_t sweeps = 0;
};

// Background sweep of expired mail and parent lookups on a fixed interval.
class Reaper {
public:
    Reaper(MailboxStore& mailbox, ParentCache& parents, std::chrono::milliseconds interval);
    ~Reaper();

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    void start();
    void stop();
    bool running() const;

    SweepStats sweep(Clock::time_point now = Clock::now());

    // Totals since construction
    SweepStats totals() const;

private:
    void run();

    MailboxStore& mailbox_;
    ParentCache& parents_;
    std::chrono::milliseconds interval_;

    std::thread thread_;
    bool running_ = false;
    bool stopping_ = false;
    SweepStats totals_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace pocket::kernel
