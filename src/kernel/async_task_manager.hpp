#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace pocket::kernel {

// Fixed worker pool for fire-and-forget work: subagent runs, resume chains,
// notifications. Tasks never report back; they post into the coordinator's
// own structures instead.
class AsyncTaskManager {
public:
    using TaskFn = std::function<void()>;

    explicit AsyncTaskManager(size_t worker_count = 4);
    ~AsyncTaskManager();

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    // False once shutdown has begun
    bool submit(const std::string& name, TaskFn task);

    // Wait until the queue is empty and no task is running
    bool wait_idle(std::chrono::milliseconds timeout);

    void shutdown();

private:
    struct Task {
        uint64_t id = 0;
        std::string name;
        TaskFn fn;
    };

    void worker_loop();

    std::deque<Task> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stopping_{false};
    size_t running_ = 0;

    std::atomic<uint64_t> next_task_id_{1};
};

} // namespace pocket::kernel
