#include "kernel/async_task_manager.hpp"
#include <spdlog/spdlog.h>

namespace pocket::kernel {

AsyncTaskManager::AsyncTaskManager(size_t worker_count) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

AsyncTaskManager::~AsyncTaskManager() {
    shutdown();
}

void AsyncTaskManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool AsyncTaskManager::submit(const std::string& name, TaskFn task) {
    if (stopping_) {
        spdlog::warn("Task '{}' rejected, worker pool is shutting down", name);
        return false;
    }

    uint64_t id = next_task_id_.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(Task{id, name, std::move(task)});
    }
    queue_cv_.notify_one();
    return true;
}

bool AsyncTaskManager::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return queue_.empty() && running_ == 0; });
}

void AsyncTaskManager::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            // Drain what was queued before shutdown
            if (stopping_ && queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        try {
            task.fn();
        } catch (const std::exception& e) {
            spdlog::error("Task {} '{}' failed: {}", task.id, task.name, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --running_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace pocket::kernel
