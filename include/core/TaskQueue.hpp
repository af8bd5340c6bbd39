#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

// Coordinating context. Any thread may post(); tasks run on whichever
// thread calls drain(), which is the single thread that owns the
// TapManager and CaptureSession state (the CLI main loop, or a test).
class TaskQueue {
public:
    void post(std::function<void()> task) {
        {
            std::lock_guard lock(mtx_);
            tasks_.push_back(std::move(task));
        }
        cv_.notify_all();
    }

    // Runs tasks until the queue is empty, including tasks posted by the
    // tasks themselves. Returns how many ran.
    size_t drain() {
        size_t ran = 0;
        for (;;) {
            std::function<void()> task;
            {
                std::lock_guard lock(mtx_);
                if (tasks_.empty()) return ran;
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
            ++ran;
        }
    }

    // Blocks until a task is pending or the timeout expires.
    bool waitFor(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mtx_);
        return cv_.wait_for(lock, timeout, [this] { return !tasks_.empty(); });
    }

    size_t pending() const {
        std::lock_guard lock(mtx_);
        return tasks_.size();
    }

private:
    mutable std::mutex                mtx_;
    std::condition_variable           cv_;
    std::deque<std::function<void()>> tasks_;
};
