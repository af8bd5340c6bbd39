#include "core/SerialQueue.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <future>

SerialQueue::SerialQueue(std::string label)
    : label_(std::move(label))
{
    thread_ = std::thread(&SerialQueue::run, this);
}

SerialQueue::~SerialQueue() {
    {
        std::lock_guard lock(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void SerialQueue::async(std::function<void()> task) {
    {
        std::lock_guard lock(mtx_);
        if (stopping_) {
            spdlog::warn("SerialQueue '{}': task dropped after shutdown", label_);
            return;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void SerialQueue::sync(const std::function<void()>& task) {
    if (isCurrent()) {
        task();
        return;
    }

    std::promise<void> done;
    auto result = done.get_future();
    {
        std::lock_guard lock(mtx_);
        if (stopping_) {
            spdlog::warn("SerialQueue '{}': sync task dropped after shutdown", label_);
            return;
        }
        tasks_.push_back([&task, &done] {
            try {
                task();
                done.set_value();
            } catch (...) {
                done.set_exception(std::current_exception());
            }
        });
    }
    cv_.notify_one();
    result.get();
}

bool SerialQueue::isCurrent() const {
    return std::this_thread::get_id() == thread_.get_id();
}

void SerialQueue::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(mtx_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) return;  // stopping and drained
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("SerialQueue '{}': task threw: {}", label_, e.what());
        }
    }
}
