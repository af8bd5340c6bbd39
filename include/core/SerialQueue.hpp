#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Serial worker queue: one thread runs submitted tasks in FIFO order.
// A CaptureSession owns one and every audio buffer is processed on it.
//
// The destructor runs whatever is still queued, then joins the thread.
class SerialQueue {
public:
    explicit SerialQueue(std::string label);
    ~SerialQueue();

    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    // Enqueue and return immediately. Ignored once shutdown has begun.
    void async(std::function<void()> task);

    // Run `task` on the queue and wait for it. Runs inline when called
    // from the queue's own thread. Rethrows whatever the task threw.
    void sync(const std::function<void()>& task);

    // True on the queue's worker thread.
    bool isCurrent() const;

    const std::string& label() const { return label_; }

private:
    void run();

    std::string                       label_;
    mutable std::mutex                mtx_;
    std::condition_variable           cv_;
    std::deque<std::function<void()>> tasks_;
    bool                              stopping_ = false;
    std::thread                       thread_;
};
