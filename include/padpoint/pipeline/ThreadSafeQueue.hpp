#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace padpoint {
namespace pipeline {

/**
 * Bounded FIFO shared between one producer and one worker thread.
 * The producer never waits: tryPush() fails when the queue is full.
 *
 * After stop() no new items are accepted, but items already queued can
 * still be popped so the worker can drain before exiting.
 */
template<typename T>
class ThreadSafeQueue {
public:
    explicit ThreadSafeQueue(size_t max_size = 16)
        : max_size_(max_size), stop_flag_(false) {}

    // Never waits; false when full or stopped
    bool tryPush(T&& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_flag_ || queue_.size() >= max_size_) {
            return false;
        }
        queue_.push(std::move(item));
        cv_empty_.notify_one();
        return true;
    }

    bool pop(T& item, int timeout_ms = 100) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_empty_.wait_for(lock,
            std::chrono::milliseconds(timeout_ms),
            [this] { return !queue_.empty() || stop_flag_; });

        if (queue_.empty()) {
            return false;
        }

        item = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    void stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_flag_ = true;
        cv_empty_.notify_all();
    }

    bool isStopped() const { return stop_flag_; }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return max_size_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_empty_;
    std::queue<T> queue_;
    size_t max_size_;
    std::atomic<bool> stop_flag_;
};

} // namespace pipeline
} // namespace padpoint
