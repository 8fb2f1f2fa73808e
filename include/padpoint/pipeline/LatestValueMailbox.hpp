#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace padpoint {
namespace pipeline {

/**
 * Single-slot mailbox that keeps only the newest value.
 *
 * publish() never waits for the consumer: an unread value is overwritten
 * and counted as dropped. Used between the tick loop and slower consumers
 * (overlay, pointer device).
 */
template<typename T>
class LatestValueMailbox {
public:
    LatestValueMailbox()
        : has_value_(false), closed_(false), published_(0), dropped_(0) {}

    void publish(const T& value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            if (has_value_) {
                dropped_++;
            }
            value_ = value;
            has_value_ = true;
            published_++;
        }
        cv_.notify_one();
    }

    bool tryTake(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!has_value_) {
            return false;
        }
        out = std::move(value_);
        has_value_ = false;
        return true;
    }

    // Waits up to timeout_ms for a value; false on timeout or close
    bool waitTake(T& out, int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return has_value_ || closed_; });
        if (!has_value_) {
            return false;
        }
        out = std::move(value_);
        has_value_ = false;
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    uint64_t getPublishedCount() const { return published_; }
    uint64_t getDroppedCount() const { return dropped_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    T value_;
    bool has_value_;
    bool closed_;
    std::atomic<uint64_t> published_;
    std::atomic<uint64_t> dropped_;
};

} // namespace pipeline
} // namespace padpoint
