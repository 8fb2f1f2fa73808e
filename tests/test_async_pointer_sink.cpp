/**
 * @file test_async_pointer_sink.cpp
 * @brief Tests for the non-blocking pointer sink wrapper
 *
 * Validates:
 * - Only the newest command reaches the device, but a coalesced release is kept
 * - A release still pending at stop() is applied
 * - Commands reach the wrapped sink in order while the worker runs
 */

#include <gtest/gtest.h>
#include <padpoint/io/UinputPointerDevice.hpp>
#include <padpoint/core/Logger.hpp>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace padpoint;

namespace {

class RecordingPointerSink : public pipeline::PointerSink {
public:
    void moveTo(const cv::Point2d& screenPoint) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back("move " + std::to_string(static_cast<int>(screenPoint.x)) + "," +
                          std::to_string(static_cast<int>(screenPoint.y)));
    }

    void release() override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back("release");
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    bool waitForEvents(size_t count) const {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (std::chrono::steady_clock::now() < deadline) {
            if (events().size() >= count) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

} // namespace

class AsyncPointerSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLogLevel(core::LogLevel::WARNING);
    }

    RecordingPointerSink device_;
};

TEST_F(AsyncPointerSinkTest, CoalescedReleaseIsNotLost) {
    io::AsyncPointerSink sink(device_);

    // Queued before the worker runs: only the last command survives
    sink.moveTo(cv::Point2d(10, 20));
    sink.release();
    sink.moveTo(cv::Point2d(30, 40));
    EXPECT_EQ(sink.getDroppedCount(), 2u);

    sink.start();
    sink.stop();

    std::vector<std::string> expected = {"release", "move 30,40"};
    EXPECT_EQ(device_.events(), expected);
}

TEST_F(AsyncPointerSinkTest, PendingReleaseAppliedOnStop) {
    io::AsyncPointerSink sink(device_);
    sink.start();

    sink.moveTo(cv::Point2d(100, 200));
    ASSERT_TRUE(device_.waitForEvents(1));

    sink.release();
    sink.stop();

    std::vector<std::string> expected = {"move 100,200", "release"};
    EXPECT_EQ(device_.events(), expected);
}

TEST_F(AsyncPointerSinkTest, ForwardsMovesInOrder) {
    io::AsyncPointerSink sink(device_);
    sink.start();

    sink.moveTo(cv::Point2d(1, 1));
    ASSERT_TRUE(device_.waitForEvents(1));
    sink.moveTo(cv::Point2d(2, 2));
    ASSERT_TRUE(device_.waitForEvents(2));
    sink.stop();

    std::vector<std::string> expected = {"move 1,1", "move 2,2"};
    EXPECT_EQ(device_.events(), expected);
}

TEST_F(AsyncPointerSinkTest, StopWithoutStartIsHarmless) {
    io::AsyncPointerSink sink(device_);
    sink.stop();
    sink.stop();
    EXPECT_TRUE(device_.events().empty());
}
