#pragma once

#include "padpoint/pipeline/LatestValueMailbox.hpp"
#include "padpoint/pipeline/OutputSinks.hpp"
#include "padpoint/prediction/ScreenMapping.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace padpoint {
namespace io {

/**
 * Virtual absolute touchscreen (BTN_TOUCH + ABS_X/ABS_Y in 0..65535)
 *
 * The compositor maps the 0..65535 range onto the screen, so a screen point
 * is converted with ScreenMapping::to65535().
 */
class UinputPointerDevice : public pipeline::PointerSink {
public:
    /**
     * @throws core::DeviceException if /dev/uinput is unavailable
     */
    UinputPointerDevice(int screenWidth, int screenHeight,
                        const std::string& name = "padpoint virtual touchscreen");
    ~UinputPointerDevice() override;

    UinputPointerDevice(const UinputPointerDevice&) = delete;
    UinputPointerDevice& operator=(const UinputPointerDevice&) = delete;

    void moveTo(const cv::Point2d& screenPoint) override;
    void release() override;

    bool isTouching() const { return touching_; }

private:
    bool emit(uint16_t type, uint16_t code, int32_t value);

    int fd_;
    prediction::ScreenMapping mapping_;
    bool touching_;
    size_t writeErrors_;
};

/**
 * Moves pointer output off the tick loop
 *
 * Commands go through a latest-value mailbox to a worker thread that drives
 * the wrapped sink. Intermediate moves may be dropped; releases never are.
 */
class AsyncPointerSink : public pipeline::PointerSink {
public:
    explicit AsyncPointerSink(pipeline::PointerSink& target);
    ~AsyncPointerSink() override;

    AsyncPointerSink(const AsyncPointerSink&) = delete;
    AsyncPointerSink& operator=(const AsyncPointerSink&) = delete;

    void start();
    void stop();

    void moveTo(const cv::Point2d& screenPoint) override;
    void release() override;

    uint64_t getDroppedCount() const { return mailbox_.getDroppedCount(); }

private:
    struct Command {
        bool move = false;
        cv::Point2d point;
        uint64_t releaseSeq = 0;   // Releases issued up to this command
    };

    void workerLoop();

    pipeline::PointerSink& target_;
    pipeline::LatestValueMailbox<Command> mailbox_;
    std::atomic<uint64_t> releaseSeq_;
    uint64_t appliedReleaseSeq_;
    std::thread worker_;
    std::atomic<bool> running_;
};

} // namespace io
} // namespace padpoint
