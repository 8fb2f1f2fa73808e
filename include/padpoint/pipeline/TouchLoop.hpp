#pragma once

#include "padpoint/io/EvdevTouchSource.hpp"
#include "padpoint/io/HotkeyListener.hpp"
#include "padpoint/pipeline/TickProcessor.hpp"
#include <atomic>
#include <cstdint>

namespace padpoint {
namespace pipeline {

/**
 * Drives the TickProcessor from the touch device
 *
 * One tick per report batch, plus an idle tick whenever no report arrived
 * within the poll timeout so holds can complete with a motionless finger.
 */
class TouchLoop {
public:
    TouchLoop(io::EvdevTouchSource& source,
              TickProcessor& processor,
              io::HotkeyListener* hotkey = nullptr,
              int pollTimeoutMs = 10);

    /**
     * Run until stop() is called or the device goes away
     * @return false if the device failed
     */
    bool run();

    /// Safe to call from a signal handler or another thread
    void stop() { stopRequested_ = true; }

    uint64_t getTickCount() const { return processor_.context().tracker.get_tick_count(); }

private:
    io::EvdevTouchSource& source_;
    TickProcessor& processor_;
    io::HotkeyListener* hotkey_;
    int pollTimeoutMs_;
    std::atomic<bool> stopRequested_;
};

} // namespace pipeline
} // namespace padpoint
