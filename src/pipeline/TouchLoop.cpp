#include "padpoint/pipeline/TouchLoop.hpp"
#include "padpoint/core/Logger.hpp"
#include <algorithm>

namespace padpoint {
namespace pipeline {

TouchLoop::TouchLoop(io::EvdevTouchSource& source,
                     TickProcessor& processor,
                     io::HotkeyListener* hotkey,
                     int pollTimeoutMs)
    : source_(source)
    , processor_(processor)
    , hotkey_(hotkey)
    , pollTimeoutMs_(pollTimeoutMs > 0 ? pollTimeoutMs : 10)
    , stopRequested_(false) {
}

bool TouchLoop::run() {
    bool deviceOk = true;
    tracking::TouchBatch batch;
    core::TimePoint batchTime;
    core::TimePoint lastTick = core::Clock::now();

    LOG_INFO("Touch loop started");

    while (!stopRequested_) {
        auto status = source_.readBatch(batch, batchTime, pollTimeoutMs_);

        core::TimePoint now;
        switch (status) {
            case io::EvdevTouchSource::ReadStatus::BATCH:
                now = batchTime;
                break;
            case io::EvdevTouchSource::ReadStatus::TIMEOUT:
                batch.clear();
                now = core::Clock::now();
                break;
            case io::EvdevTouchSource::ReadStatus::INTERRUPTED:
                continue;
            case io::EvdevTouchSource::ReadStatus::CLOSED:
            default:
                LOG_ERROR("Touch device closed, leaving the loop");
                deviceOk = false;
                stopRequested_ = true;
                continue;
        }

        // Event timestamps may trail an idle tick taken from the clock
        now = std::max(now, lastTick);
        lastTick = now;

        bool key = hotkey_ != nullptr && hotkey_->isPressed();
        processor_.processTick(batch, now, key);
    }

    processor_.shutdown(std::max(core::Clock::now(), lastTick));
    const tracking::ContactTracker& tracker = processor_.context().tracker;
    PADPOINT_LOG_INFO("TouchLoop") << "Touch loop stopped after " << tracker.get_tick_count()
        << " ticks, " << tracker.get_evicted_count() << " contacts evicted";
    return deviceOk;
}

} // namespace pipeline
} // namespace padpoint
