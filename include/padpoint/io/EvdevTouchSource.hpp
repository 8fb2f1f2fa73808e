#pragma once

#include "padpoint/core/types.hpp"
#include "padpoint/io/MtProtocolDecoder.hpp"
#include "padpoint/prediction/PredictionTypes.hpp"
#include "padpoint/tracking/TouchTypes.hpp"
#include <string>
#include <vector>

extern "C" {
#include <linux/input.h>
}

namespace padpoint {
namespace io {

/**
 * Touchpad reader for /dev/input/eventN
 *
 * Opens the device, optionally grabs it exclusively, reads its axis ranges
 * and turns the event stream into one TouchBatch per SYN_REPORT.
 */
class EvdevTouchSource {
public:
    struct DeviceInfo {
        std::string path;
        std::string name;
        prediction::PadBounds bounds;
        int slotCount = 1;
        bool multitouch = false;
        bool hasTouchSize = false;
        bool grabbed = false;
        bool monotonicTimestamps = false;
    };

    enum class ReadStatus {
        BATCH,          // batch and batchTime are filled
        TIMEOUT,        // nothing arrived within the timeout
        INTERRUPTED,    // poll interrupted by a signal
        CLOSED          // device went away or a read failed
    };

    /**
     * @throws core::DeviceException if the device cannot be opened, is not a
     *         touch device, or the grab is required and refused
     */
    EvdevTouchSource(const std::string& path, bool grab, bool requireGrab);
    ~EvdevTouchSource();

    EvdevTouchSource(const EvdevTouchSource&) = delete;
    EvdevTouchSource& operator=(const EvdevTouchSource&) = delete;

    ReadStatus readBatch(tracking::TouchBatch& batch, core::TimePoint& batchTime, int timeoutMs);

    const DeviceInfo& getInfo() const { return info_; }
    int getFd() const { return fd_; }

private:
    void queryCapabilities();
    void grab(bool requireGrab);
    bool resync(core::TimePoint now);
    core::TimePoint eventTime(const input_event& ev) const;
    bool drainBuffered(tracking::TouchBatch& batch, core::TimePoint& batchTime);

    int fd_;
    DeviceInfo info_;
    MtProtocolDecoder decoder_;
    std::vector<input_event> buffer_;
    size_t bufferPos_;
    size_t bufferLen_;
};

} // namespace io
} // namespace padpoint
