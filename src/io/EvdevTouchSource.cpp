#include "padpoint/io/EvdevTouchSource.hpp"
#include "padpoint/core/Logger.hpp"
#include "padpoint/core/exception.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>
}

namespace padpoint {
namespace io {

namespace {

constexpr size_t kReadChunk = 64;
constexpr int kMaxSlots = 64;

bool testBit(const unsigned long* bits, int bit) {
    const int perLong = static_cast<int>(8 * sizeof(unsigned long));
    return (bits[bit / perLong] >> (bit % perLong)) & 1UL;
}

bool readAbs(int fd, int code, input_absinfo& info) {
    std::memset(&info, 0, sizeof(info));
    return ioctl(fd, EVIOCGABS(code), &info) == 0;
}

core::ResultCode openErrorCode(int err) {
    switch (err) {
        case ENOENT:
        case ENODEV:
            return core::ResultCode::ERROR_DEVICE_NOT_FOUND;
        case EACCES:
        case EPERM:
            return core::ResultCode::ERROR_DEVICE_ACCESS_DENIED;
        default:
            return core::ResultCode::ERROR_DEVICE_IO;
    }
}

} // namespace

EvdevTouchSource::EvdevTouchSource(const std::string& path, bool grab, bool requireGrab)
    : fd_(-1)
    , buffer_(kReadChunk)
    , bufferPos_(0)
    , bufferLen_(0) {
    info_.path = path;

    fd_ = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0) {
        int err = errno;
        PADPOINT_THROW_CODE(core::DeviceException, openErrorCode(err),
                            "Cannot open " + path + ": " + std::strerror(err));
    }

    try {
        queryCapabilities();
        if (grab || requireGrab) {
            this->grab(requireGrab);
        }
    } catch (const core::Exception&) {
        ::close(fd_);
        fd_ = -1;
        throw;
    }

    decoder_ = MtProtocolDecoder(info_.slotCount, info_.multitouch);

    clockid_t clock = CLOCK_MONOTONIC;
    info_.monotonicTimestamps = ioctl(fd_, EVIOCSCLOCKID, &clock) == 0;
    if (!info_.monotonicTimestamps) {
        PADPOINT_LOG_DEBUG("Evdev") << "EVIOCSCLOCKID unsupported, using read time";
    }

    PADPOINT_LOG_INFO("Evdev") << "Opened " << path << " (" << info_.name << "): "
        << (info_.multitouch ? "multi-touch" : "single-touch")
        << ", slots=" << info_.slotCount
        << ", x=[" << info_.bounds.min_x << ", " << info_.bounds.max_x << "]"
        << ", y=[" << info_.bounds.min_y << ", " << info_.bounds.max_y << "]"
        << (info_.hasTouchSize ? ", touch size" : "")
        << (info_.grabbed ? ", grabbed" : "");
}

EvdevTouchSource::~EvdevTouchSource() {
    if (fd_ >= 0) {
        if (info_.grabbed) {
            ioctl(fd_, EVIOCGRAB, 0);
        }
        ::close(fd_);
    }
}

void EvdevTouchSource::queryCapabilities() {
    char name[256] = {0};
    if (ioctl(fd_, EVIOCGNAME(sizeof(name) - 1), name) >= 0) {
        info_.name = name;
    }

    unsigned long absBits[(ABS_MAX + 8 * sizeof(unsigned long)) / (8 * sizeof(unsigned long))] = {0};
    if (ioctl(fd_, EVIOCGBIT(EV_ABS, sizeof(absBits)), absBits) < 0) {
        PADPOINT_THROW_CODE(core::DeviceException, core::ResultCode::ERROR_DEVICE_UNSUPPORTED,
                            info_.path + " reports no absolute axes");
    }

    input_absinfo ax;
    input_absinfo ay;
    if (testBit(absBits, ABS_MT_POSITION_X) && testBit(absBits, ABS_MT_POSITION_Y) &&
        testBit(absBits, ABS_MT_SLOT)) {
        info_.multitouch = true;
        readAbs(fd_, ABS_MT_POSITION_X, ax);
        readAbs(fd_, ABS_MT_POSITION_Y, ay);

        input_absinfo slots;
        if (readAbs(fd_, ABS_MT_SLOT, slots)) {
            info_.slotCount = std::max(1, std::min(kMaxSlots, slots.maximum + 1));
        }
        info_.hasTouchSize = testBit(absBits, ABS_MT_TOUCH_MAJOR);
    } else if (testBit(absBits, ABS_X) && testBit(absBits, ABS_Y)) {
        info_.multitouch = false;
        info_.slotCount = 1;
        readAbs(fd_, ABS_X, ax);
        readAbs(fd_, ABS_Y, ay);
        PADPOINT_LOG_WARNING("Evdev") << info_.path
            << " has no protocol-B slots, only one contact can be tracked";
    } else {
        PADPOINT_THROW_CODE(core::DeviceException, core::ResultCode::ERROR_DEVICE_UNSUPPORTED,
                            info_.path + " is not a touch device");
    }

    info_.bounds.min_x = ax.minimum;
    info_.bounds.max_x = ax.maximum;
    info_.bounds.min_y = ay.minimum;
    info_.bounds.max_y = ay.maximum;
}

void EvdevTouchSource::grab(bool requireGrab) {
    if (ioctl(fd_, EVIOCGRAB, 1) == 0) {
        info_.grabbed = true;
        return;
    }
    int err = errno;
    if (requireGrab) {
        PADPOINT_THROW_CODE(core::DeviceException, core::ResultCode::ERROR_DEVICE_ACCESS_DENIED,
                            "Exclusive grab of " + info_.path + " refused: " + std::strerror(err));
    }
    PADPOINT_LOG_WARNING("Evdev") << "EVIOCGRAB failed on " << info_.path << ": "
        << std::strerror(err) << ", the desktop will still see the pad";
}

core::TimePoint EvdevTouchSource::eventTime(const input_event& ev) const {
    if (!info_.monotonicTimestamps) {
        return core::Clock::now();
    }
    auto since = std::chrono::seconds(ev.input_event_sec) +
                 std::chrono::microseconds(ev.input_event_usec);
    return core::TimePoint(std::chrono::duration_cast<core::Clock::duration>(since));
}

bool EvdevTouchSource::resync(core::TimePoint now) {
    std::vector<MtProtocolDecoder::SlotState> slots(static_cast<size_t>(info_.slotCount));
    std::vector<int32_t> values(static_cast<size_t>(info_.slotCount) + 1);

    auto fetch = [&](int code, int MtProtocolDecoder::SlotState::*field) {
        values[0] = code;
        if (ioctl(fd_, EVIOCGMTSLOTS(values.size() * sizeof(int32_t)), values.data()) < 0) {
            return false;
        }
        for (size_t i = 0; i < slots.size(); ++i) {
            slots[i].*field = values[i + 1];
        }
        return true;
    };

    if (!info_.multitouch) {
        // Nothing to query beyond the button; keep the current state
        decoder_.resync(decoder_.getSlots(), 0, now);
        return false;
    }

    bool ok = fetch(ABS_MT_TRACKING_ID, &MtProtocolDecoder::SlotState::trackingId) &&
              fetch(ABS_MT_POSITION_X, &MtProtocolDecoder::SlotState::x) &&
              fetch(ABS_MT_POSITION_Y, &MtProtocolDecoder::SlotState::y);
    if (ok && info_.hasTouchSize) {
        fetch(ABS_MT_TOUCH_MAJOR, &MtProtocolDecoder::SlotState::touchMajor);
        fetch(ABS_MT_TOUCH_MINOR, &MtProtocolDecoder::SlotState::touchMinor);
    }
    if (!ok) {
        PADPOINT_LOG_ERROR("Evdev") << "EVIOCGMTSLOTS failed: " << std::strerror(errno);
        decoder_.resync(decoder_.getSlots(), 0, now);
        return false;
    }

    input_absinfo slotInfo;
    int currentSlot = readAbs(fd_, ABS_MT_SLOT, slotInfo) ? slotInfo.value : 0;
    return decoder_.resync(slots, currentSlot, now);
}

bool EvdevTouchSource::drainBuffered(tracking::TouchBatch& batch, core::TimePoint& batchTime) {
    while (bufferPos_ < bufferLen_) {
        const input_event& ev = buffer_[bufferPos_++];
        core::TimePoint t = eventTime(ev);
        if (decoder_.feed(ev.type, ev.code, ev.value, t)) {
            batch = decoder_.takeBatch();
            batchTime = t;
            return true;
        }
        if (decoder_.needsResync() && resync(t)) {
            batch = decoder_.takeBatch();
            batchTime = t;
            return true;
        }
    }
    return false;
}

EvdevTouchSource::ReadStatus EvdevTouchSource::readBatch(tracking::TouchBatch& batch,
                                                         core::TimePoint& batchTime,
                                                         int timeoutMs) {
    batch.clear();
    while (true) {
        if (drainBuffered(batch, batchTime)) {
            return ReadStatus::BATCH;
        }

        pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = ::poll(&pfd, 1, timeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                return ReadStatus::INTERRUPTED;
            }
            PADPOINT_LOG_ERROR("Evdev") << "poll failed: " << std::strerror(errno);
            return ReadStatus::CLOSED;
        }
        if (ready == 0) {
            return ReadStatus::TIMEOUT;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            PADPOINT_LOG_ERROR("Evdev") << info_.path << " disconnected";
            return ReadStatus::CLOSED;
        }

        ssize_t n = ::read(fd_, buffer_.data(), buffer_.size() * sizeof(input_event));
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            PADPOINT_LOG_ERROR("Evdev") << "read failed on " << info_.path << ": "
                << std::strerror(errno);
            return ReadStatus::CLOSED;
        }
        if (n == 0) {
            return ReadStatus::CLOSED;
        }
        bufferPos_ = 0;
        bufferLen_ = static_cast<size_t>(n) / sizeof(input_event);
    }
}

} // namespace io
} // namespace padpoint
