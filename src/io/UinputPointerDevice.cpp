#include "padpoint/io/UinputPointerDevice.hpp"
#include "padpoint/core/Logger.hpp"
#include "padpoint/core/exception.hpp"
#include <cerrno>
#include <cstring>

extern "C" {
#include <fcntl.h>
#include <linux/input.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <unistd.h>
}

namespace padpoint {
namespace io {

namespace {

constexpr int kAbsMax = 65535;

void setupAxis(int fd, uint16_t code) {
    uinput_abs_setup abs;
    std::memset(&abs, 0, sizeof(abs));
    abs.code = code;
    abs.absinfo.minimum = 0;
    abs.absinfo.maximum = kAbsMax;
    if (ioctl(fd, UI_ABS_SETUP, &abs) < 0) {
        PADPOINT_THROW_CODE(core::DeviceException, core::ResultCode::ERROR_DEVICE_IO,
                            std::string("UI_ABS_SETUP failed: ") + std::strerror(errno));
    }
}

} // namespace

UinputPointerDevice::UinputPointerDevice(int screenWidth, int screenHeight,
                                         const std::string& name)
    : fd_(-1)
    , mapping_(prediction::PadBounds(), screenWidth, screenHeight)
    , touching_(false)
    , writeErrors_(0) {
    fd_ = ::open("/dev/uinput", O_WRONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0) {
        int err = errno;
        core::ResultCode code = (err == EACCES || err == EPERM)
            ? core::ResultCode::ERROR_DEVICE_ACCESS_DENIED
            : core::ResultCode::ERROR_DEVICE_NOT_FOUND;
        PADPOINT_THROW_CODE(core::DeviceException, code,
                            std::string("Cannot open /dev/uinput: ") + std::strerror(err));
    }

    try {
        ioctl(fd_, UI_SET_EVBIT, EV_SYN);
        ioctl(fd_, UI_SET_EVBIT, EV_KEY);
        ioctl(fd_, UI_SET_KEYBIT, BTN_TOUCH);
        ioctl(fd_, UI_SET_EVBIT, EV_ABS);
        ioctl(fd_, UI_SET_ABSBIT, ABS_X);
        ioctl(fd_, UI_SET_ABSBIT, ABS_Y);
        ioctl(fd_, UI_SET_PROPBIT, INPUT_PROP_DIRECT);

        setupAxis(fd_, ABS_X);
        setupAxis(fd_, ABS_Y);

        uinput_setup setup;
        std::memset(&setup, 0, sizeof(setup));
        std::strncpy(setup.name, name.c_str(), UINPUT_MAX_NAME_SIZE - 1);
        setup.id.bustype = BUS_VIRTUAL;
        setup.id.vendor = 0x1d6b;
        setup.id.product = 0x0104;
        setup.id.version = 1;

        if (ioctl(fd_, UI_DEV_SETUP, &setup) < 0 || ioctl(fd_, UI_DEV_CREATE) < 0) {
            PADPOINT_THROW_CODE(core::DeviceException, core::ResultCode::ERROR_DEVICE_IO,
                                std::string("Cannot create uinput device: ") + std::strerror(errno));
        }
    } catch (const core::Exception&) {
        ::close(fd_);
        fd_ = -1;
        throw;
    }

    PADPOINT_LOG_INFO("Uinput") << "Created '" << name << "' for a "
        << screenWidth << "x" << screenHeight << " screen";
}

UinputPointerDevice::~UinputPointerDevice() {
    if (fd_ >= 0) {
        if (touching_) {
            release();
        }
        ioctl(fd_, UI_DEV_DESTROY);
        ::close(fd_);
    }
}

bool UinputPointerDevice::emit(uint16_t type, uint16_t code, int32_t value) {
    input_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.type = type;
    ev.code = code;
    ev.value = value;
    ssize_t written = ::write(fd_, &ev, sizeof(ev));
    if (written != static_cast<ssize_t>(sizeof(ev))) {
        // Only report the first few to keep a stuck device from flooding the log
        if (writeErrors_++ < 5) {
            PADPOINT_LOG_ERROR("Uinput") << "write failed: " << std::strerror(errno);
        }
        return false;
    }
    return true;
}

void UinputPointerDevice::moveTo(const cv::Point2d& screenPoint) {
    cv::Point abs = mapping_.to65535(screenPoint);
    if (!touching_) {
        emit(EV_KEY, BTN_TOUCH, 1);
        touching_ = true;
    }
    emit(EV_ABS, ABS_X, abs.x);
    emit(EV_ABS, ABS_Y, abs.y);
    emit(EV_SYN, SYN_REPORT, 0);
}

void UinputPointerDevice::release() {
    if (!touching_) {
        return;
    }
    emit(EV_KEY, BTN_TOUCH, 0);
    emit(EV_SYN, SYN_REPORT, 0);
    touching_ = false;
}

// ===== AsyncPointerSink =====

AsyncPointerSink::AsyncPointerSink(pipeline::PointerSink& target)
    : target_(target)
    , releaseSeq_(0)
    , appliedReleaseSeq_(0)
    , running_(false) {
}

AsyncPointerSink::~AsyncPointerSink() {
    stop();
}

void AsyncPointerSink::start() {
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread(&AsyncPointerSink::workerLoop, this);
}

void AsyncPointerSink::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    mailbox_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
    // Apply whatever was left so a final release is not lost
    Command last;
    if (mailbox_.tryTake(last)) {
        if (last.releaseSeq > appliedReleaseSeq_) {
            target_.release();
            appliedReleaseSeq_ = last.releaseSeq;
        }
        if (last.move) {
            target_.moveTo(last.point);
        }
    }
}

void AsyncPointerSink::moveTo(const cv::Point2d& screenPoint) {
    Command cmd;
    cmd.move = true;
    cmd.point = screenPoint;
    cmd.releaseSeq = releaseSeq_;
    mailbox_.publish(cmd);
}

void AsyncPointerSink::release() {
    Command cmd;
    cmd.move = false;
    cmd.releaseSeq = ++releaseSeq_;
    mailbox_.publish(cmd);
}

void AsyncPointerSink::workerLoop() {
    Command cmd;
    while (running_) {
        if (!mailbox_.waitTake(cmd, 50)) {
            continue;
        }
        if (cmd.releaseSeq > appliedReleaseSeq_) {
            target_.release();
            appliedReleaseSeq_ = cmd.releaseSeq;
        }
        if (cmd.move) {
            target_.moveTo(cmd.point);
        }
    }
}

} // namespace io
} // namespace padpoint
