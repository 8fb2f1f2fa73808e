#include "padpoint/io/HotkeyListener.hpp"
#include "padpoint/core/Logger.hpp"
#include "padpoint/core/exception.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <map>
#include <stdexcept>

extern "C" {
#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>
}

namespace padpoint {
namespace io {

namespace {

bool testBit(const unsigned long* bits, int bit) {
    const int perLong = static_cast<int>(8 * sizeof(unsigned long));
    return (bits[bit / perLong] >> (bit % perLong)) & 1UL;
}

const std::map<std::string, int>& keyNames() {
    static const std::map<std::string, int> names = {
        {"KEY_ESC", KEY_ESC}, {"KEY_TAB", KEY_TAB}, {"KEY_ENTER", KEY_ENTER},
        {"KEY_SPACE", KEY_SPACE}, {"KEY_BACKSPACE", KEY_BACKSPACE},
        {"KEY_CAPSLOCK", KEY_CAPSLOCK}, {"KEY_INSERT", KEY_INSERT},
        {"KEY_LEFTCTRL", KEY_LEFTCTRL}, {"KEY_RIGHTCTRL", KEY_RIGHTCTRL},
        {"KEY_LEFTSHIFT", KEY_LEFTSHIFT}, {"KEY_RIGHTSHIFT", KEY_RIGHTSHIFT},
        {"KEY_LEFTALT", KEY_LEFTALT}, {"KEY_RIGHTALT", KEY_RIGHTALT},
        {"KEY_LEFTMETA", KEY_LEFTMETA}, {"KEY_RIGHTMETA", KEY_RIGHTMETA},
        {"KEY_F1", KEY_F1}, {"KEY_F2", KEY_F2}, {"KEY_F3", KEY_F3}, {"KEY_F4", KEY_F4},
        {"KEY_F5", KEY_F5}, {"KEY_F6", KEY_F6}, {"KEY_F7", KEY_F7}, {"KEY_F8", KEY_F8},
        {"KEY_F9", KEY_F9}, {"KEY_F10", KEY_F10}, {"KEY_F11", KEY_F11}, {"KEY_F12", KEY_F12},
        {"KEY_A", KEY_A}, {"KEY_B", KEY_B}, {"KEY_C", KEY_C}, {"KEY_D", KEY_D},
        {"KEY_E", KEY_E}, {"KEY_F", KEY_F}, {"KEY_G", KEY_G}, {"KEY_H", KEY_H},
        {"KEY_I", KEY_I}, {"KEY_J", KEY_J}, {"KEY_K", KEY_K}, {"KEY_L", KEY_L},
        {"KEY_M", KEY_M}, {"KEY_N", KEY_N}, {"KEY_O", KEY_O}, {"KEY_P", KEY_P},
        {"KEY_Q", KEY_Q}, {"KEY_R", KEY_R}, {"KEY_S", KEY_S}, {"KEY_T", KEY_T},
        {"KEY_U", KEY_U}, {"KEY_V", KEY_V}, {"KEY_W", KEY_W}, {"KEY_X", KEY_X},
        {"KEY_Y", KEY_Y}, {"KEY_Z", KEY_Z}
    };
    return names;
}

} // namespace

HotkeyListener::HotkeyListener(int keyCode, const std::string& devicePath)
    : keyCode_(keyCode)
    , devicePath_(devicePath)
    , running_(false)
    , pressed_(false) {
}

HotkeyListener::~HotkeyListener() {
    stop();
}

int HotkeyListener::parseKeyCode(const std::string& name) {
    auto it = keyNames().find(name);
    if (it != keyNames().end()) {
        return it->second;
    }

    if (!name.empty() && std::all_of(name.begin(), name.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; })) {
        int code = 0;
        try {
            code = std::stoi(name);
        } catch (const std::out_of_range&) {
            code = -1;
        }
        if (code > 0 && code <= KEY_MAX) {
            return code;
        }
    }
    PADPOINT_THROW(core::ConfigException, "Unknown hotkey '" + name + "'");
}

bool HotkeyListener::openDevice(const std::string& path, bool logFailure) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        if (logFailure) {
            PADPOINT_LOG_ERROR("Hotkey") << "Cannot open " << path << ": " << std::strerror(errno);
        }
        return false;
    }

    unsigned long evBits[(EV_MAX + 8 * sizeof(unsigned long)) / (8 * sizeof(unsigned long))] = {0};
    unsigned long keyBits[(KEY_MAX + 8 * sizeof(unsigned long)) / (8 * sizeof(unsigned long))] = {0};
    bool hasKey = ioctl(fd, EVIOCGBIT(0, sizeof(evBits)), evBits) >= 0 &&
                  testBit(evBits, EV_KEY) &&
                  ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keyBits)), keyBits) >= 0 &&
                  testBit(keyBits, keyCode_);
    if (!hasKey) {
        ::close(fd);
        return false;
    }

    char name[256] = {0};
    ioctl(fd, EVIOCGNAME(sizeof(name) - 1), name);
    PADPOINT_LOG_DEBUG("Hotkey") << "Listening on " << path << " (" << name << ")";
    fds_.push_back(fd);
    downOnDevice_.push_back(false);
    return true;
}

void HotkeyListener::start() {
    if (running_) {
        return;
    }

    if (!devicePath_.empty()) {
        openDevice(devicePath_, true);
    } else {
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator("/dev/input", ec)) {
            const std::string file = entry.path().filename().string();
            if (file.rfind("event", 0) == 0) {
                openDevice(entry.path().string(), false);
            }
        }
        if (ec) {
            PADPOINT_LOG_ERROR("Hotkey") << "Cannot list /dev/input: " << ec.message();
        }
    }

    if (fds_.empty()) {
        PADPOINT_THROW_CODE(core::DeviceException, core::ResultCode::ERROR_DEVICE_NOT_FOUND,
                            "No input device offers key code " + std::to_string(keyCode_));
    }

    running_ = true;
    thread_ = std::thread(&HotkeyListener::listenLoop, this);
    PADPOINT_LOG_INFO("Hotkey") << "Hotkey " << keyCode_ << " on " << fds_.size() << " device(s)";
}

void HotkeyListener::stop() {
    if (running_) {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
    }
    for (int fd : fds_) {
        ::close(fd);
    }
    fds_.clear();
    downOnDevice_.clear();
    pressed_ = false;
}

void HotkeyListener::listenLoop() {
    std::vector<pollfd> pfds(fds_.size());
    for (size_t i = 0; i < fds_.size(); ++i) {
        pfds[i].fd = fds_[i];
        pfds[i].events = POLLIN;
    }

    input_event events[32];
    while (running_) {
        for (auto& p : pfds) {
            p.revents = 0;
        }
        int ready = ::poll(pfds.data(), pfds.size(), 100);
        if (ready <= 0) {
            continue;
        }

        for (size_t i = 0; i < pfds.size(); ++i) {
            if (pfds[i].fd < 0) {
                continue;
            }
            if (pfds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                PADPOINT_LOG_WARNING("Hotkey") << "Keyboard device disconnected";
                pfds[i].fd = -1;
                downOnDevice_[i] = false;
                continue;
            }
            if (!(pfds[i].revents & POLLIN)) {
                continue;
            }
            ssize_t n = ::read(pfds[i].fd, events, sizeof(events));
            if (n <= 0) {
                continue;
            }
            size_t count = static_cast<size_t>(n) / sizeof(input_event);
            for (size_t k = 0; k < count; ++k) {
                if (events[k].type == EV_KEY && events[k].code == keyCode_) {
                    // 1 = press, 2 = autorepeat, 0 = release
                    downOnDevice_[i] = events[k].value != 0;
                }
            }
        }

        pressed_ = std::any_of(downOnDevice_.begin(), downOnDevice_.end(),
                               [](bool down) { return down; });
    }
}

} // namespace io
} // namespace padpoint
