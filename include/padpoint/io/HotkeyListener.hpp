#pragma once

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace padpoint {
namespace io {

/**
 * Tracks whether one key is held on any keyboard (or on one given device)
 *
 * Runs its own poll thread; isPressed() can be called from the tick loop.
 */
class HotkeyListener {
public:
    HotkeyListener(int keyCode, const std::string& devicePath = "");
    ~HotkeyListener();

    HotkeyListener(const HotkeyListener&) = delete;
    HotkeyListener& operator=(const HotkeyListener&) = delete;

    /**
     * Open the device(s) and start listening
     * @throws core::DeviceException if no device offers the key
     */
    void start();
    void stop();

    bool isPressed() const { return pressed_; }
    size_t getDeviceCount() const { return fds_.size(); }
    int getKeyCode() const { return keyCode_; }

    /**
     * Key code for a name like "KEY_SPACE" or a decimal number
     * @throws core::ConfigException for unknown names
     */
    static int parseKeyCode(const std::string& name);

private:
    bool openDevice(const std::string& path, bool logFailure);
    void listenLoop();

    int keyCode_;
    std::string devicePath_;
    std::vector<int> fds_;
    std::vector<bool> downOnDevice_;
    std::thread thread_;
    std::atomic<bool> running_;
    std::atomic<bool> pressed_;
};

} // namespace io
} // namespace padpoint
