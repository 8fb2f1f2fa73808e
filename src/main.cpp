#include <QApplication>
#include <QTimer>

#include "padpoint/core/Configuration.hpp"
#include "padpoint/core/Logger.hpp"
#include "padpoint/core/QtLogHandler.hpp"
#include "padpoint/core/exception.hpp"
#include "padpoint/gui/overlay_widget.hpp"
#include "padpoint/io/EvdevTouchSource.hpp"
#include "padpoint/io/HotkeyListener.hpp"
#include "padpoint/io/UinputPointerDevice.hpp"
#include "padpoint/pipeline/LatestValueMailbox.hpp"
#include "padpoint/pipeline/OutputSinks.hpp"
#include "padpoint/pipeline/TickProcessor.hpp"
#include "padpoint/pipeline/TouchLoop.hpp"
#include "padpoint/trace/TraceWriter.hpp"

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace padpoint;

namespace {

std::atomic<pipeline::TouchLoop*> g_loop{nullptr};
std::atomic<bool> g_stop{false};

void handleSignal(int /*signum*/) {
    g_stop = true;
    pipeline::TouchLoop* loop = g_loop.load();
    if (loop != nullptr) {
        loop->stop();
    }
}

struct CommandLine {
    std::string device;
    std::string configFile;
    std::string logDir;
    bool overlay = false;
    bool grab = false;
    bool verbose = false;
};

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " <device> [--config file.yaml] [--overlay] [--grab]"
                 " [--log-dir dir] [--verbose]" << std::endl;
}

bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cmd.configFile = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            cmd.logDir = argv[++i];
        } else if (arg == "--overlay") {
            cmd.overlay = true;
        } else if (arg == "--grab") {
            cmd.grab = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cmd.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else if (cmd.device.empty()) {
            cmd.device = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return 2;
    }

    auto& logger = core::Logger::getInstance();
    logger.setLevel(cmd.verbose ? core::LogLevel::DEBUG : core::LogLevel::INFO);

    core::PadpointConfig config;
    try {
        config = cmd.configFile.empty()
            ? core::ConfigLoader::loadString("")
            : core::ConfigLoader::loadFile(cmd.configFile);
    } catch (const core::ConfigException& e) {
        LOG_CRITICAL(std::string("Configuration rejected: ") + e.what());
        return 1;
    }

    // Command line wins over the config file
    if (!cmd.device.empty()) {
        config.device.path = cmd.device;
    }
    if (cmd.grab) {
        config.device.grab = true;
    }
    if (cmd.overlay) {
        config.overlay.enabled = true;
    }
    if (!cmd.verbose) {
        core::LogLevel level;
        if (core::parseLogLevel(config.logging.level, level)) {
            logger.setLevel(level);
        }
    }
    std::string logDir = cmd.logDir.empty() ? config.logging.directory : cmd.logDir;
    if (!logDir.empty()) {
        if (logger.initializeWithTimestamp(core::ConfigLoader::expandUserPath(logDir),
                                           logger.getLevel())) {
            LOG_INFO("Log file: " + logger.getCurrentLogFile());
        } else {
            LOG_WARNING("File logging unavailable, using console only");
        }
    }

    if (config.device.path.empty()) {
        LOG_CRITICAL("No touch device given");
        printUsage(argv[0]);
        return 2;
    }

    LOG_INFO("=== padpoint starting ===");

    int exitCode = 0;
    try {
        io::EvdevTouchSource source(config.device.path, config.device.grab,
                                    config.device.require_grab);
        const auto& info = source.getInfo();

        io::UinputPointerDevice uinput(config.calibration.screen_width,
                                       config.calibration.screen_height);
        io::AsyncPointerSink pointer(uinput);
        pointer.start();

        std::unique_ptr<trace::TraceWriter> traces;
        if (config.trace.enabled) {
            traces = std::make_unique<trace::TraceWriter>(config.trace);
            traces->start();
        }

        std::unique_ptr<io::HotkeyListener> hotkey;
        if (config.trigger.mode != trigger::TriggerMode::GESTURE) {
            hotkey = std::make_unique<io::HotkeyListener>(
                io::HotkeyListener::parseKeyCode(config.trigger.hotkey),
                config.trigger.hotkey_device);
            hotkey->start();
        }

        pipeline::LatestValueMailbox<pipeline::OverlaySnapshot> overlayMailbox;
        std::unique_ptr<pipeline::MailboxOverlaySink> overlaySink;
        if (config.overlay.enabled) {
            overlaySink = std::make_unique<pipeline::MailboxOverlaySink>(overlayMailbox);
        }

        pipeline::TickProcessor processor(config, info.bounds, &pointer,
                                          overlaySink.get(), traces.get());
        pipeline::TouchLoop loop(source, processor, hotkey.get(),
                                 config.device.poll_timeout_ms);

        g_loop = &loop;
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        bool loopOk = true;
        if (config.overlay.enabled) {
            QApplication app(argc, argv);
            app.setApplicationName("padpoint");
            core::QtLogHandler::install();

            gui::OverlayWidget overlay(overlayMailbox, config.overlay);
            overlay.show();

            std::thread loopThread([&]() {
                loopOk = loop.run();
                overlayMailbox.close();
            });

            QTimer stopWatch;
            QObject::connect(&stopWatch, &QTimer::timeout, [&]() {
                if (g_stop || overlayMailbox.isClosed()) {
                    loop.stop();
                    app.quit();
                }
            });
            stopWatch.start(50);

            app.exec();
            loop.stop();
            loopThread.join();
            core::QtLogHandler::uninstall();
        } else {
            loopOk = loop.run();
        }

        g_loop = nullptr;

        pointer.stop();
        if (traces) {
            traces->stop();
            LOG_INFO("Traces written: " + std::to_string(traces->getWrittenCount()) +
                     ", failed: " + std::to_string(traces->getFailedCount()) +
                     ", dropped: " + std::to_string(traces->getDroppedCount()));
        }
        if (hotkey) {
            hotkey->stop();
        }

        LOG_INFO("Ticks: " + std::to_string(loop.getTickCount()) +
                 ", forwarded: " + std::to_string(processor.getForwardedCount()));
        exitCode = loopOk ? 0 : 3;

    } catch (const core::Exception& e) {
        LOG_CRITICAL(std::string("Startup failed: ") + e.what());
        exitCode = 1;
    } catch (const std::exception& e) {
        LOG_CRITICAL(std::string("FATAL ERROR: ") + e.what());
        exitCode = 1;
    }

    LOG_INFO("=== padpoint shutdown, exit code " + std::to_string(exitCode) + " ===");
    logger.flush();
    return exitCode;
}
