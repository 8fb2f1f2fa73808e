#include "padpoint/core/QtLogHandler.hpp"
#include "padpoint/core/Logger.hpp"
#include <cstdlib>

namespace padpoint {
namespace core {

QtMessageHandler QtLogHandler::previousHandler_ = nullptr;

void QtLogHandler::install() {
    previousHandler_ = qInstallMessageHandler(messageHandler);
}

void QtLogHandler::uninstall() {
    qInstallMessageHandler(previousHandler_);
    previousHandler_ = nullptr;
}

void QtLogHandler::messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    auto& logger = Logger::getInstance();

    LogLevel level;
    switch (type) {
        case QtDebugMsg:
            level = LogLevel::DEBUG;
            break;
        case QtInfoMsg:
            level = LogLevel::INFO;
            break;
        case QtWarningMsg:
            level = LogLevel::WARNING;
            break;
        case QtCriticalMsg:
            level = LogLevel::ERROR;
            break;
        case QtFatalMsg:
            level = LogLevel::CRITICAL;
            break;
        default:
            level = LogLevel::INFO;
            break;
    }

    std::string message = "[Qt] " + msg.toStdString();
    if (context.function) {
        message += " [" + std::string(context.function) + "]";
    }

    if (context.file && context.line > 0) {
        logger.log(level, message, context.file, context.line);
    } else {
        logger.log(level, message);
    }

    if (type == QtFatalMsg) {
        logger.flush();
        std::abort();
    }
}

} // namespace core
} // namespace padpoint
