#pragma once

#include <QString>
#include <QMessageLogContext>

namespace padpoint {
namespace core {

/**
 * Routes Qt logging (qDebug, qWarning, qCritical, qInfo) into the padpoint Logger.
 *
 * Only built with the overlay. Install after the Logger is configured.
 */
class QtLogHandler {
public:
    static void install();

    /**
     * Restore the handler that was active before install()
     */
    static void uninstall();

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

    static QtMessageHandler previousHandler_;
};

} // namespace core
} // namespace padpoint
