/**
 * @file Logging.h
 * @brief File logging for Qt's message handler
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#ifndef DADALOADER_LOGGING_H
#define DADALOADER_LOGGING_H

#include <QString>
#include <QtGlobal>

namespace DadaLoader {
namespace Logging {

/**
 * @brief Route qDebug/qInfo/qWarning/qCritical to a log file
 *
 * Lines are written as "<yyyy-MM-dd hh:mm:ss.zzz> - <LEVEL> - <message>".
 * Warnings and above are echoed to stderr; with @p verbose every message is.
 *
 * @param logFilePath Log file (empty = dadaloader.log in the app data directory)
 * @return false if the file could not be opened (stderr logging still works)
 */
bool install(const QString& logFilePath = QString(), bool verbose = false);

/**
 * @brief Restore the handler that was active before install()
 */
void uninstall();

/// @return Path of the open log file, empty when not installed
QString logFilePath();

/// @return Default log file location
QString defaultLogFilePath();

/// Format one log line (exposed for tests)
QString formatLine(QtMsgType type, const QString& message);

} // namespace Logging
} // namespace DadaLoader

#endif // DADALOADER_LOGGING_H
