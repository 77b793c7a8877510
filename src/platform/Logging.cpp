/**
 * @file Logging.cpp
 * @brief Implementation of the file message handler
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#include "dadaloader/platform/Logging.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QTextStream>

#include <cstdio>
#include <memory>

namespace DadaLoader {
namespace Logging {

namespace {

QMutex g_mutex;
std::unique_ptr<QFile> g_file;
bool g_verbose = false;
bool g_installed = false;
QtMessageHandler g_previousHandler = nullptr;

const char* levelName(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARNING";
        case QtCriticalMsg: return "CRITICAL";
        case QtFatalMsg:    return "FATAL";
    }
    return "UNKNOWN";
}

void messageHandler(QtMsgType type, const QMessageLogContext& /*context*/, const QString& message) {
    const QString line = formatLine(type, message);

    {
        QMutexLocker lock(&g_mutex);

        if (g_file && g_file->isOpen()) {
            QTextStream stream(g_file.get());
            stream << line << '\n';
            stream.flush();
        }

        if (g_verbose || (type != QtDebugMsg && type != QtInfoMsg)) {
            std::fprintf(stderr, "%s\n", line.toLocal8Bit().constData());
            std::fflush(stderr);
        }
    }
}

} // namespace

QString formatLine(QtMsgType type, const QString& message) {
    return QStringLiteral("%1 - %2 - %3")
        .arg(QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz")),
             QString::fromLatin1(levelName(type)),
             message);
}

QString defaultLogFilePath() {
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dataDir.isEmpty()) {
        dataDir = QDir::homePath() + QStringLiteral("/.dadaloader");
    }
    return dataDir + QStringLiteral("/dadaloader.log");
}

bool install(const QString& path, bool verbose) {
    const QString target = path.isEmpty() ? defaultLogFilePath() : path;
    bool opened = false;

    {
        QMutexLocker lock(&g_mutex);

        g_file.reset();
        g_verbose = verbose;

        QDir().mkpath(QFileInfo(target).absolutePath());
        auto file = std::make_unique<QFile>(target);
        if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            g_file = std::move(file);
            opened = true;
        }
    }

    if (!g_installed) {
        g_previousHandler = qInstallMessageHandler(messageHandler);
        g_installed = true;
    }

    if (!opened) {
        qWarning() << "Logging: Cannot open log file" << target;
    }
    return opened;
}

void uninstall() {
    if (g_installed) {
        qInstallMessageHandler(g_previousHandler);
        g_previousHandler = nullptr;
        g_installed = false;
    }

    QMutexLocker lock(&g_mutex);
    g_file.reset();
    g_verbose = false;
}

QString logFilePath() {
    QMutexLocker lock(&g_mutex);
    return g_file ? g_file->fileName() : QString();
}

} // namespace Logging
} // namespace DadaLoader
