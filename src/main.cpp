/**
 * @file main.cpp
 * @brief DadaLoader command-line entry point
 *
 * Opens the task database, applies the requested commands and runs the
 * event loop until no task is downloading.
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <QTimer>

#include <atomic>
#include <csignal>

#include "dadaloader/engine/EngineSupervisor.h"
#include "dadaloader/engine/TaskManager.h"
#include "dadaloader/persistence/PersistenceManager.h"
#include "dadaloader/platform/Logging.h"

using namespace DadaLoader;

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitFailure = 1,
    ExitInvalidInput = 2,
    ExitNotFound = 3
};

// Set from the signal handler, polled by the event loop
std::atomic<bool> g_terminateRequested{false};

void signalHandler(int /*signal*/) {
    g_terminateRequested.store(true);
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

int exitCodeFor(const TaskError& error) {
    switch (error.category) {
        case ErrorCategory::None:         return ExitOk;
        case ErrorCategory::InvalidInput: return ExitInvalidInput;
        case ErrorCategory::NotFound:     return ExitNotFound;
        default:                          return ExitFailure;
    }
}

QString etaText(qint64 seconds) {
    return seconds > 0 ? QString::number(seconds) : QStringLiteral("-");
}

void printTable(QTextStream& out, const std::vector<TaskSnapshot>& snapshots) {
    out << QStringLiteral("%1  %2  %3  %4  %5  %6  %7")
               .arg(QStringLiteral("ID"), 4)
               .arg(QStringLiteral("File"), -32)
               .arg(QStringLiteral("Size"), 12)
               .arg(QStringLiteral("Progress"), 8)
               .arg(QStringLiteral("Mb/s"), 8)
               .arg(QStringLiteral("ETA s"), 6)
               .arg(QStringLiteral("Status"))
        << Qt::endl;

    for (const TaskSnapshot& snap : snapshots) {
        out << QStringLiteral("%1  %2  %3  %4  %5  %6  %7")
                   .arg(snap.id(), 4)
                   .arg(snap.fileName().left(32), -32)
                   .arg(snap.formattedSize(), 12)
                   .arg(QStringLiteral("%1%").arg(snap.record.progressPercent, 0, 'f', 1), 8)
                   .arg(QString::number(snap.speedMbps, 'f', 2), 8)
                   .arg(etaText(snap.etaSeconds), 6)
                   .arg(snap.statusString())
            << Qt::endl;
    }
}

QString progressLine(const TaskSnapshot& snap) {
    return QStringLiteral("[%1] %2 %3% %4 Mb/s ETA %5s")
        .arg(snap.id())
        .arg(snap.fileName())
        .arg(snap.record.progressPercent, 0, 'f', 1)
        .arg(snap.speedMbps, 0, 'f', 2)
        .arg(etaText(snap.etaSeconds));
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    // Application metadata
    app.setOrganizationName(QStringLiteral("DadaLoader"));
    app.setApplicationName(QStringLiteral("dadaloader"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Download manager driving the aria2c transfer engine"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("url"), QStringLiteral("URL to download"),
                                 QStringLiteral("[<url> <savePath>]..."));
    parser.addPositionalArgument(QStringLiteral("savePath"),
                                 QStringLiteral("Destination file or directory"));

    const QCommandLineOption verboseOption({QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Echo debug messages to stderr"));
    const QCommandLineOption engineOption(QStringLiteral("engine"),
        QStringLiteral("Path to the transfer engine"), QStringLiteral("path"));
    const QCommandLineOption connectionsOption(QStringLiteral("connections"),
        QStringLiteral("Connections and segments per download"), QStringLiteral("n"));
    const QCommandLineOption dbOption(QStringLiteral("db"),
        QStringLiteral("Task database file"), QStringLiteral("path"));
    const QCommandLineOption logOption(QStringLiteral("log-file"),
        QStringLiteral("Log file"), QStringLiteral("path"));
    const QCommandLineOption dirOption(QStringLiteral("dir"),
        QStringLiteral("Default download directory"), QStringLiteral("directory"));
    const QCommandLineOption listOption(QStringLiteral("list"),
        QStringLiteral("Print all tasks and exit"));
    const QCommandLineOption startOption(QStringLiteral("start"),
        QStringLiteral("Start or restart a task"), QStringLiteral("id"));
    const QCommandLineOption resumeOption(QStringLiteral("resume"),
        QStringLiteral("Resume a paused task"), QStringLiteral("id"));
    const QCommandLineOption stopOption(QStringLiteral("stop"),
        QStringLiteral("Stop a task"), QStringLiteral("id"));
    const QCommandLineOption deleteOption(QStringLiteral("delete"),
        QStringLiteral("Delete a task and its file"), QStringLiteral("id"));
    const QCommandLineOption resumeAllOption(QStringLiteral("resume-all"),
        QStringLiteral("Resume paused tasks and start pending ones"));

    parser.addOptions({verboseOption, engineOption, connectionsOption, dbOption, logOption,
                       dirOption, listOption, startOption, resumeOption, stopOption,
                       deleteOption, resumeAllOption});
    parser.process(app);

    Logging::install(parser.value(logOption), parser.isSet(verboseOption));
    setupSignalHandlers();

    QTextStream out(stdout);
    QTextStream err(stderr);

    // Initialize persistence
    PersistenceManager store;
    if (!store.initialize(parser.value(dbOption))) {
        err << "Error: cannot open database: " << store.lastError() << Qt::endl;
        Logging::uninstall();
        return ExitFailure;
    }

    Settings settings = store.loadSettings();
    if (parser.isSet(engineOption)) {
        settings.enginePath = parser.value(engineOption);
    }
    if (parser.isSet(connectionsOption)) {
        bool ok = false;
        const int connections = parser.value(connectionsOption).toInt(&ok);
        if (!ok || connections <= 0) {
            err << "Error: invalid connection count" << Qt::endl;
            Logging::uninstall();
            return ExitInvalidInput;
        }
        settings.connections = connections;
    }
    if (parser.isSet(dirOption)) {
        settings.defaultDirectory = QFileInfo(parser.value(dirOption)).absoluteFilePath();
    }

    TaskManager manager(store, EngineOptions::fromSettings(settings));

    TaskError error;
    if (!manager.initialize(&error)) {
        err << "Error: " << error.message << Qt::endl;
        Logging::uninstall();
        return ExitFailure;
    }

    QObject::connect(&manager, &TaskManager::taskFailed, &app,
                     [&err](TaskId id, const QString& message) {
                         err << "Task " << id << " failed: " << message << Qt::endl;
                     });
    QObject::connect(&manager, &TaskManager::persistenceFailed, &app,
                     [&err](TaskId id, const QString& message) {
                         err << "Task " << id << " not saved: " << message << Qt::endl;
                     });
    QObject::connect(&manager, &TaskManager::taskStatusChanged, &app,
                     [&out](TaskId id, TaskStatus status) {
                         if (isTerminal(status)) {
                             out << "Task " << id << ": " << taskStatusToString(status) << Qt::endl;
                         }
                     });

    int exitCode = ExitOk;
    auto report = [&](const TaskError& failure) {
        err << "Error: " << failure.message << Qt::endl;
        exitCode = exitCodeFor(failure);
    };

    // New downloads
    const QStringList positional = parser.positionalArguments();
    if (positional.size() % 2 != 0) {
        err << "Error: every URL needs a save path" << Qt::endl;
        exitCode = ExitInvalidInput;
    }
    for (int i = 0; i + 1 < positional.size(); i += 2) {
        const QString& url = positional.at(i);
        QString savePath = positional.at(i + 1);

        if (QFileInfo(savePath).isRelative() && !settings.defaultDirectory.isEmpty()) {
            savePath = QDir(settings.defaultDirectory).absoluteFilePath(savePath);
        }

        const QFileInfo target(savePath);
        if (target.isDir()) {
            savePath = TaskManager::suggestSavePath(url, target.absoluteFilePath());
        } else {
            savePath = target.absoluteFilePath();
        }

        TaskError addError;
        if (auto id = manager.addTask(url, savePath, &addError)) {
            out << "Added task " << *id << ": " << savePath << Qt::endl;
        } else {
            report(addError);
        }
    }

    // Commands on existing tasks
    auto applyCommand = [&](const QCommandLineOption& option,
                            bool (TaskManager::*command)(TaskId, TaskError*)) {
        if (!parser.isSet(option)) return;

        for (const QString& value : parser.values(option)) {
            bool ok = false;
            const TaskId id = value.toLongLong(&ok);
            TaskError commandError;
            if (!ok) {
                setError(&commandError, ErrorCategory::InvalidInput,
                         QStringLiteral("Invalid task id: %1").arg(value));
                report(commandError);
            } else if (!(manager.*command)(id, &commandError)) {
                report(commandError);
            }
        }
    };

    applyCommand(startOption, &TaskManager::startTask);
    applyCommand(resumeOption, &TaskManager::resumeTask);
    applyCommand(stopOption, &TaskManager::stopTask);
    applyCommand(deleteOption, &TaskManager::deleteTask);

    if (parser.isSet(resumeAllOption)) {
        for (const TaskSnapshot& snap : manager.listTasks()) {
            TaskError commandError;
            bool ok = true;
            if (snap.status() == TaskStatus::Paused) {
                ok = manager.resumeTask(snap.id(), &commandError);
            } else if (snap.status() == TaskStatus::Pending) {
                ok = manager.startTask(snap.id(), &commandError);
            }
            if (!ok) {
                report(commandError);
            }
        }
    }

    if (parser.isSet(listOption)) {
        printTable(out, manager.listTasks());
    } else if (manager.activeCount() > 0) {
        // Progress readout
        QTimer ticker;
        ticker.setInterval(1000);
        QObject::connect(&ticker, &QTimer::timeout, &app, [&]() {
            for (const TaskSnapshot& snap : manager.listTasks()) {
                if (snap.status() == TaskStatus::Downloading) {
                    out << progressLine(snap) << Qt::endl;
                }
            }
            if (manager.activeCount() == 0) {
                app.quit();
            }
        });
        ticker.start();

        // SIGINT / SIGTERM
        QTimer signalPoll;
        signalPoll.setInterval(200);
        QObject::connect(&signalPoll, &QTimer::timeout, &app, [&]() {
            if (g_terminateRequested.load()) {
                qInfo() << "main: Termination requested, pausing active downloads";
                app.quit();
            }
        });
        signalPoll.start();

        app.exec();
    }

    manager.shutdown();
    store.close();

    qDebug() << "main: Exiting with code" << exitCode;
    Logging::uninstall();
    return exitCode;
}
