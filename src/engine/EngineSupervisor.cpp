/**
 * @file EngineSupervisor.cpp
 * @brief Implementation of EngineSupervisor
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#include "dadaloader/engine/EngineSupervisor.h"
#include "dadaloader/engine/Task.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTimer>

#include <exception>

namespace DadaLoader {

namespace {

constexpr int ERROR_TAIL_BYTES = 512;

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// EngineOptions
// ═══════════════════════════════════════════════════════════════════════════════

EngineOptions EngineOptions::fromSettings(const Settings& settings) {
    EngineOptions options;
    options.program = locateEngine(settings.enginePath);
    if (settings.connections > 0) {
        options.connections = settings.connections;
    }
    if (settings.pausePollInterval.count() > 0) {
        options.pausePollInterval = settings.pausePollInterval;
    }
    return options;
}

QString EngineOptions::locateEngine(const QString& configuredPath) {
    if (!configuredPath.isEmpty()) {
        QFileInfo info(configuredPath);
        if (info.exists() && info.isExecutable()) {
            return info.absoluteFilePath();
        }
        qWarning() << "EngineSupervisor: Configured engine" << configuredPath
                   << "is not executable, searching PATH";
    }

    const QString program = QString::fromLatin1(Config::ENGINE_PROGRAM);

    QString path = QStandardPaths::findExecutable(program);
    if (!path.isEmpty()) {
        return path;
    }

    const QStringList commonPaths = {
        QStringLiteral("/usr/local/bin"),
        QStringLiteral("/usr/bin"),
        QStringLiteral("/opt/homebrew/bin"),
        QDir::homePath() + QStringLiteral("/.local/bin")
    };

    path = QStandardPaths::findExecutable(program, commonPaths);
    if (!path.isEmpty()) {
        return path;
    }

    qWarning() << "EngineSupervisor:" << program << "not found, relying on PATH at launch";
    return program;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Constructor / Destructor
// ═══════════════════════════════════════════════════════════════════════════════

EngineSupervisor::EngineSupervisor(const Task& task, const EngineOptions& options,
                                   QObject* parent)
    : QObject(parent)
    , m_task(task)
    , m_options(options)
    , m_flagTimer(new QTimer(this))
    , m_pauseTimer(new QTimer(this))
    , m_terminateTimer(new QTimer(this))
{
    m_flagTimer->setInterval(m_options.flagPollInterval);
    m_pauseTimer->setInterval(m_options.pausePollInterval);
    m_terminateTimer->setInterval(m_options.terminateGrace);
    m_terminateTimer->setSingleShot(true);

    connect(m_flagTimer, &QTimer::timeout, this, &EngineSupervisor::onFlagPoll);
    connect(m_pauseTimer, &QTimer::timeout, this, &EngineSupervisor::onPausePoll);
    connect(m_terminateTimer, &QTimer::timeout, this, &EngineSupervisor::onTerminateTimeout);
}

EngineSupervisor::~EngineSupervisor() {
    shutdown();
}

QStringList EngineSupervisor::buildArguments(const EngineOptions& options,
                                             const QString& url, const QString& savePath) {
    const QFileInfo target(savePath);
    const QString connections = QString::number(options.connections);

    return {
        QStringLiteral("-x"), connections,
        QStringLiteral("-s"), connections,
        QStringLiteral("--dir"), target.absolutePath(),
        QStringLiteral("--out"), target.fileName(),
        QStringLiteral("--continue=true"),
        QStringLiteral("--summary-interval=%1").arg(options.summaryIntervalSeconds),
        url
    };
}

// ═══════════════════════════════════════════════════════════════════════════════
// Control
// ═══════════════════════════════════════════════════════════════════════════════

bool EngineSupervisor::run() {
    if (isActive()) {
        qWarning() << "EngineSupervisor: Task" << m_task.id() << "already supervised";
        return false;
    }

    m_terminationReason.reset();
    m_ioErrorMessage.clear();

    try {
        launch();
    } catch (const std::exception& e) {
        qCritical() << "EngineSupervisor: Launch failed for task" << m_task.id() << ":" << e.what();
        finalize(TaskStatus::Error, QString::fromUtf8(e.what()));
    }

    return true;
}

void EngineSupervisor::shutdown() {
    m_flagTimer->stop();
    m_pauseTimer->stop();
    m_terminateTimer->stop();

    if (m_process) {
        m_process->disconnect(this);

        if (m_process->state() != QProcess::NotRunning) {
            qDebug() << "EngineSupervisor: Shutting down engine for task" << m_task.id();
            m_process->terminate();
            emit engineTerminated();

            const int graceMs = static_cast<int>(m_options.terminateGrace.count());
            if (!m_process->waitForFinished(graceMs)) {
                qWarning() << "EngineSupervisor: Engine ignored terminate, killing";
                m_process->kill();
                m_process->waitForFinished(graceMs);
            }
        }

        releaseProcess();
    }

    m_terminationReason.reset();
    if (m_state != State::Idle) {
        setState(State::Finished);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Engine Runs
// ═══════════════════════════════════════════════════════════════════════════════

void EngineSupervisor::launch() {
    setState(State::Launching);
    m_outputBuffer.clear();
    m_errorTail.clear();

    m_process = new QProcess(this);
    m_process->setProcessChannelMode(QProcess::SeparateChannels);

    connect(m_process, &QProcess::started, this, &EngineSupervisor::onStarted);
    connect(m_process, &QProcess::readyReadStandardOutput,
            this, &EngineSupervisor::onReadyReadStandardOutput);
    connect(m_process, &QProcess::readyReadStandardError, this, [this]() {
        if (!m_process) return;
        m_errorTail.append(m_process->readAllStandardError());
        if (m_errorTail.size() > ERROR_TAIL_BYTES) {
            m_errorTail = m_errorTail.right(ERROR_TAIL_BYTES);
        }
    });
    connect(m_process, &QProcess::finished, this, &EngineSupervisor::onProcessFinished);
    connect(m_process, &QProcess::errorOccurred, this, &EngineSupervisor::onProcessError);

    const QStringList args = buildArguments(m_options, m_task.url(), m_task.savePath());
    ++m_launchCount;

    qDebug() << "EngineSupervisor: Launching" << m_options.program << args.join(QLatin1Char(' '));

    m_process->start(m_options.program, args);
}

void EngineSupervisor::onStarted() {
    try {
        setState(State::Streaming);
        m_flagTimer->start();
        checkFlags();
    } catch (const std::exception& e) {
        finalize(TaskStatus::Error, QString::fromUtf8(e.what()));
    }
}

void EngineSupervisor::onReadyReadStandardOutput() {
    if (!m_process) return;

    try {
        m_outputBuffer.append(m_process->readAllStandardOutput());
        drainLines();
    } catch (const std::exception& e) {
        qCritical() << "EngineSupervisor: Output handling failed for task" << m_task.id()
                    << ":" << e.what();
        m_ioErrorMessage = QString::fromUtf8(e.what());
        terminateEngine(TaskStatus::Error);
    }
}

void EngineSupervisor::drainLines() {
    while (m_state == State::Streaming) {
        qsizetype end = -1;
        for (qsizetype i = 0; i < m_outputBuffer.size(); ++i) {
            const char c = m_outputBuffer.at(i);
            if (c == '\n' || c == '\r') {
                end = i;
                break;
            }
        }
        if (end < 0) {
            break;
        }

        const QByteArray raw = m_outputBuffer.left(end).trimmed();
        m_outputBuffer.remove(0, end + 1);

        if (!raw.isEmpty()) {
            handleLine(QString::fromUtf8(raw));
        }
    }
}

void EngineSupervisor::handleLine(const QString& line) {
    // Flags are honoured before the line is applied
    if (checkFlags()) {
        return;
    }

    if (auto sample = ProgressParser::parseLine(line)) {
        emit progressSampled(*sample);
    }
}

bool EngineSupervisor::checkFlags() {
    if (m_state != State::Streaming) {
        return false;
    }

    if (m_task.isStopRequested()) {
        terminateEngine(TaskStatus::Stopped);
        return true;
    }

    if (m_task.isPauseRequested()) {
        terminateEngine(TaskStatus::Paused);
        return true;
    }

    return false;
}

void EngineSupervisor::onFlagPoll() {
    checkFlags();
}

void EngineSupervisor::terminateEngine(TaskStatus reason) {
    if (!m_process || m_state == State::Terminating) {
        return;
    }

    m_terminationReason = reason;
    m_flagTimer->stop();
    setState(State::Terminating);

    qDebug() << "EngineSupervisor: Terminating engine for task" << m_task.id()
             << "(" << taskStatusToString(reason) << ")";

    m_process->terminate();
    emit engineTerminated();
    m_terminateTimer->start();
}

void EngineSupervisor::onTerminateTimeout() {
    if (m_process && m_process->state() != QProcess::NotRunning) {
        qWarning() << "EngineSupervisor: Engine for task" << m_task.id()
                   << "ignored terminate, killing";
        m_process->kill();
    }
}

void EngineSupervisor::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus) {
    try {
        m_flagTimer->stop();
        m_terminateTimer->stop();

        // Lines the engine wrote just before exiting still count, unless
        // the run was already being torn down
        if (m_process && m_state == State::Streaming && !m_task.isStopRequested()) {
            m_outputBuffer.append(m_process->readAllStandardOutput());
            m_outputBuffer.append('\n');
            while (!m_outputBuffer.isEmpty()) {
                qsizetype end = m_outputBuffer.indexOf('\n');
                const qsizetype cr = m_outputBuffer.indexOf('\r');
                if (cr >= 0 && (end < 0 || cr < end)) end = cr;
                const QByteArray raw = m_outputBuffer.left(end).trimmed();
                m_outputBuffer.remove(0, end + 1);
                if (raw.isEmpty()) continue;
                if (auto sample = ProgressParser::parseLine(QString::fromUtf8(raw))) {
                    emit progressSampled(*sample);
                }
            }
        }

        if (m_process) {
            m_errorTail.append(m_process->readAllStandardError());
        }
        const QString failure = failureMessage(exitCode, exitStatus);
        const std::optional<TaskStatus> reason = m_terminationReason;
        m_terminationReason.reset();
        releaseProcess();

        qDebug() << "EngineSupervisor: Engine for task" << m_task.id()
                 << "exited with code" << exitCode;

        if (m_task.isStopRequested() || reason == TaskStatus::Stopped) {
            finalize(TaskStatus::Stopped);
        } else if (reason == TaskStatus::Error) {
            finalize(TaskStatus::Error, m_ioErrorMessage);
        } else if (m_task.isPauseRequested() || reason == TaskStatus::Paused) {
            enterPausedWait();
        } else if (exitStatus == QProcess::NormalExit && exitCode == 0) {
            finalize(TaskStatus::Completed);
        } else {
            qWarning() << "EngineSupervisor: Task" << m_task.id() << failure;
            finalize(TaskStatus::Error, failure);
        }
    } catch (const std::exception& e) {
        finalize(TaskStatus::Error, QString::fromUtf8(e.what()));
    }
}

void EngineSupervisor::onProcessError(QProcess::ProcessError error) {
    if (!m_process) return;

    switch (error) {
        case QProcess::FailedToStart: {
            // No finished() follows a failed start
            const QString message = QStringLiteral("%1: failed to start %2: %3")
                .arg(errorCategoryToString(ErrorCategory::EngineLaunchFailure),
                     m_options.program, m_process->errorString());
            qCritical() << "EngineSupervisor: Task" << m_task.id() << message;
            finalize(TaskStatus::Error, message);
            break;
        }
        case QProcess::ReadError: {
            m_ioErrorMessage = QStringLiteral("%1: %2")
                .arg(errorCategoryToString(ErrorCategory::EngineIOFailure),
                     m_process->errorString());
            qCritical() << "EngineSupervisor: Task" << m_task.id() << m_ioErrorMessage;
            if (m_state == State::Terminating) {
                m_terminationReason = TaskStatus::Error;
            } else {
                terminateEngine(TaskStatus::Error);
            }
            break;
        }
        case QProcess::Crashed:
            // Reported through finished() with CrashExit
            qDebug() << "EngineSupervisor: Engine for task" << m_task.id() << "crashed";
            break;
        default:
            qWarning() << "EngineSupervisor: Process error" << error
                       << "for task" << m_task.id() << ":" << m_process->errorString();
            break;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Pause Wait
// ═══════════════════════════════════════════════════════════════════════════════

void EngineSupervisor::enterPausedWait() {
    setState(State::PausedWait);
    emit statusReported(TaskStatus::Paused);
    m_pauseTimer->start();
}

void EngineSupervisor::onPausePoll() {
    if (m_state != State::PausedWait) {
        m_pauseTimer->stop();
        return;
    }

    try {
        if (m_task.isStopRequested()) {
            m_pauseTimer->stop();
            finalize(TaskStatus::Stopped);
        } else if (!m_task.isPauseRequested()) {
            m_pauseTimer->stop();
            qDebug() << "EngineSupervisor: Task" << m_task.id() << "resumed, relaunching engine";
            emit statusReported(TaskStatus::Downloading);
            launch();
        }
    } catch (const std::exception& e) {
        finalize(TaskStatus::Error, QString::fromUtf8(e.what()));
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

void EngineSupervisor::finalize(TaskStatus outcome, const QString& message) {
    setState(State::Finalizing);

    m_flagTimer->stop();
    m_pauseTimer->stop();
    m_terminateTimer->stop();
    releaseProcess();
    m_terminationReason.reset();

    setState(State::Finished);

    qDebug() << "EngineSupervisor: Task" << m_task.id() << "finished as"
             << taskStatusToString(outcome);
    emit finished(outcome, message);
}

void EngineSupervisor::releaseProcess() {
    if (!m_process) return;

    // May run inside one of the process's own signals
    m_process->disconnect(this);
    m_process->deleteLater();
    m_process = nullptr;
}

void EngineSupervisor::setState(State state) {
    m_state = state;
}

QString EngineSupervisor::failureMessage(int exitCode, QProcess::ExitStatus exitStatus) const {
    QString message = exitStatus == QProcess::CrashExit
        ? QStringLiteral("Engine crashed")
        : QStringLiteral("Engine exited with code %1").arg(exitCode);

    const QList<QByteArray> lines = m_errorTail.trimmed().split('\n');
    const QString lastLine = QString::fromUtf8(lines.last().trimmed());
    if (!lastLine.isEmpty()) {
        message += QStringLiteral(": ") + lastLine;
    }
    return message;
}

} // namespace DadaLoader
