/**
 * @file EngineSupervisor.h
 * @brief Drives the external transfer engine for one task
 *
 * The supervisor launches the engine as a child process, streams its
 * console readout through ProgressParser, honours the task's pause/stop
 * flags and relaunches the engine across pause/resume cycles.
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#ifndef DADALOADER_ENGINESUPERVISOR_H
#define DADALOADER_ENGINESUPERVISOR_H

#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QStringList>

#include <optional>

#include "dadaloader/engine/ProgressParser.h"
#include "dadaloader/engine/Types.h"

class QTimer;

namespace DadaLoader {

class Task;

/**
 * @brief How the engine is invoked and supervised
 */
struct EngineOptions {
    QString program = QString::fromLatin1(Config::ENGINE_PROGRAM);
    int connections = Config::ENGINE_CONNECTIONS;
    int summaryIntervalSeconds = Config::ENGINE_SUMMARY_INTERVAL_SECONDS;
    Duration pausePollInterval = Config::PAUSE_POLL_INTERVAL;
    Duration flagPollInterval = Config::FLAG_POLL_INTERVAL;
    Duration terminateGrace = Config::ENGINE_TERMINATE_GRACE;

    /**
     * @brief Build options from persisted settings
     *
     * An empty engine path is resolved with locateEngine().
     */
    static EngineOptions fromSettings(const Settings& settings);

    /**
     * @brief Find the engine binary
     * @param configuredPath Explicit path from settings (may be empty)
     * @return Absolute path, or the bare program name when not found
     */
    static QString locateEngine(const QString& configuredPath = QString());
};

/**
 * @brief Event-driven supervision of one task's engine runs
 *
 * States:
 *   Idle ──run──> Launching ──started──> Streaming
 *   Streaming ──pause flag──> Terminating ──exit──> PausedWait
 *   PausedWait ──flag cleared──> Launching
 *   Streaming ──exit / stop flag──> ... ──> Finalizing ──> Finished
 *
 * Notifications for one run are emitted in engine order, and finished()
 * is always the last one.
 */
class EngineSupervisor : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Launching,
        Streaming,
        Terminating,
        PausedWait,
        Finalizing,
        Finished
    };
    Q_ENUM(State)

    EngineSupervisor(const Task& task, const EngineOptions& options, QObject* parent = nullptr);
    ~EngineSupervisor() override;

    /**
     * @brief Engine argument list for a download
     *
     * -x N -s N --dir <dir> --out <name> --continue=true --summary-interval=S <url>
     */
    static QStringList buildArguments(const EngineOptions& options,
                                      const QString& url, const QString& savePath);

    [[nodiscard]] State state() const { return m_state; }

    /// @return True from launch until the final outcome has been reported
    [[nodiscard]] bool isActive() const {
        return m_state != State::Idle && m_state != State::Finished;
    }

    /// @return True while an engine process exists (not while waiting in pause)
    [[nodiscard]] bool isEngineRunning() const {
        return m_state == State::Launching || m_state == State::Streaming ||
               m_state == State::Terminating;
    }

    /// @return Number of engine processes launched so far
    [[nodiscard]] int launchCount() const { return m_launchCount; }

    [[nodiscard]] const EngineOptions& options() const { return m_options; }

    /**
     * @brief Begin a supervision run
     * @return false if a run is already active
     */
    bool run();

    /**
     * @brief Terminate any engine synchronously and go quiet
     *
     * No progress, status or outcome notification follows.
     */
    void shutdown();

signals:
    void progressSampled(const DadaLoader::ProgressSample& sample);

    /// Non-terminal status change: Paused, or Downloading after a relaunch
    void statusReported(DadaLoader::TaskStatus status);

    /// Terminal outcome of the run (Completed, Error or Stopped)
    void finished(DadaLoader::TaskStatus outcome, const QString& message);

    /// Emitted once for every engine process this supervisor terminates
    void engineTerminated();

private slots:
    void onStarted();
    void onReadyReadStandardOutput();
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessError(QProcess::ProcessError error);
    void onFlagPoll();
    void onPausePoll();
    void onTerminateTimeout();

private:
    void launch();
    void drainLines();
    void handleLine(const QString& line);
    bool checkFlags();
    void terminateEngine(TaskStatus reason);
    void enterPausedWait();
    void finalize(TaskStatus outcome, const QString& message = QString());
    void releaseProcess();
    void setState(State state);
    QString failureMessage(int exitCode, QProcess::ExitStatus exitStatus) const;

    const Task& m_task;
    EngineOptions m_options;

    State m_state = State::Idle;
    QProcess* m_process = nullptr;
    QByteArray m_outputBuffer;
    QByteArray m_errorTail;

    QTimer* m_flagTimer = nullptr;
    QTimer* m_pauseTimer = nullptr;
    QTimer* m_terminateTimer = nullptr;

    std::optional<TaskStatus> m_terminationReason;
    QString m_ioErrorMessage;
    int m_launchCount = 0;
};

} // namespace DadaLoader

#endif // DADALOADER_ENGINESUPERVISOR_H
