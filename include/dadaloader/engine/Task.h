/**
 * @file Task.h
 * @brief In-memory state of one download and its status state machine
 *
 * A Task owns the persisted fields of its TaskRecord, the runtime-only
 * fields (speed, ETA, start time) and the cooperative pause/stop flags.
 * It also owns the EngineSupervisor that drives it; nothing else ever
 * drives a given Task.
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#ifndef DADALOADER_TASK_H
#define DADALOADER_TASK_H

#include <QDateTime>
#include <QMutex>
#include <QObject>

#include <atomic>
#include <memory>

#include "dadaloader/engine/ProgressParser.h"
#include "dadaloader/engine/Types.h"

namespace DadaLoader {

// Forward declarations
class EngineSupervisor;
struct EngineOptions;

/**
 * @brief Manages the lifecycle state of a single download
 *
 * State machine:
 *   Pending ──start──> Downloading ──(supervisor)──> Paused / Completed / Error / Stopped
 *   Paused ──resume──> Downloading
 *   Paused ──stop────> Stopped
 *   Stopped / Error / Completed ──start──> Downloading
 *
 * Commands that are invalid for the current status are no-ops and return
 * false. pause() and stop() only raise a flag while an engine is running;
 * the supervisor observes it and reports the resulting status.
 *
 * Thread Safety:
 * - Record and runtime fields are guarded by an internal mutex
 * - Pause/stop flags are atomics, polled by the supervisor
 */
class Task : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Create a task for an existing record
     * @param record Persisted fields (id already assigned by the store)
     * @param options Engine invocation options for the supervisor
     * @param parent QObject parent
     */
    Task(const TaskRecord& record, const EngineOptions& options, QObject* parent = nullptr);

    ~Task() override;

    // Non-copyable
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // ═══════════════════════════════════════════════════════════════════════════
    // Identification
    // ═══════════════════════════════════════════════════════════════════════════

    [[nodiscard]] TaskId id() const { return m_id; }
    [[nodiscard]] QString url() const { return m_url; }
    [[nodiscard]] QString savePath() const { return m_savePath; }
    [[nodiscard]] QString fileName() const;

    // ═══════════════════════════════════════════════════════════════════════════
    // State
    // ═══════════════════════════════════════════════════════════════════════════

    [[nodiscard]] TaskStatus status() const;

    [[nodiscard]] bool isPauseRequested() const {
        return m_pauseRequested.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool isStopRequested() const {
        return m_stopRequested.load(std::memory_order_acquire);
    }

    /// @return True while the supervisor runs an engine or waits in pause
    [[nodiscard]] bool isEngineActive() const;

    /// @return True while an engine process is running and will report a pause itself
    [[nodiscard]] bool isEngineRunning() const;

    [[nodiscard]] bool canStart() const;
    [[nodiscard]] bool canPause() const;
    [[nodiscard]] bool canResume() const;
    [[nodiscard]] bool canStop() const;

    /// @return Copy of the persisted fields
    [[nodiscard]] TaskRecord record() const;

    /// @return Copy of all fields for display
    [[nodiscard]] TaskSnapshot snapshot() const;

    /// @return Supervisor driving this task
    [[nodiscard]] EngineSupervisor* supervisor() const { return m_supervisor.get(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Field Updates
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Compute the fields that result from a progress sample
     *
     * Parsed byte counts are the source of truth and the percentage is
     * derived from them. Within a run the byte count never decreases; only
     * the first sample after start() may move it backwards.
     */
    [[nodiscard]] TaskSnapshot withSample(const ProgressSample& sample) const;

    /**
     * @brief Compute the fields that result from a status change
     */
    [[nodiscard]] TaskSnapshot withStatus(TaskStatus status,
                                          const QString& message = QString()) const;

    /**
     * @brief Install previously computed fields
     * @param next Result of withSample() or withStatus()
     * @param sampleApplied True when @p next came from a progress sample
     */
    void commit(const TaskSnapshot& next, bool sampleApplied = false);

    // ═══════════════════════════════════════════════════════════════════════════
    // Actions
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Start (or restart) the download
     *
     * Valid from Pending, Stopped, Error and Completed.
     */
    bool start();

    /**
     * @brief Request a pause; valid only while Downloading
     */
    bool pause();

    /**
     * @brief Resume a paused download
     */
    bool resume();

    /**
     * @brief Request a stop; valid from Downloading and Paused
     */
    bool stop();

    /**
     * @brief Stop the engine and remove the partial or complete file
     * @return false if a file could not be removed
     */
    bool remove();

    /**
     * @brief Terminate the engine synchronously and settle in @p status
     *
     * Used on shutdown. The caller persists @p status first.
     */
    void halt(TaskStatus status);

signals:
    void statusChanged(TaskStatus status);
    void progressChanged();

private:
    TaskSnapshot snapshotLocked() const;
    void setStatusLocked(TaskStatus status);

    const TaskId m_id;
    const QString m_url;
    const QString m_savePath;

    mutable QMutex m_mutex;
    TaskRecord m_record;
    SpeedBps m_speed = 0.0;
    qint64 m_eta = 0;
    QDateTime m_startTime;
    QString m_errorMessage;
    bool m_rewindAllowed = false;

    std::atomic<bool> m_pauseRequested{false};
    std::atomic<bool> m_stopRequested{false};

    std::unique_ptr<EngineSupervisor> m_supervisor;
};

} // namespace DadaLoader

#endif // DADALOADER_TASK_H
