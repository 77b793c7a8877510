/**
 * @file TaskManager.h
 * @brief Owns every Task and coordinates commands with the durable store
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#ifndef DADALOADER_TASKMANAGER_H
#define DADALOADER_TASKMANAGER_H

#include <QMutex>
#include <QObject>

#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "dadaloader/engine/EngineSupervisor.h"
#include "dadaloader/engine/ProgressParser.h"
#include "dadaloader/engine/Task.h"
#include "dadaloader/engine/Types.h"

class QTimer;

namespace DadaLoader {

class TaskStore;

/**
 * @brief Top-level façade of the orchestration engine
 *
 * Every change to a task's persisted fields is written to the TaskStore
 * before it is applied in memory, so listTasks() only ever shows durable
 * state. Supervisor notifications are delivered through queued
 * connections and applied in the order the engine produced them.
 *
 * Usage:
 * @code
 *   PersistenceManager store;
 *   store.initialize();
 *   TaskManager manager(store, EngineOptions::fromSettings(store.loadSettings()));
 *   manager.initialize();
 *   TaskError error;
 *   if (auto id = manager.addTask(url, path, &error)) { ... }
 * @endcode
 */
class TaskManager : public QObject {
    Q_OBJECT

public:
    TaskManager(TaskStore& store, const EngineOptions& options, QObject* parent = nullptr);
    ~TaskManager() override;

    // Non-copyable
    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    /**
     * @brief Load every stored task
     *
     * Records left in Downloading by a previous run are converted to Paused
     * and that conversion is persisted.
     */
    bool initialize(TaskError* error = nullptr);

    /**
     * @brief Terminate every engine and persist running tasks as Paused
     */
    void shutdown();

    // ═══════════════════════════════════════════════════════════════════════════
    // Commands
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Create a task and start it
     * @return New id, or std::nullopt with InvalidInput / PersistenceFailure
     */
    std::optional<TaskId> addTask(const QString& url, const QString& savePath,
                                  TaskError* error = nullptr);

    /// Invalid transitions are no-ops and still return true
    bool startTask(TaskId id, TaskError* error = nullptr);
    bool pauseTask(TaskId id, TaskError* error = nullptr);
    bool resumeTask(TaskId id, TaskError* error = nullptr);
    bool stopTask(TaskId id, TaskError* error = nullptr);

    /**
     * @brief Stop the task, remove its files and drop its record
     */
    bool deleteTask(TaskId id, TaskError* error = nullptr);

    // ═══════════════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════════════

    /// @return Snapshots ordered by id
    [[nodiscard]] std::vector<TaskSnapshot> listTasks() const;

    [[nodiscard]] std::optional<TaskSnapshot> taskSnapshot(TaskId id) const;

    [[nodiscard]] int taskCount() const;

    /// @return Number of tasks currently Downloading
    [[nodiscard]] int activeCount() const;

    /// @return True while a supervisor outcome waits for a successful write
    [[nodiscard]] bool hasPendingCommit(TaskId id) const;

    [[nodiscard]] const EngineOptions& engineOptions() const { return m_options; }

    /**
     * @brief Derive a non-colliding save path for a URL
     *
     * The file name comes from the URL path (download_<epoch> when empty);
     * _1, _2, ... is appended before the extension until the path is free.
     */
    static QString suggestSavePath(const QString& url, const QString& directory);

    /**
     * @brief Check a URL and save path before any state is created
     */
    static bool validateInput(const QString& url, const QString& savePath,
                              TaskError* error = nullptr);

public slots:
    void onProgress(DadaLoader::TaskId id, const DadaLoader::ProgressSample& sample);
    void onStatusReported(DadaLoader::TaskId id, DadaLoader::TaskStatus status);
    void onOutcome(DadaLoader::TaskId id, DadaLoader::TaskStatus outcome, const QString& message);

signals:
    void taskAdded(DadaLoader::TaskId id);
    void taskRemoved(DadaLoader::TaskId id);
    void taskUpdated(DadaLoader::TaskId id);
    void taskStatusChanged(DadaLoader::TaskId id, DadaLoader::TaskStatus status);
    void taskFailed(DadaLoader::TaskId id, const QString& message);
    void persistenceFailed(DadaLoader::TaskId id, const QString& message);
    void engineTerminated(DadaLoader::TaskId id);

private slots:
    void onRetryTimer();

private:
    enum class Command { Start, Pause, Resume, Stop };

    struct SupervisorEvent {
        enum class Kind { Sample, Status, Outcome };
        Kind kind = Kind::Sample;
        ProgressSample sample;
        TaskStatus status = TaskStatus::Downloading;
        QString message;
    };

    struct PendingCommit {
        TaskSnapshot next;
        bool sampleApplied = false;
        std::deque<SupervisorEvent> backlog;
    };

    struct Notification {
        enum class Kind { Added, Removed, Updated, StatusChanged, Failed, PersistenceFailed };
        Kind kind;
        TaskId id;
        TaskStatus status = TaskStatus::Pending;
        QString message;
    };

    bool runCommand(TaskId id, Command command, TaskError* error);
    Task* findTaskLocked(TaskId id) const;
    void connectTask(Task* task);

    bool persistLocked(const TaskRecord& record);
    bool persistCommandLocked(Task* task, TaskStatus target, TaskError* error);
    void handleEventLocked(TaskId id, SupervisorEvent event);
    bool applyEventLocked(Task* task, const SupervisorEvent& event);
    void commitLocked(Task* task, const TaskSnapshot& next, bool sampleApplied);
    bool flushPendingLocked(TaskId id);

    void postLocked(Notification::Kind kind, TaskId id,
                    TaskStatus status = TaskStatus::Pending,
                    const QString& message = QString());
    void deliverNotifications();

    TaskStore& m_store;
    EngineOptions m_options;

    std::map<TaskId, std::unique_ptr<Task>> m_tasks;
    std::map<TaskId, PendingCommit> m_pending;
    std::vector<Notification> m_outbox;
    bool m_shutdown = false;
    mutable QMutex m_mutex;

    QTimer* m_retryTimer = nullptr;
};

} // namespace DadaLoader

#endif // DADALOADER_TASKMANAGER_H
