/**
 * @file TaskManager.cpp
 * @brief Implementation of TaskManager
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#include "dadaloader/engine/TaskManager.h"
#include "dadaloader/persistence/TaskStore.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QTimer>
#include <QUrl>

namespace DadaLoader {

namespace {

const QStringList SUPPORTED_SCHEMES = {
    QStringLiteral("http"),
    QStringLiteral("https"),
    QStringLiteral("ftp"),
    QStringLiteral("sftp")
};

// Outcomes are queued, so a command may settle the task first. An outcome
// only applies to a task still Downloading, or to a Paused one being stopped.
bool outcomeApplies(TaskStatus current, TaskStatus outcome) {
    switch (current) {
        case TaskStatus::Downloading:
            return true;
        case TaskStatus::Paused:
            return outcome == TaskStatus::Stopped;
        default:
            return false;
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Constructor / Destructor
// ═══════════════════════════════════════════════════════════════════════════════

TaskManager::TaskManager(TaskStore& store, const EngineOptions& options, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_options(options)
    , m_retryTimer(new QTimer(this))
{
    qRegisterMetaType<DadaLoader::TaskStatus>("DadaLoader::TaskStatus");
    qRegisterMetaType<DadaLoader::ProgressSample>("DadaLoader::ProgressSample");
    qRegisterMetaType<DadaLoader::TaskId>("DadaLoader::TaskId");

    m_retryTimer->setInterval(Config::STORE_RETRY_INTERVAL);
    connect(m_retryTimer, &QTimer::timeout, this, &TaskManager::onRetryTimer);

    qDebug() << "TaskManager: Created with engine" << m_options.program;
}

TaskManager::~TaskManager() {
    shutdown();

    QMutexLocker lock(&m_mutex);
    m_tasks.clear();
}

bool TaskManager::initialize(TaskError* error) {
    bool ok = true;

    {
        QMutexLocker lock(&m_mutex);

        const std::vector<TaskRecord> records = m_store.listAll();
        const QString loadError = m_store.lastError();

        for (TaskRecord record : records) {
            if (m_tasks.count(record.id)) {
                continue;
            }

            // The previous process died mid-transfer: make it resumable
            if (record.status == TaskStatus::Downloading) {
                record.status = TaskStatus::Paused;
                record.isPaused = true;
                if (!persistLocked(record)) {
                    qCritical() << "TaskManager: Could not mark interrupted task"
                                << record.id << "as Paused";
                    postLocked(Notification::Kind::PersistenceFailed, record.id,
                               TaskStatus::Pending, m_store.lastError());
                }
            }

            auto task = std::make_unique<Task>(record, m_options);
            connectTask(task.get());
            m_tasks.emplace(record.id, std::move(task));
            postLocked(Notification::Kind::Added, record.id);
        }

        qDebug() << "TaskManager: Loaded" << m_tasks.size() << "tasks";

        if (records.empty() && !loadError.isEmpty()) {
            setError(error, ErrorCategory::PersistenceFailure, loadError);
            ok = false;
        }
    }

    deliverNotifications();
    return ok;
}

void TaskManager::shutdown() {
    {
        QMutexLocker lock(&m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
        m_retryTimer->stop();

        qDebug() << "TaskManager: Shutting down" << m_tasks.size() << "tasks";

        for (auto& [id, task] : m_tasks) {
            if (!flushPendingLocked(id)) {
                qCritical() << "TaskManager: Task" << id << "has an unwritten update at shutdown";
            }

            if (!task->isEngineActive()) {
                continue;
            }

            const TaskStatus settled = task->isStopRequested()
                ? TaskStatus::Stopped : TaskStatus::Paused;
            if (!persistLocked(task->withStatus(settled).record)) {
                qCritical() << "TaskManager: Could not persist task" << id << "at shutdown";
            }
            task->halt(settled);
            postLocked(Notification::Kind::StatusChanged, id, settled);
        }
    }

    deliverNotifications();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<TaskId> TaskManager::addTask(const QString& url, const QString& savePath,
                                           TaskError* error) {
    if (!validateInput(url, savePath, error)) {
        return std::nullopt;
    }

    std::optional<TaskId> result;

    {
        QMutexLocker lock(&m_mutex);

        TaskRecord record;
        record.url = url.trimmed();
        record.savePath = QFileInfo(savePath).absoluteFilePath();
        record.status = TaskStatus::Pending;

        std::optional<TaskId> id;
        for (int attempt = 1; attempt <= Config::STORE_WRITE_ATTEMPTS && !id; ++attempt) {
            id = m_store.create(record);
        }

        if (!id) {
            const QString message = m_store.lastError();
            qCritical() << "TaskManager: Could not create task for" << record.url << ":" << message;
            setError(error, ErrorCategory::PersistenceFailure, message);
            return std::nullopt;
        }

        record.id = *id;
        auto owned = std::make_unique<Task>(record, m_options);
        Task* task = owned.get();
        connectTask(task);
        m_tasks.emplace(record.id, std::move(owned));

        qDebug() << "TaskManager: Added task" << record.id << record.url << "->" << record.savePath;
        postLocked(Notification::Kind::Added, record.id);
        postLocked(Notification::Kind::StatusChanged, record.id, TaskStatus::Pending);

        if (persistCommandLocked(task, TaskStatus::Downloading, nullptr)) {
            if (!task->start()) {
                qWarning() << "TaskManager: Task" << record.id << "did not start";
            }
            postLocked(Notification::Kind::StatusChanged, record.id, task->status());
        }

        result = record.id;
    }

    deliverNotifications();
    return result;
}

bool TaskManager::startTask(TaskId id, TaskError* error) {
    return runCommand(id, Command::Start, error);
}

bool TaskManager::pauseTask(TaskId id, TaskError* error) {
    return runCommand(id, Command::Pause, error);
}

bool TaskManager::resumeTask(TaskId id, TaskError* error) {
    return runCommand(id, Command::Resume, error);
}

bool TaskManager::stopTask(TaskId id, TaskError* error) {
    return runCommand(id, Command::Stop, error);
}

bool TaskManager::runCommand(TaskId id, Command command, TaskError* error) {
    bool ok = true;

    {
        QMutexLocker lock(&m_mutex);

        Task* task = findTaskLocked(id);
        if (!task) {
            setError(error, ErrorCategory::NotFound, QStringLiteral("No task with id %1").arg(id));
            return false;
        }

        // An outcome still waiting for the store blocks further transitions
        if (!flushPendingLocked(id)) {
            setError(error, ErrorCategory::PersistenceFailure, m_store.lastError());
            ok = false;
        } else {
            const TaskStatus before = task->status();

            switch (command) {
                case Command::Start:
                    if (task->canStart() &&
                        (ok = persistCommandLocked(task, TaskStatus::Downloading, error))) {
                        if (!task->start()) {
                            qWarning() << "TaskManager: Task" << id << "did not start";
                        }
                    }
                    break;

                case Command::Pause:
                    // A running engine reports Paused itself once terminated
                    if (task->canPause() && (task->isEngineRunning() ||
                        (ok = persistCommandLocked(task, TaskStatus::Paused, error)))) {
                        task->pause();
                    }
                    break;

                case Command::Resume:
                    if (task->canResume() &&
                        (ok = persistCommandLocked(task, TaskStatus::Downloading, error))) {
                        if (!task->resume()) {
                            qWarning() << "TaskManager: Task" << id << "did not resume";
                        }
                    }
                    break;

                case Command::Stop:
                    if (task->canStop() && (task->isEngineActive() ||
                        (ok = persistCommandLocked(task, TaskStatus::Stopped, error)))) {
                        task->stop();
                    }
                    break;
            }

            const TaskStatus after = task->status();
            if (after != before) {
                postLocked(Notification::Kind::StatusChanged, id, after);
                postLocked(Notification::Kind::Updated, id);
            }
        }
    }

    deliverNotifications();
    return ok;
}

bool TaskManager::deleteTask(TaskId id, TaskError* error) {
    bool ok = true;

    {
        QMutexLocker lock(&m_mutex);

        auto it = m_tasks.find(id);
        if (it == m_tasks.end()) {
            setError(error, ErrorCategory::NotFound, QStringLiteral("No task with id %1").arg(id));
            return false;
        }

        bool removed = false;
        for (int attempt = 1; attempt <= Config::STORE_WRITE_ATTEMPTS && !removed; ++attempt) {
            removed = m_store.remove(id);
        }

        if (!removed) {
            const QString message = m_store.lastError();
            qCritical() << "TaskManager: Could not delete task" << id << ":" << message;
            setError(error, ErrorCategory::PersistenceFailure, message);
            postLocked(Notification::Kind::PersistenceFailed, id, TaskStatus::Pending, message);
            ok = false;
        } else {
            std::unique_ptr<Task> task = std::move(it->second);
            m_tasks.erase(it);
            m_pending.erase(id);

            if (!task->remove()) {
                qWarning() << "TaskManager: Files of task" << id << "were not fully removed";
            }

            qDebug() << "TaskManager: Deleted task" << id;
            postLocked(Notification::Kind::Removed, id);
        }
    }

    deliverNotifications();
    return ok;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

std::vector<TaskSnapshot> TaskManager::listTasks() const {
    QMutexLocker lock(&m_mutex);

    std::vector<TaskSnapshot> result;
    result.reserve(m_tasks.size());
    for (const auto& [id, task] : m_tasks) {
        result.push_back(task->snapshot());
    }
    return result;
}

std::optional<TaskSnapshot> TaskManager::taskSnapshot(TaskId id) const {
    QMutexLocker lock(&m_mutex);

    if (Task* task = findTaskLocked(id)) {
        return task->snapshot();
    }
    return std::nullopt;
}

int TaskManager::taskCount() const {
    QMutexLocker lock(&m_mutex);
    return static_cast<int>(m_tasks.size());
}

int TaskManager::activeCount() const {
    QMutexLocker lock(&m_mutex);

    int count = 0;
    for (const auto& [id, task] : m_tasks) {
        if (task->status() == TaskStatus::Downloading) {
            ++count;
        }
    }
    return count;
}

bool TaskManager::hasPendingCommit(TaskId id) const {
    QMutexLocker lock(&m_mutex);
    return m_pending.count(id) > 0;
}

QString TaskManager::suggestSavePath(const QString& url, const QString& directory) {
    const QUrl parsed(url.trimmed());
    QString name = QFileInfo(parsed.path(QUrl::FullyDecoded)).fileName();
    if (name.isEmpty()) {
        name = QStringLiteral("download_%1").arg(QDateTime::currentSecsSinceEpoch());
    }

    const QDir dir(directory.isEmpty() ? QDir::currentPath() : directory);

    // Split on the last dot so "archive.tar.gz" becomes "archive.tar_1.gz"
    const qsizetype dot = name.lastIndexOf(QLatin1Char('.'));
    const QString stem = dot > 0 ? name.left(dot) : name;
    const QString extension = dot > 0 ? name.mid(dot) : QString();

    QString candidate = dir.absoluteFilePath(name);
    for (int counter = 1; QFileInfo::exists(candidate); ++counter) {
        candidate = dir.absoluteFilePath(
            QStringLiteral("%1_%2%3").arg(stem).arg(counter).arg(extension));
    }
    return candidate;
}

bool TaskManager::validateInput(const QString& url, const QString& savePath, TaskError* error) {
    const QUrl parsed(url.trimmed(), QUrl::StrictMode);

    if (url.trimmed().isEmpty() || !parsed.isValid() || parsed.isRelative() ||
        !SUPPORTED_SCHEMES.contains(parsed.scheme().toLower()) || parsed.host().isEmpty()) {
        qWarning() << "TaskManager: Rejecting malformed URL" << url;
        setError(error, ErrorCategory::InvalidInput, QStringLiteral("Invalid URL: %1").arg(url));
        return false;
    }

    const QFileInfo target(savePath);
    if (savePath.isEmpty() || !target.isAbsolute() || target.fileName().isEmpty()) {
        qWarning() << "TaskManager: Rejecting save path" << savePath;
        setError(error, ErrorCategory::InvalidInput,
                 QStringLiteral("Save path must be an absolute file path: %1").arg(savePath));
        return false;
    }

    const QFileInfo parent(target.absolutePath());
    if (!parent.isDir() || !parent.isWritable()) {
        qWarning() << "TaskManager: Destination directory not writable" << parent.filePath();
        setError(error, ErrorCategory::InvalidInput,
                 QStringLiteral("Directory is not writable: %1").arg(parent.filePath()));
        return false;
    }

    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Supervisor Notifications
// ═══════════════════════════════════════════════════════════════════════════════

void TaskManager::onProgress(TaskId id, const ProgressSample& sample) {
    SupervisorEvent event;
    event.kind = SupervisorEvent::Kind::Sample;
    event.sample = sample;

    {
        QMutexLocker lock(&m_mutex);
        handleEventLocked(id, std::move(event));
    }
    deliverNotifications();
}

void TaskManager::onStatusReported(TaskId id, TaskStatus status) {
    SupervisorEvent event;
    event.kind = SupervisorEvent::Kind::Status;
    event.status = status;

    {
        QMutexLocker lock(&m_mutex);
        handleEventLocked(id, std::move(event));
    }
    deliverNotifications();
}

void TaskManager::onOutcome(TaskId id, TaskStatus outcome, const QString& message) {
    SupervisorEvent event;
    event.kind = SupervisorEvent::Kind::Outcome;
    event.status = outcome;
    event.message = message;

    {
        QMutexLocker lock(&m_mutex);
        handleEventLocked(id, std::move(event));
    }
    deliverNotifications();
}

void TaskManager::onRetryTimer() {
    {
        QMutexLocker lock(&m_mutex);

        std::vector<TaskId> ids;
        for (const auto& [id, pending] : m_pending) {
            ids.push_back(id);
        }

        for (TaskId id : ids) {
            if (flushPendingLocked(id)) {
                qDebug() << "TaskManager: Flushed pending update for task" << id;
            }
        }

        if (m_pending.empty()) {
            m_retryTimer->stop();
        }
    }

    deliverNotifications();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

Task* TaskManager::findTaskLocked(TaskId id) const {
    auto it = m_tasks.find(id);
    return it != m_tasks.end() ? it->second.get() : nullptr;
}

void TaskManager::connectTask(Task* task) {
    const TaskId id = task->id();
    EngineSupervisor* supervisor = task->supervisor();

    // Queued: supervisor callbacks never re-enter a command in progress
    connect(supervisor, &EngineSupervisor::progressSampled, this,
            [this, id](const ProgressSample& sample) { onProgress(id, sample); },
            Qt::QueuedConnection);

    connect(supervisor, &EngineSupervisor::statusReported, this,
            [this, id](TaskStatus status) { onStatusReported(id, status); },
            Qt::QueuedConnection);

    connect(supervisor, &EngineSupervisor::finished, this,
            [this, id](TaskStatus outcome, const QString& message) {
                onOutcome(id, outcome, message);
            },
            Qt::QueuedConnection);

    connect(supervisor, &EngineSupervisor::engineTerminated, this,
            [this, id]() { emit engineTerminated(id); },
            Qt::QueuedConnection);
}

bool TaskManager::persistLocked(const TaskRecord& record) {
    for (int attempt = 1; attempt <= Config::STORE_WRITE_ATTEMPTS; ++attempt) {
        if (m_store.updateRecord(record)) {
            return true;
        }
        qWarning() << "TaskManager: Write attempt" << attempt << "for task" << record.id
                   << "failed:" << m_store.lastError();
    }
    return false;
}

bool TaskManager::persistCommandLocked(Task* task, TaskStatus target, TaskError* error) {
    if (persistLocked(task->withStatus(target).record)) {
        return true;
    }

    const QString message = m_store.lastError();
    qCritical() << "TaskManager: Rejecting" << taskStatusToString(target)
                << "for task" << task->id() << ":" << message;
    setError(error, ErrorCategory::PersistenceFailure, message);
    postLocked(Notification::Kind::PersistenceFailed, task->id(), target, message);
    return false;
}

void TaskManager::handleEventLocked(TaskId id, SupervisorEvent event) {
    if (m_shutdown) {
        return;
    }

    Task* task = findTaskLocked(id);
    if (!task) {
        return;     // deleted while the notification was queued
    }

    auto pending = m_pending.find(id);
    if (pending != m_pending.end() && !flushPendingLocked(id)) {
        std::deque<SupervisorEvent>& backlog = m_pending[id].backlog;
        // Only the newest of consecutive samples matters
        if (event.kind == SupervisorEvent::Kind::Sample && !backlog.empty() &&
            backlog.back().kind == SupervisorEvent::Kind::Sample) {
            backlog.back() = std::move(event);
        } else {
            backlog.push_back(std::move(event));
        }
        return;
    }

    applyEventLocked(task, event);
}

bool TaskManager::applyEventLocked(Task* task, const SupervisorEvent& event) {
    if (event.kind == SupervisorEvent::Kind::Outcome &&
        !outcomeApplies(task->status(), event.status)) {
        qDebug() << "TaskManager: Dropping" << taskStatusToString(event.status)
                 << "outcome for task" << task->id() << "already"
                 << taskStatusToString(task->status());
        return true;
    }

    const bool isSample = event.kind == SupervisorEvent::Kind::Sample;
    const TaskSnapshot next = isSample
        ? task->withSample(event.sample)
        : task->withStatus(event.status, event.message);

    if (!persistLocked(next.record)) {
        const QString message = m_store.lastError();
        qCritical() << "TaskManager: Parking update for task" << task->id() << ":" << message;

        PendingCommit& pending = m_pending[task->id()];
        pending.next = next;
        pending.sampleApplied = isSample;

        postLocked(Notification::Kind::PersistenceFailed, task->id(), next.status(), message);
        if (!m_retryTimer->isActive()) {
            m_retryTimer->start();
        }
        return false;
    }

    commitLocked(task, next, isSample);
    return true;
}

void TaskManager::commitLocked(Task* task, const TaskSnapshot& next, bool sampleApplied) {
    const TaskStatus before = task->status();
    task->commit(next, sampleApplied);

    postLocked(Notification::Kind::Updated, task->id());
    if (next.status() != before) {
        postLocked(Notification::Kind::StatusChanged, task->id(), next.status());

        if (next.status() == TaskStatus::Error) {
            qWarning() << "TaskManager: Task" << task->id() << "failed:" << next.errorMessage;
            postLocked(Notification::Kind::Failed, task->id(), next.status(), next.errorMessage);
        }
    }
}

bool TaskManager::flushPendingLocked(TaskId id) {
    auto it = m_pending.find(id);
    if (it == m_pending.end()) {
        return true;
    }

    Task* task = findTaskLocked(id);
    if (!task) {
        m_pending.erase(it);
        return true;
    }

    if (!persistLocked(it->second.next.record)) {
        return false;
    }

    commitLocked(task, it->second.next, it->second.sampleApplied);

    std::deque<SupervisorEvent> backlog = std::move(it->second.backlog);
    m_pending.erase(it);

    while (!backlog.empty()) {
        const SupervisorEvent event = std::move(backlog.front());
        backlog.pop_front();

        if (!applyEventLocked(task, event)) {
            m_pending[id].backlog = std::move(backlog);
            return false;
        }
    }

    return true;
}

void TaskManager::postLocked(Notification::Kind kind, TaskId id, TaskStatus status,
                             const QString& message) {
    m_outbox.push_back(Notification{kind, id, status, message});
}

void TaskManager::deliverNotifications() {
    std::vector<Notification> outbox;
    {
        QMutexLocker lock(&m_mutex);
        outbox.swap(m_outbox);
    }

    // Emitted without the lock so receivers may call back into the manager
    for (const Notification& note : outbox) {
        switch (note.kind) {
            case Notification::Kind::Added:
                emit taskAdded(note.id);
                break;
            case Notification::Kind::Removed:
                emit taskRemoved(note.id);
                break;
            case Notification::Kind::Updated:
                emit taskUpdated(note.id);
                break;
            case Notification::Kind::StatusChanged:
                emit taskStatusChanged(note.id, note.status);
                break;
            case Notification::Kind::Failed:
                emit taskFailed(note.id, note.message);
                break;
            case Notification::Kind::PersistenceFailed:
                emit persistenceFailed(note.id, note.message);
                break;
        }
    }
}

} // namespace DadaLoader
