/**
 * @file Task.cpp
 * @brief Implementation of Task - status state machine for one download
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#include "dadaloader/engine/Task.h"
#include "dadaloader/engine/EngineSupervisor.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>

#include <algorithm>

namespace DadaLoader {

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

Task::Task(const TaskRecord& record, const EngineOptions& options, QObject* parent)
    : QObject(parent)
    , m_id(record.id)
    , m_url(record.url)
    , m_savePath(record.savePath)
    , m_record(record)
{
    m_pauseRequested.store(record.isPaused, std::memory_order_release);
    m_supervisor = std::make_unique<EngineSupervisor>(*this, options);

    qDebug() << "Task: Created task" << m_id << "for" << m_url
             << "status" << taskStatusToString(record.status);
}

Task::~Task() {
    m_stopRequested.store(true, std::memory_order_release);
    m_supervisor->shutdown();
}

QString Task::fileName() const {
    return QFileInfo(m_savePath).fileName();
}

// ═══════════════════════════════════════════════════════════════════════════════
// State
// ═══════════════════════════════════════════════════════════════════════════════

TaskStatus Task::status() const {
    QMutexLocker lock(&m_mutex);
    return m_record.status;
}

bool Task::isEngineActive() const {
    return m_supervisor->isActive();
}

bool Task::isEngineRunning() const {
    return m_supervisor->isEngineRunning();
}

bool Task::canStart() const {
    QMutexLocker lock(&m_mutex);
    switch (m_record.status) {
        case TaskStatus::Pending:
        case TaskStatus::Stopped:
        case TaskStatus::Error:
        case TaskStatus::Completed:
            return !m_supervisor->isActive();
        default:
            return false;
    }
}

bool Task::canPause() const {
    QMutexLocker lock(&m_mutex);
    return m_record.status == TaskStatus::Downloading &&
           !isPauseRequested() && !isStopRequested();
}

bool Task::canResume() const {
    QMutexLocker lock(&m_mutex);
    return m_record.status == TaskStatus::Paused && !isStopRequested();
}

bool Task::canStop() const {
    QMutexLocker lock(&m_mutex);
    return (m_record.status == TaskStatus::Downloading ||
            m_record.status == TaskStatus::Paused) &&
           !isStopRequested();
}

TaskRecord Task::record() const {
    QMutexLocker lock(&m_mutex);
    return m_record;
}

TaskSnapshot Task::snapshot() const {
    QMutexLocker lock(&m_mutex);
    return snapshotLocked();
}

TaskSnapshot Task::snapshotLocked() const {
    TaskSnapshot snap;
    snap.record = m_record;
    snap.speedBytesPerSec = m_speed;
    snap.speedMbps = ProgressParser::toMegabits(m_speed);
    snap.etaSeconds = m_eta;
    snap.startTime = m_startTime;
    snap.errorMessage = m_errorMessage;
    return snap;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Field Updates
// ═══════════════════════════════════════════════════════════════════════════════

TaskSnapshot Task::withSample(const ProgressSample& sample) const {
    QMutexLocker lock(&m_mutex);
    TaskSnapshot next = snapshotLocked();
    TaskRecord& rec = next.record;

    ByteCount downloaded = std::max<ByteCount>(sample.downloadedBytes, 0);
    if (!m_rewindAllowed && downloaded < rec.downloadedBytes) {
        downloaded = rec.downloadedBytes;
    }

    if (sample.totalBytes > 0) {
        rec.fileSize = sample.totalBytes;
    }

    if (rec.fileSize > 0) {
        downloaded = std::min(downloaded, rec.fileSize);
        rec.progressPercent = (static_cast<double>(downloaded) / rec.fileSize) * 100.0;
    }
    rec.downloadedBytes = downloaded;

    next.speedBytesPerSec = std::max(sample.speedBytesPerSec, 0.0);
    next.speedMbps = sample.speedMbps();
    next.etaSeconds = std::max<qint64>(sample.etaSeconds, 0);
    return next;
}

TaskSnapshot Task::withStatus(TaskStatus status, const QString& message) const {
    QMutexLocker lock(&m_mutex);
    TaskSnapshot next = snapshotLocked();
    TaskRecord& rec = next.record;

    rec.status = status;
    rec.isPaused = status == TaskStatus::Paused;

    switch (status) {
        case TaskStatus::Downloading:
            next.errorMessage.clear();
            break;
        case TaskStatus::Completed:
            rec.progressPercent = 100.0;
            if (rec.fileSize > 0) {
                rec.downloadedBytes = rec.fileSize;
            }
            next.errorMessage.clear();
            break;
        case TaskStatus::Error:
            next.errorMessage = message;
            break;
        default:
            break;
    }

    if (status != TaskStatus::Downloading) {
        next.speedBytesPerSec = 0.0;
        next.speedMbps = 0.0;
        next.etaSeconds = 0;
    }

    return next;
}

void Task::commit(const TaskSnapshot& next, bool sampleApplied) {
    TaskStatus oldStatus;
    TaskStatus newStatus;

    {
        QMutexLocker lock(&m_mutex);
        oldStatus = m_record.status;

        m_record.fileSize = next.record.fileSize;
        m_record.status = next.record.status;
        m_record.progressPercent = next.record.progressPercent;
        m_record.downloadedBytes = next.record.downloadedBytes;
        m_record.isPaused = next.record.isPaused;
        m_speed = next.speedBytesPerSec;
        m_eta = next.etaSeconds;
        m_errorMessage = next.errorMessage;

        if (sampleApplied) {
            m_rewindAllowed = false;
        }
        newStatus = m_record.status;
    }

    if (oldStatus != newStatus) {
        qDebug() << "Task:" << m_id << taskStatusToString(oldStatus)
                 << "->" << taskStatusToString(newStatus);
        emit statusChanged(newStatus);
    }
    emit progressChanged();
}

void Task::setStatusLocked(TaskStatus status) {
    qDebug() << "Task:" << m_id << taskStatusToString(m_record.status)
             << "->" << taskStatusToString(status);

    m_record.status = status;
    m_record.isPaused = status == TaskStatus::Paused;
    if (status != TaskStatus::Downloading) {
        m_speed = 0.0;
        m_eta = 0;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Actions
// ═══════════════════════════════════════════════════════════════════════════════

bool Task::start() {
    if (!canStart()) {
        qDebug() << "Task: Ignoring start of task" << m_id << "in state"
                 << taskStatusToString(status());
        return false;
    }

    {
        QMutexLocker lock(&m_mutex);
        m_stopRequested.store(false, std::memory_order_release);
        m_pauseRequested.store(false, std::memory_order_release);
        setStatusLocked(TaskStatus::Downloading);
        m_startTime = QDateTime::currentDateTime();
        m_speed = 0.0;
        m_eta = 0;
        m_errorMessage.clear();
        m_rewindAllowed = true;
    }

    emit statusChanged(TaskStatus::Downloading);
    return m_supervisor->run();
}

bool Task::pause() {
    if (!canPause()) {
        qDebug() << "Task: Ignoring pause of task" << m_id;
        return false;
    }

    m_pauseRequested.store(true, std::memory_order_release);

    // No engine to terminate, including a supervisor still waiting in pause
    // before relaunching: the pause takes effect at once
    if (!m_supervisor->isEngineRunning()) {
        {
            QMutexLocker lock(&m_mutex);
            setStatusLocked(TaskStatus::Paused);
        }
        emit statusChanged(TaskStatus::Paused);
    }

    return true;
}

bool Task::resume() {
    if (!canResume()) {
        qDebug() << "Task: Ignoring resume of task" << m_id;
        return false;
    }

    {
        QMutexLocker lock(&m_mutex);
        m_pauseRequested.store(false, std::memory_order_release);
        setStatusLocked(TaskStatus::Downloading);
        m_errorMessage.clear();
        m_rewindAllowed = false;
        if (!m_startTime.isValid()) {
            m_startTime = QDateTime::currentDateTime();
        }
    }

    emit statusChanged(TaskStatus::Downloading);

    // A task restored from the store has no supervisor run waiting in pause
    if (!m_supervisor->isActive()) {
        return m_supervisor->run();
    }

    return true;
}

bool Task::stop() {
    if (!canStop()) {
        qDebug() << "Task: Ignoring stop of task" << m_id;
        return false;
    }

    m_stopRequested.store(true, std::memory_order_release);
    m_pauseRequested.store(false, std::memory_order_release);

    if (!m_supervisor->isActive()) {
        {
            QMutexLocker lock(&m_mutex);
            setStatusLocked(TaskStatus::Stopped);
        }
        emit statusChanged(TaskStatus::Stopped);
    }

    return true;
}

bool Task::remove() {
    m_stopRequested.store(true, std::memory_order_release);
    m_pauseRequested.store(false, std::memory_order_release);
    m_supervisor->shutdown();

    bool ok = true;
    const QStringList paths = {
        m_savePath,
        m_savePath + QString::fromLatin1(Config::ENGINE_CONTROL_SUFFIX)
    };

    for (const QString& path : paths) {
        if (QFile::exists(path) && !QFile::remove(path)) {
            qWarning() << "Task: Failed to remove" << path;
            ok = false;
        }
    }

    qDebug() << "Task: Removed task" << m_id << "files";
    return ok;
}

void Task::halt(TaskStatus status) {
    if (status == TaskStatus::Paused) {
        m_pauseRequested.store(true, std::memory_order_release);
    }
    m_supervisor->shutdown();

    bool changed = false;
    {
        QMutexLocker lock(&m_mutex);
        if (m_record.status != status) {
            setStatusLocked(status);
            changed = true;
        }
    }

    if (changed) {
        emit statusChanged(status);
    }
}

} // namespace DadaLoader
