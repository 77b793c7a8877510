/**
 * @file Types.h
 * @brief Core type definitions and enumerations for the DadaLoader engine
 *
 * This header defines the fundamental types, the task status state machine,
 * error categories and constants used throughout the orchestration engine.
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#ifndef DADALOADER_TYPES_H
#define DADALOADER_TYPES_H

#include <QDateTime>
#include <QFileInfo>
#include <QMetaType>
#include <QString>

#include <chrono>
#include <cstdint>
#include <optional>

namespace DadaLoader {

// ═══════════════════════════════════════════════════════════════════════════════
// Type Aliases
// ═══════════════════════════════════════════════════════════════════════════════

using TaskId = qint64;       ///< Assigned by the store on creation
using ByteCount = qint64;
using SpeedBps = double;     ///< Bytes per second
using Duration = std::chrono::milliseconds;

// ═══════════════════════════════════════════════════════════════════════════════
// Constants
// ═══════════════════════════════════════════════════════════════════════════════

namespace Config {
    // Engine invocation
    constexpr int ENGINE_CONNECTIONS = 16;                        // -x and -s
    constexpr int ENGINE_SUMMARY_INTERVAL_SECONDS = 1;
    constexpr const char* ENGINE_PROGRAM = "aria2c";
    constexpr const char* ENGINE_CONTROL_SUFFIX = ".aria2";

    // Supervision timing
    constexpr Duration PAUSE_POLL_INTERVAL{1000};
    constexpr Duration FLAG_POLL_INTERVAL{250};
    constexpr Duration ENGINE_TERMINATE_GRACE{3000};

    // Persistence
    constexpr int STORE_WRITE_ATTEMPTS = 3;
    constexpr Duration STORE_RETRY_INTERVAL{2000};

    // Presentation
    constexpr Duration UI_REFRESH_INTERVAL{200};

    // Unit table used by the engine's readout
    constexpr ByteCount KiB = 1024;
    constexpr ByteCount MiB = KiB * 1024;
    constexpr ByteCount GiB = MiB * 1024;
    constexpr ByteCount TiB = GiB * 1024;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Task State Machine
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Task lifecycle states
 *
 * State transitions:
 *   Pending → Downloading → {Paused, Completed, Error, Stopped}
 *   Paused  → {Downloading, Stopped}
 *   Stopped / Error / Completed → Downloading   (restart)
 */
enum class TaskStatus : uint8_t {
    Pending,
    Downloading,
    Paused,
    Completed,
    Error,
    Stopped
};

/**
 * @brief Error categories reported by the orchestration engine
 */
enum class ErrorCategory : uint8_t {
    None,
    InvalidInput,          ///< Malformed URL or unwritable destination
    NotFound,              ///< Unknown task id
    EngineLaunchFailure,   ///< Child process could not be started
    EngineIOFailure,       ///< Child output stream failed
    ParseFailure,          ///< Malformed progress line or ETA token
    PersistenceFailure     ///< Durable store write failed
};

/**
 * @brief Error information returned to callers
 */
struct TaskError {
    ErrorCategory category = ErrorCategory::None;
    QString message;

    bool hasError() const { return category != ErrorCategory::None; }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Records
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Durable representation of a task
 */
struct TaskRecord {
    TaskId id = 0;
    QString url;
    QString savePath;
    ByteCount fileSize = 0;           ///< 0 = unknown
    TaskStatus status = TaskStatus::Pending;
    double progressPercent = 0.0;
    ByteCount downloadedBytes = 0;
    bool isPaused = false;

    QString fileName() const { return QFileInfo(savePath).fileName(); }
};

/**
 * @brief Immutable copy of a task's persisted and runtime fields
 *
 * This is what the presentation layer polls.
 */
struct TaskSnapshot {
    TaskRecord record;
    double speedMbps = 0.0;
    SpeedBps speedBytesPerSec = 0.0;
    qint64 etaSeconds = 0;            ///< 0 = unknown or complete
    QDateTime startTime;
    QString errorMessage;

    TaskId id() const { return record.id; }
    TaskStatus status() const { return record.status; }
    QString fileName() const { return record.fileName(); }
    QString formattedSize() const;
    QString statusString() const;
};

/**
 * @brief Application settings
 */
struct Settings {
    QString enginePath;                ///< Custom engine path (empty = auto)
    int connections = Config::ENGINE_CONNECTIONS;
    Duration pausePollInterval = Config::PAUSE_POLL_INTERVAL;
    QString defaultDirectory;          ///< Where suggested save paths go
};

// ═══════════════════════════════════════════════════════════════════════════════
// Utility Functions
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Convert TaskStatus to string for logging, display and storage
 */
inline QString taskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending:     return QStringLiteral("Pending");
        case TaskStatus::Downloading: return QStringLiteral("Downloading");
        case TaskStatus::Paused:      return QStringLiteral("Paused");
        case TaskStatus::Completed:   return QStringLiteral("Completed");
        case TaskStatus::Error:       return QStringLiteral("Error");
        case TaskStatus::Stopped:     return QStringLiteral("Stopped");
    }
    return QStringLiteral("Unknown");
}

/**
 * @brief Parse a stored status string
 */
inline std::optional<TaskStatus> taskStatusFromString(const QString& text) {
    for (TaskStatus status : {TaskStatus::Pending, TaskStatus::Downloading,
                              TaskStatus::Paused, TaskStatus::Completed,
                              TaskStatus::Error, TaskStatus::Stopped}) {
        if (text.compare(taskStatusToString(status), Qt::CaseInsensitive) == 0) {
            return status;
        }
    }
    return std::nullopt;
}

/// @return True for Completed, Error and Stopped
inline bool isTerminal(TaskStatus status) {
    return status == TaskStatus::Completed ||
           status == TaskStatus::Error ||
           status == TaskStatus::Stopped;
}

inline QString errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None:                return QStringLiteral("None");
        case ErrorCategory::InvalidInput:        return QStringLiteral("InvalidInput");
        case ErrorCategory::NotFound:            return QStringLiteral("NotFound");
        case ErrorCategory::EngineLaunchFailure: return QStringLiteral("EngineLaunchFailure");
        case ErrorCategory::EngineIOFailure:     return QStringLiteral("EngineIOFailure");
        case ErrorCategory::ParseFailure:        return QStringLiteral("ParseFailure");
        case ErrorCategory::PersistenceFailure:  return QStringLiteral("PersistenceFailure");
    }
    return QStringLiteral("Unknown");
}

/**
 * @brief Format a byte count in megabytes for the task table (e.g. "2.00 MB")
 */
inline QString formatMegabytes(ByteCount bytes) {
    if (bytes <= 0) return QStringLiteral("Unknown");
    return QStringLiteral("%1 MB").arg(static_cast<double>(bytes) / Config::MiB, 0, 'f', 2);
}

inline QString TaskSnapshot::formattedSize() const {
    return formatMegabytes(record.fileSize);
}

inline QString TaskSnapshot::statusString() const {
    return taskStatusToString(record.status);
}

/**
 * @brief Fill an optional error out-parameter
 */
inline void setError(TaskError* error, ErrorCategory category, const QString& message) {
    if (error) {
        error->category = category;
        error->message = message;
    }
}

} // namespace DadaLoader

Q_DECLARE_METATYPE(DadaLoader::TaskStatus)
Q_DECLARE_METATYPE(DadaLoader::TaskRecord)
Q_DECLARE_METATYPE(DadaLoader::TaskSnapshot)

#endif // DADALOADER_TYPES_H
