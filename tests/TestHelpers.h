/**
 * @file TestHelpers.h
 * @brief Shared fixtures: in-memory task store and fake engine scripts
 */

#ifndef DADALOADER_TESTHELPERS_H
#define DADALOADER_TESTHELPERS_H

#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

#include <map>

#include "dadaloader/engine/EngineSupervisor.h"
#include "dadaloader/persistence/TaskStore.h"

namespace DadaLoader {
namespace TestHelpers {

// Readout line used throughout the tests: 1 MiB of 2 MiB at 100 KiB/s
constexpr const char* HALF_LINE = "[#1 1.0MiB/2.0MiB(50%) CN:1 DL:100KiB ETA:10s]";

/**
 * @brief TaskStore kept in memory; writes can be made to fail
 */
class FakeTaskStore : public TaskStore {
public:
    std::optional<TaskId> create(const TaskRecord& record) override {
        ++createCalls;
        if (failCreate) {
            m_lastError = QStringLiteral("create disabled");
            return std::nullopt;
        }
        TaskRecord stored = record;
        stored.id = ++m_nextId;
        records[stored.id] = stored;
        return stored.id;
    }

    bool update(TaskId id, double progressPercent, TaskStatus status,
                ByteCount downloadedBytes, bool isPaused, ByteCount fileSize) override {
        ++updateCalls;
        if (failUpdates) {
            m_lastError = QStringLiteral("disk full");
            return false;
        }
        auto it = records.find(id);
        if (it == records.end()) {
            m_lastError = QStringLiteral("no such task");
            return false;
        }
        it->second.progressPercent = progressPercent;
        it->second.status = status;
        it->second.downloadedBytes = downloadedBytes;
        it->second.isPaused = isPaused;
        it->second.fileSize = fileSize;
        return true;
    }

    std::vector<TaskRecord> listAll() override {
        std::vector<TaskRecord> result;
        for (const auto& [id, record] : records) {
            result.push_back(record);
        }
        return result;
    }

    bool remove(TaskId id) override {
        if (failRemove) {
            m_lastError = QStringLiteral("remove disabled");
            return false;
        }
        records.erase(id);
        return true;
    }

    QString lastError() const override { return m_lastError; }

    /// Insert a record as if written by an earlier run
    TaskId seed(TaskRecord record) {
        record.id = ++m_nextId;
        records[record.id] = record;
        return record.id;
    }

    std::map<TaskId, TaskRecord> records;
    bool failCreate = false;
    bool failUpdates = false;
    bool failRemove = false;
    int createCalls = 0;
    int updateCalls = 0;

private:
    TaskId m_nextId = 0;
    QString m_lastError;
};

/**
 * @brief Write an executable /bin/sh script standing in for the engine
 */
inline QString writeEngineScript(const QTemporaryDir& dir, const QString& name,
                                 const QString& body) {
    const QString path = dir.filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        return QString();
    }
    QTextStream stream(&file);
    stream << "#!/bin/sh\n" << body << "\n";
    stream.flush();
    file.close();
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner |
                        QFileDevice::ExeOwner);
    return path;
}

/// Prints one half-way line and exits with @p exitCode
inline QString finishingEngine(const QTemporaryDir& dir, int exitCode = 0) {
    return writeEngineScript(dir, QStringLiteral("engine_exit_%1.sh").arg(exitCode),
        QStringLiteral("echo \"%1\"\necho \"errorCode=%2 Resource not found\" >&2\nexit %2")
            .arg(QString::fromLatin1(HALF_LINE)).arg(exitCode));
}

/// Prints one half-way line and blocks until terminated
inline QString blockingEngine(const QTemporaryDir& dir) {
    return writeEngineScript(dir, QStringLiteral("engine_block.sh"),
        QStringLiteral("echo \"%1\"\nexec sleep 30").arg(QString::fromLatin1(HALF_LINE)));
}

/// Fast timings so pause/stop round trips stay short
inline EngineOptions testOptions(const QString& program) {
    EngineOptions options;
    options.program = program;
    options.pausePollInterval = Duration{50};
    options.flagPollInterval = Duration{20};
    options.terminateGrace = Duration{2000};
    return options;
}

} // namespace TestHelpers
} // namespace DadaLoader

#endif // DADALOADER_TESTHELPERS_H
