/**
 * @file PersistenceManager.h
 * @brief SQLite-based persistence for tasks and settings
 *
 * Handles all database operations for storing and retrieving:
 * - Task records and their progress
 * - Application settings
 *
 * Every write is a synchronous, fully synced SQLite transaction so that the
 * store reflects an update before the call returns.
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#ifndef DADALOADER_PERSISTENCEMANAGER_H
#define DADALOADER_PERSISTENCEMANAGER_H

#include <QMutex>
#include <QObject>
#include <QSqlDatabase>

#include <optional>
#include <vector>

#include "dadaloader/persistence/TaskStore.h"

namespace DadaLoader {

/**
 * @brief SQLite implementation of TaskStore
 *
 * Thread-safe wrapper around one dedicated QSQLITE connection.
 * The connection must be used from the thread that called initialize().
 */
class PersistenceManager : public QObject, public TaskStore {
    Q_OBJECT

public:
    explicit PersistenceManager(QObject* parent = nullptr);
    ~PersistenceManager() override;

    // Non-copyable
    PersistenceManager(const PersistenceManager&) = delete;
    PersistenceManager& operator=(const PersistenceManager&) = delete;

    // ═══════════════════════════════════════════════════════════════════════════
    // Initialization
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Open (and create if needed) the database
     * @param dbPath Path to database file (empty = default location)
     * @return true on success
     */
    bool initialize(const QString& dbPath = QString());

    /**
     * @brief Close the connection
     */
    void close();

    [[nodiscard]] bool isReady() const { return m_ready; }
    [[nodiscard]] QString databasePath() const { return m_dbPath; }

    /**
     * @brief Default database location in the application data directory
     */
    static QString defaultDatabasePath();

    // ═══════════════════════════════════════════════════════════════════════════
    // TaskStore
    // ═══════════════════════════════════════════════════════════════════════════

    std::optional<TaskId> create(const TaskRecord& record) override;
    bool update(TaskId id, double progressPercent, TaskStatus status,
                ByteCount downloadedBytes, bool isPaused,
                ByteCount fileSize) override;
    std::vector<TaskRecord> listAll() override;
    bool remove(TaskId id) override;
    [[nodiscard]] QString lastError() const override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Settings Operations
    // ═══════════════════════════════════════════════════════════════════════════

    bool saveSettings(const Settings& settings);
    [[nodiscard]] Settings loadSettings();

    bool saveSetting(const QString& key, const QString& value);
    [[nodiscard]] QString loadSetting(const QString& key, const QString& defaultValue = QString());

signals:
    /**
     * @brief Emitted on database error
     */
    void error(const QString& message);

private:
    bool createSchema();
    bool exec(const QString& statement);
    void reportError(const QString& context, const QString& message);

    QSqlDatabase m_database;
    QString m_dbPath;
    QString m_connectionName;
    QString m_lastError;
    bool m_ready = false;

    mutable QMutex m_mutex;
};

} // namespace DadaLoader

#endif // DADALOADER_PERSISTENCEMANAGER_H
