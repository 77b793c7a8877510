/**
 * @file PersistenceManager.cpp
 * @brief SQLite persistence implementation
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#include "dadaloader/persistence/PersistenceManager.h"
#include "dadaloader/persistence/DatabaseSchema.h"

#include <QDebug>
#include <QDir>
#include <QMutexLocker>
#include <QSqlError>
#include <QSqlQuery>
#include <QStandardPaths>
#include <QUuid>

namespace DadaLoader {

namespace {

TaskRecord recordFromQuery(const QSqlQuery& query) {
    TaskRecord record;
    record.id = query.value(0).toLongLong();
    record.url = query.value(1).toString();
    record.savePath = query.value(2).toString();
    record.fileSize = query.value(3).toLongLong();

    const QString statusText = query.value(4).toString();
    if (auto status = taskStatusFromString(statusText)) {
        record.status = *status;
    } else {
        qWarning() << "PersistenceManager: Unknown status" << statusText
                   << "for task" << record.id << "- treating as Pending";
        record.status = TaskStatus::Pending;
    }

    record.progressPercent = query.value(5).toDouble();
    record.downloadedBytes = query.value(6).toLongLong();
    record.isPaused = query.value(7).toInt() != 0;
    return record;
}

} // namespace

PersistenceManager::PersistenceManager(QObject* parent)
    : QObject(parent)
    , m_connectionName(QStringLiteral("dadaloader-%1")
                           .arg(QUuid::createUuid().toString(QUuid::WithoutBraces)))
{
}

PersistenceManager::~PersistenceManager() {
    close();
}

QString PersistenceManager::defaultDatabasePath() {
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dataDir.isEmpty()) {
        dataDir = QDir::homePath() + QStringLiteral("/.dadaloader");
    }
    QDir().mkpath(dataDir);
    return dataDir + QStringLiteral("/dadaloader.db");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Initialization
// ═══════════════════════════════════════════════════════════════════════════════

bool PersistenceManager::initialize(const QString& dbPath) {
    QMutexLocker lock(&m_mutex);

    m_dbPath = dbPath.isEmpty() ? defaultDatabasePath() : dbPath;

    qDebug() << "PersistenceManager: Opening database at" << m_dbPath;

    m_database = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
    m_database.setDatabaseName(m_dbPath);

    if (!m_database.open()) {
        reportError(QStringLiteral("open database"), m_database.lastError().text());
        return false;
    }

    for (const char* pragma : DatabaseSchema::PRAGMAS) {
        if (!exec(QString::fromLatin1(pragma))) {
            qWarning() << "PersistenceManager: Pragma failed:" << pragma;
        }
    }

    if (!createSchema()) {
        qCritical() << "PersistenceManager: Failed to create schema";
        m_database.close();
        return false;
    }

    m_ready = true;
    qDebug() << "PersistenceManager: Initialized successfully";
    return true;
}

void PersistenceManager::close() {
    QMutexLocker lock(&m_mutex);

    if (m_database.isOpen()) {
        m_database.close();
    }
    m_ready = false;

    // The handle must be released before the connection is removed
    m_database = QSqlDatabase();
    if (QSqlDatabase::contains(m_connectionName)) {
        QSqlDatabase::removeDatabase(m_connectionName);
    }
}

bool PersistenceManager::createSchema() {
    if (!exec(QString::fromLatin1(DatabaseSchema::CREATE_DOWNLOADS_TABLE)) ||
        !exec(QString::fromLatin1(DatabaseSchema::CREATE_SETTINGS_TABLE))) {
        return false;
    }

    exec(QString::fromLatin1(DatabaseSchema::CREATE_DOWNLOADS_STATUS_INDEX));

    QSqlQuery query(m_database);
    query.prepare(QStringLiteral("INSERT OR IGNORE INTO settings (key, value) VALUES (?, ?)"));
    query.addBindValue(QString::fromLatin1(DatabaseSchema::SCHEMA_VERSION_KEY));
    query.addBindValue(QString::number(DatabaseSchema::CURRENT_SCHEMA_VERSION));
    if (!query.exec()) {
        reportError(QStringLiteral("record schema version"), query.lastError().text());
        return false;
    }

    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// TaskStore
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<TaskId> PersistenceManager::create(const TaskRecord& record) {
    QMutexLocker lock(&m_mutex);

    QSqlQuery query(m_database);
    query.prepare(QStringLiteral(R"(
        INSERT INTO downloads
        (url, save_path, file_size, status, progress, downloaded, is_paused)
        VALUES (?, ?, ?, ?, ?, ?, ?)
    )"));

    query.addBindValue(record.url);
    query.addBindValue(record.savePath);
    query.addBindValue(record.fileSize);
    query.addBindValue(taskStatusToString(record.status));
    query.addBindValue(record.progressPercent);
    query.addBindValue(record.downloadedBytes);
    query.addBindValue(record.isPaused ? 1 : 0);

    if (!query.exec()) {
        reportError(QStringLiteral("create task"), query.lastError().text());
        return std::nullopt;
    }

    const TaskId id = query.lastInsertId().toLongLong();
    qDebug() << "PersistenceManager: Created task" << id << "for" << record.url;
    return id;
}

bool PersistenceManager::update(TaskId id, double progressPercent, TaskStatus status,
                                ByteCount downloadedBytes, bool isPaused,
                                ByteCount fileSize) {
    QMutexLocker lock(&m_mutex);

    QSqlQuery query(m_database);
    query.prepare(QStringLiteral(R"(
        UPDATE downloads
        SET progress = ?, status = ?, downloaded = ?, is_paused = ?, file_size = ?
        WHERE id = ?
    )"));

    query.addBindValue(progressPercent);
    query.addBindValue(taskStatusToString(status));
    query.addBindValue(downloadedBytes);
    query.addBindValue(isPaused ? 1 : 0);
    query.addBindValue(fileSize);
    query.addBindValue(id);

    if (!query.exec()) {
        reportError(QStringLiteral("update task %1").arg(id), query.lastError().text());
        return false;
    }

    if (query.numRowsAffected() == 0) {
        reportError(QStringLiteral("update task %1").arg(id), QStringLiteral("no such task"));
        return false;
    }

    return true;
}

std::vector<TaskRecord> PersistenceManager::listAll() {
    QMutexLocker lock(&m_mutex);

    std::vector<TaskRecord> result;

    QSqlQuery query(m_database);
    query.prepare(QStringLiteral(R"(
        SELECT id, url, save_path, file_size, status, progress, downloaded, is_paused
        FROM downloads
        ORDER BY id
    )"));

    if (!query.exec()) {
        reportError(QStringLiteral("load tasks"), query.lastError().text());
        return result;
    }

    while (query.next()) {
        result.push_back(recordFromQuery(query));
    }

    return result;
}

bool PersistenceManager::remove(TaskId id) {
    QMutexLocker lock(&m_mutex);

    QSqlQuery query(m_database);
    query.prepare(QStringLiteral("DELETE FROM downloads WHERE id = ?"));
    query.addBindValue(id);

    if (!query.exec()) {
        reportError(QStringLiteral("delete task %1").arg(id), query.lastError().text());
        return false;
    }

    return true;
}

QString PersistenceManager::lastError() const {
    QMutexLocker lock(&m_mutex);
    return m_lastError;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Settings
// ═══════════════════════════════════════════════════════════════════════════════

bool PersistenceManager::saveSettings(const Settings& settings) {
    bool ok = saveSetting(QStringLiteral("engine_path"), settings.enginePath);
    ok = saveSetting(QStringLiteral("connections"), QString::number(settings.connections)) && ok;
    ok = saveSetting(QStringLiteral("pause_poll_interval_ms"),
                     QString::number(settings.pausePollInterval.count())) && ok;
    ok = saveSetting(QStringLiteral("default_directory"), settings.defaultDirectory) && ok;
    return ok;
}

Settings PersistenceManager::loadSettings() {
    Settings settings;
    settings.enginePath = loadSetting(QStringLiteral("engine_path"));
    settings.defaultDirectory = loadSetting(QStringLiteral("default_directory"));

    bool ok = false;
    const int connections = loadSetting(QStringLiteral("connections")).toInt(&ok);
    if (ok && connections > 0) {
        settings.connections = connections;
    }

    const qint64 pollMs = loadSetting(QStringLiteral("pause_poll_interval_ms")).toLongLong(&ok);
    if (ok && pollMs > 0) {
        settings.pausePollInterval = Duration{pollMs};
    }

    return settings;
}

bool PersistenceManager::saveSetting(const QString& key, const QString& value) {
    QMutexLocker lock(&m_mutex);

    QSqlQuery query(m_database);
    query.prepare(QStringLiteral("INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?)"));
    query.addBindValue(key);
    query.addBindValue(value);

    if (!query.exec()) {
        reportError(QStringLiteral("save setting %1").arg(key), query.lastError().text());
        return false;
    }

    return true;
}

QString PersistenceManager::loadSetting(const QString& key, const QString& defaultValue) {
    QMutexLocker lock(&m_mutex);

    QSqlQuery query(m_database);
    query.prepare(QStringLiteral("SELECT value FROM settings WHERE key = ?"));
    query.addBindValue(key);

    if (query.exec() && query.next()) {
        return query.value(0).toString();
    }

    return defaultValue;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

bool PersistenceManager::exec(const QString& statement) {
    QSqlQuery query(m_database);
    if (!query.exec(statement)) {
        reportError(QStringLiteral("execute statement"), query.lastError().text());
        return false;
    }
    return true;
}

void PersistenceManager::reportError(const QString& context, const QString& message) {
    m_lastError = QStringLiteral("Failed to %1: %2").arg(context, message);
    qCritical() << "PersistenceManager:" << m_lastError;
    emit error(m_lastError);
}

} // namespace DadaLoader
