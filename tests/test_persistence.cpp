/**
 * @file test_persistence.cpp
 * @brief Unit tests for the SQLite task store
 */

#include <QtTest>

#include "dadaloader/persistence/DatabaseSchema.h"
#include "dadaloader/persistence/PersistenceManager.h"

using namespace DadaLoader;

class TestPersistence : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testCreateAssignsIds();
    void testUpdateSurvivesReopen();
    void testUpdateUnknownId();
    void testRemove();
    void testSettingsRoundTrip();
    void testSchemaVersionRecorded();

private:
    TaskRecord makeRecord(const QString& name) const;

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<PersistenceManager> m_store;
};

void TestPersistence::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());

    m_store = std::make_unique<PersistenceManager>();
    QVERIFY(m_store->initialize(m_dir->filePath(QStringLiteral("tasks.db"))));
    QVERIFY(m_store->isReady());
}

void TestPersistence::cleanup()
{
    m_store.reset();
    m_dir.reset();
}

TaskRecord TestPersistence::makeRecord(const QString& name) const
{
    TaskRecord record;
    record.url = QStringLiteral("https://example.com/") + name;
    record.savePath = m_dir->filePath(name);
    return record;
}

void TestPersistence::testCreateAssignsIds()
{
    auto first = m_store->create(makeRecord(QStringLiteral("a.bin")));
    auto second = m_store->create(makeRecord(QStringLiteral("b.bin")));

    QVERIFY(first.has_value());
    QVERIFY(second.has_value());
    QVERIFY(*second > *first);

    const std::vector<TaskRecord> records = m_store->listAll();
    QCOMPARE(records.size(), size_t(2));
    QCOMPARE(records[0].id, *first);
    QCOMPARE(records[0].url, QStringLiteral("https://example.com/a.bin"));
    QCOMPARE(records[0].status, TaskStatus::Pending);
    QCOMPARE(records[1].fileName(), QStringLiteral("b.bin"));
}

void TestPersistence::testUpdateSurvivesReopen()
{
    const QString dbPath = m_store->databasePath();
    auto id = m_store->create(makeRecord(QStringLiteral("file.bin")));
    QVERIFY(id.has_value());

    QVERIFY(m_store->update(*id, 25.0, TaskStatus::Downloading, 512, false, 2048));
    QVERIFY(m_store->update(*id, 50.0, TaskStatus::Paused, 1024, true, 2048));

    // Simulated restart
    m_store.reset();
    m_store = std::make_unique<PersistenceManager>();
    QVERIFY(m_store->initialize(dbPath));

    const std::vector<TaskRecord> records = m_store->listAll();
    QCOMPARE(records.size(), size_t(1));
    QCOMPARE(records[0].status, TaskStatus::Paused);
    QCOMPARE(records[0].downloadedBytes, ByteCount(1024));
    QCOMPARE(records[0].fileSize, ByteCount(2048));
    QCOMPARE(records[0].progressPercent, 50.0);
    QVERIFY(records[0].isPaused);
}

void TestPersistence::testUpdateUnknownId()
{
    QSignalSpy errorSpy(m_store.get(), &PersistenceManager::error);

    QVERIFY(!m_store->update(4242, 10.0, TaskStatus::Downloading, 1, false, 10));
    QVERIFY(!m_store->lastError().isEmpty());
    QCOMPARE(errorSpy.count(), 1);
}

void TestPersistence::testRemove()
{
    auto keep = m_store->create(makeRecord(QStringLiteral("keep.bin")));
    auto drop = m_store->create(makeRecord(QStringLiteral("drop.bin")));
    QVERIFY(keep && drop);

    QVERIFY(m_store->remove(*drop));

    const std::vector<TaskRecord> records = m_store->listAll();
    QCOMPARE(records.size(), size_t(1));
    QCOMPARE(records[0].id, *keep);
}

void TestPersistence::testSettingsRoundTrip()
{
    Settings settings;
    settings.enginePath = QStringLiteral("/opt/aria2/bin/aria2c");
    settings.connections = 8;
    settings.pausePollInterval = Duration{500};
    settings.defaultDirectory = m_dir->path();

    QVERIFY(m_store->saveSettings(settings));

    const Settings loaded = m_store->loadSettings();
    QCOMPARE(loaded.enginePath, settings.enginePath);
    QCOMPARE(loaded.connections, 8);
    QVERIFY(loaded.pausePollInterval == Duration{500});
    QCOMPARE(loaded.defaultDirectory, settings.defaultDirectory);
}

void TestPersistence::testSchemaVersionRecorded()
{
    QCOMPARE(m_store->loadSetting(QString::fromLatin1(DatabaseSchema::SCHEMA_VERSION_KEY)),
             QString::number(DatabaseSchema::CURRENT_SCHEMA_VERSION));

    // Defaults apply when nothing was saved
    const Settings defaults = m_store->loadSettings();
    QCOMPARE(defaults.connections, Config::ENGINE_CONNECTIONS);
    QVERIFY(defaults.enginePath.isEmpty());
}

QTEST_MAIN(TestPersistence)
#include "test_persistence.moc"
