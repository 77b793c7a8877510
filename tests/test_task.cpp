/**
 * @file test_task.cpp
 * @brief Unit tests for the Task state machine
 */

#include <QtTest>

#include "TestHelpers.h"
#include "dadaloader/engine/EngineSupervisor.h"
#include "dadaloader/engine/Task.h"

using namespace DadaLoader;
using namespace DadaLoader::TestHelpers;

class TestTask : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    void testInitialState();
    void testInvalidTransitionsAreNoOps();
    void testStartFromPending();
    void testPauseIsIdempotent();
    void testSampleDerivesPercent();
    void testProgressIsMonotonicWithinRun();
    void testFirstSampleAfterStartMayRewind();
    void testSampleClampedToFileSize();
    void testCompletedFillsProgress();
    void testErrorKeepsMessage();
    void testReloadedPausedTask();
    void testPauseWithoutEngineIsImmediate();
    void testRemoveDeletesFiles();
    void testCommandSequencesStayValid();

private:
    TaskRecord makeRecord(TaskStatus status = TaskStatus::Pending) const;

    QTemporaryDir m_dir;
    EngineOptions m_options;
};

void TestTask::initTestCase()
{
    QVERIFY(m_dir.isValid());
    m_options = testOptions(blockingEngine(m_dir));
}

TaskRecord TestTask::makeRecord(TaskStatus status) const
{
    TaskRecord record;
    record.id = 1;
    record.url = QStringLiteral("https://example.com/file.bin");
    record.savePath = m_dir.filePath(QStringLiteral("file.bin"));
    record.status = status;
    record.isPaused = status == TaskStatus::Paused;
    return record;
}

void TestTask::testInitialState()
{
    Task task(makeRecord(), m_options);

    QCOMPARE(task.status(), TaskStatus::Pending);
    QCOMPARE(task.fileName(), QStringLiteral("file.bin"));
    QVERIFY(task.canStart());
    QVERIFY(!task.canPause());
    QVERIFY(!task.canResume());
    QVERIFY(!task.canStop());
    QVERIFY(!task.isEngineActive());
}

void TestTask::testInvalidTransitionsAreNoOps()
{
    Task task(makeRecord(), m_options);

    QVERIFY(!task.resume());
    QVERIFY(!task.pause());
    QVERIFY(!task.stop());
    QCOMPARE(task.status(), TaskStatus::Pending);
    QVERIFY(!task.isPauseRequested());
    QVERIFY(!task.isStopRequested());
}

void TestTask::testStartFromPending()
{
    Task task(makeRecord(), m_options);
    QSignalSpy statusSpy(&task, &Task::statusChanged);

    QVERIFY(task.start());
    QCOMPARE(task.status(), TaskStatus::Downloading);
    QVERIFY(task.isEngineActive());
    QVERIFY(task.snapshot().startTime.isValid());
    QCOMPARE(statusSpy.count(), 1);

    // Re-entrant start is ignored
    QVERIFY(!task.start());
    QCOMPARE(statusSpy.count(), 1);
}

void TestTask::testPauseIsIdempotent()
{
    Task task(makeRecord(), m_options);
    QVERIFY(task.start());

    QVERIFY(task.pause());
    QVERIFY(!task.pause());
    QVERIFY(task.isPauseRequested());

    // The supervisor reports Paused; until then the status is unchanged
    QCOMPARE(task.status(), TaskStatus::Downloading);
}

void TestTask::testSampleDerivesPercent()
{
    Task task(makeRecord(TaskStatus::Downloading), m_options);

    ProgressSample sample;
    sample.downloadedBytes = Config::MiB;
    sample.totalBytes = 2 * Config::MiB;
    sample.speedBytesPerSec = 100.0 * Config::KiB;
    sample.etaSeconds = 10;

    const TaskSnapshot next = task.withSample(sample);
    QCOMPARE(next.record.downloadedBytes, Config::MiB);
    QCOMPARE(next.record.fileSize, 2 * Config::MiB);
    QCOMPARE(next.record.progressPercent, 50.0);
    QCOMPARE(next.etaSeconds, qint64(10));
    QVERIFY(qFuzzyCompare(next.speedMbps, 0.78125));

    // Preview only
    QCOMPARE(task.record().downloadedBytes, ByteCount(0));

    task.commit(next, true);
    QCOMPARE(task.snapshot().record.progressPercent, 50.0);
    QCOMPARE(task.status(), TaskStatus::Downloading);
}

void TestTask::testProgressIsMonotonicWithinRun()
{
    TaskRecord record = makeRecord(TaskStatus::Downloading);
    record.fileSize = 1000;
    record.downloadedBytes = 600;
    record.progressPercent = 60.0;
    Task task(record, m_options);

    ProgressSample sample;
    sample.downloadedBytes = 400;
    sample.totalBytes = 1000;

    const TaskSnapshot next = task.withSample(sample);
    QCOMPARE(next.record.downloadedBytes, ByteCount(600));
    QCOMPARE(next.record.progressPercent, 60.0);
}

void TestTask::testFirstSampleAfterStartMayRewind()
{
    TaskRecord record = makeRecord(TaskStatus::Stopped);
    record.fileSize = 1000;
    record.downloadedBytes = 600;
    record.progressPercent = 60.0;
    Task task(record, m_options);
    QVERIFY(task.start());

    ProgressSample restart;
    restart.downloadedBytes = 100;
    restart.totalBytes = 1000;
    task.commit(task.withSample(restart), true);
    QCOMPARE(task.record().downloadedBytes, ByteCount(100));

    // Only the first sample of the run may go backwards
    ProgressSample stale;
    stale.downloadedBytes = 50;
    stale.totalBytes = 1000;
    QCOMPARE(task.withSample(stale).record.downloadedBytes, ByteCount(100));
}

void TestTask::testSampleClampedToFileSize()
{
    Task task(makeRecord(TaskStatus::Downloading), m_options);

    ProgressSample sample;
    sample.downloadedBytes = 2000;
    sample.totalBytes = 1500;

    const TaskSnapshot next = task.withSample(sample);
    QCOMPARE(next.record.downloadedBytes, ByteCount(1500));
    QCOMPARE(next.record.progressPercent, 100.0);
}

void TestTask::testCompletedFillsProgress()
{
    TaskRecord record = makeRecord(TaskStatus::Downloading);
    record.fileSize = 2048;
    record.downloadedBytes = 1024;
    record.progressPercent = 50.0;
    Task task(record, m_options);

    const TaskSnapshot next = task.withStatus(TaskStatus::Completed);
    QCOMPARE(next.record.status, TaskStatus::Completed);
    QCOMPARE(next.record.progressPercent, 100.0);
    QCOMPARE(next.record.downloadedBytes, ByteCount(2048));
    QCOMPARE(next.speedMbps, 0.0);
    QCOMPARE(next.etaSeconds, qint64(0));
    QVERIFY(!next.record.isPaused);
}

void TestTask::testErrorKeepsMessage()
{
    Task task(makeRecord(TaskStatus::Downloading), m_options);
    QSignalSpy statusSpy(&task, &Task::statusChanged);

    task.commit(task.withStatus(TaskStatus::Error, QStringLiteral("Engine exited with code 3")));

    QCOMPARE(task.status(), TaskStatus::Error);
    QCOMPARE(task.snapshot().errorMessage, QStringLiteral("Engine exited with code 3"));
    QCOMPARE(statusSpy.count(), 1);
    QVERIFY(task.canStart());
}

void TestTask::testReloadedPausedTask()
{
    Task task(makeRecord(TaskStatus::Paused), m_options);

    QVERIFY(task.isPauseRequested());
    QVERIFY(task.canResume());
    QVERIFY(!task.canPause());

    // No engine is running, so stop settles at once
    QVERIFY(task.stop());
    QCOMPARE(task.status(), TaskStatus::Stopped);
    QVERIFY(!task.record().isPaused);
    QVERIFY(!task.stop());
}

void TestTask::testPauseWithoutEngineIsImmediate()
{
    // A record left in Downloading has no supervisor run behind it
    Task task(makeRecord(TaskStatus::Downloading), m_options);

    QVERIFY(task.pause());
    QCOMPARE(task.status(), TaskStatus::Paused);
    QVERIFY(task.record().isPaused);
}

void TestTask::testRemoveDeletesFiles()
{
    TaskRecord record = makeRecord(TaskStatus::Stopped);
    record.savePath = m_dir.filePath(QStringLiteral("partial.bin"));

    for (const QString& path : {record.savePath, record.savePath + QStringLiteral(".aria2")}) {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("data");
    }

    Task task(record, m_options);
    QVERIFY(task.remove());

    QVERIFY(!QFile::exists(record.savePath));
    QVERIFY(!QFile::exists(record.savePath + QStringLiteral(".aria2")));
}

void TestTask::testCommandSequencesStayValid()
{
    const QList<TaskStatus> validStates = {
        TaskStatus::Pending, TaskStatus::Downloading, TaskStatus::Paused,
        TaskStatus::Completed, TaskStatus::Error, TaskStatus::Stopped
    };

    Task task(makeRecord(TaskStatus::Paused), m_options);

    // resume, pause (flag only), resume (no-op while pausing), stop, start, stop
    QVERIFY(task.resume());
    QCOMPARE(task.status(), TaskStatus::Downloading);
    QVERIFY(task.pause());
    QVERIFY(!task.resume());
    QVERIFY(task.stop());
    QVERIFY(!task.start());
    QVERIFY(validStates.contains(task.status()));
    QCOMPARE(task.status(), TaskStatus::Downloading);
}

QTEST_MAIN(TestTask)
#include "test_task.moc"
