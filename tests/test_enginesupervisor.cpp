/**
 * @file test_enginesupervisor.cpp
 * @brief Tests for EngineSupervisor against scripted fake engines
 */

#include <QtTest>

#include "TestHelpers.h"
#include "dadaloader/engine/EngineSupervisor.h"
#include "dadaloader/engine/Task.h"

using namespace DadaLoader;
using namespace DadaLoader::TestHelpers;

class TestEngineSupervisor : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    void testBuildArguments();
    void testEngineReceivesArguments();
    void testCompletedRun();
    void testCarriageReturnSeparatedLines();
    void testNonZeroExitIsError();
    void testLaunchFailure();
    void testPauseResumeStop();
    void testStopDuringPausedWait();
    void testPauseBeforeRelaunch();
    void testStopWhileStreaming();
    void testShutdownIsSilent();
    void testLocateConfiguredEngine();

private:
    TaskRecord makeRecord() const;

    QTemporaryDir m_dir;
};

void TestEngineSupervisor::initTestCase()
{
    QVERIFY(m_dir.isValid());
    qRegisterMetaType<DadaLoader::TaskStatus>("DadaLoader::TaskStatus");
    qRegisterMetaType<DadaLoader::ProgressSample>("DadaLoader::ProgressSample");
}

TaskRecord TestEngineSupervisor::makeRecord() const
{
    TaskRecord record;
    record.id = 7;
    record.url = QStringLiteral("https://example.com/file.bin");
    record.savePath = m_dir.filePath(QStringLiteral("file.bin"));
    return record;
}

void TestEngineSupervisor::testBuildArguments()
{
    EngineOptions options;
    const QStringList args = EngineSupervisor::buildArguments(
        options, QStringLiteral("https://example.com/file.bin"), QStringLiteral("/tmp/file.bin"));

    const QStringList expected = {
        QStringLiteral("-x"), QStringLiteral("16"),
        QStringLiteral("-s"), QStringLiteral("16"),
        QStringLiteral("--dir"), QStringLiteral("/tmp"),
        QStringLiteral("--out"), QStringLiteral("file.bin"),
        QStringLiteral("--continue=true"),
        QStringLiteral("--summary-interval=1"),
        QStringLiteral("https://example.com/file.bin")
    };
    QCOMPARE(args, expected);
}

void TestEngineSupervisor::testEngineReceivesArguments()
{
    const QString argsFile = m_dir.filePath(QStringLiteral("args.txt"));
    const QString engine = writeEngineScript(m_dir, QStringLiteral("engine_args.sh"),
        QStringLiteral("printf '%s\\n' \"$@\" > '%1'\nexit 0").arg(argsFile));

    Task task(makeRecord(), testOptions(engine));
    QSignalSpy finishedSpy(task.supervisor(), &EngineSupervisor::finished);

    QVERIFY(task.start());
    QTRY_COMPARE(finishedSpy.count(), 1);

    QFile file(argsFile);
    QVERIFY(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const QStringList received = QString::fromUtf8(file.readAll()).split(
        QLatin1Char('\n'), Qt::SkipEmptyParts);

    QCOMPARE(received, EngineSupervisor::buildArguments(
        task.supervisor()->options(), task.url(), task.savePath()));
}

void TestEngineSupervisor::testCompletedRun()
{
    Task task(makeRecord(), testOptions(finishingEngine(m_dir, 0)));
    EngineSupervisor* supervisor = task.supervisor();
    QSignalSpy sampleSpy(supervisor, &EngineSupervisor::progressSampled);
    QSignalSpy finishedSpy(supervisor, &EngineSupervisor::finished);
    QSignalSpy terminatedSpy(supervisor, &EngineSupervisor::engineTerminated);

    QVERIFY(task.start());
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(sampleSpy.count(), 1);
    const auto sample = sampleSpy.at(0).at(0).value<ProgressSample>();
    QCOMPARE(sample.downloadedBytes, Config::MiB);
    QCOMPARE(sample.totalBytes, 2 * Config::MiB);

    QCOMPARE(finishedSpy.at(0).at(0).value<TaskStatus>(), TaskStatus::Completed);
    QCOMPARE(terminatedSpy.count(), 0);
    QCOMPARE(supervisor->state(), EngineSupervisor::State::Finished);
    QVERIFY(!supervisor->isActive());
}

void TestEngineSupervisor::testCarriageReturnSeparatedLines()
{
    const QString engine = writeEngineScript(m_dir, QStringLiteral("engine_cr.sh"),
        QStringLiteral(
            "printf '[#1 512KiB/2.0MiB(25%%) CN:1 DL:1KiB ETA:3s]\\r"
            "[#1 1.0MiB/2.0MiB(50%%) CN:1 DL:1KiB ETA:2s]\\n'\n"
            "exit 0"));

    Task task(makeRecord(), testOptions(engine));
    QSignalSpy sampleSpy(task.supervisor(), &EngineSupervisor::progressSampled);
    QSignalSpy finishedSpy(task.supervisor(), &EngineSupervisor::finished);

    QVERIFY(task.start());
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(sampleSpy.count(), 2);
    QCOMPARE(sampleSpy.at(0).at(0).value<ProgressSample>().downloadedBytes, 512 * Config::KiB);
    QCOMPARE(sampleSpy.at(1).at(0).value<ProgressSample>().downloadedBytes, Config::MiB);
}

void TestEngineSupervisor::testNonZeroExitIsError()
{
    Task task(makeRecord(), testOptions(finishingEngine(m_dir, 3)));
    QSignalSpy finishedSpy(task.supervisor(), &EngineSupervisor::finished);

    QVERIFY(task.start());
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(finishedSpy.at(0).at(0).value<TaskStatus>(), TaskStatus::Error);
    const QString message = finishedSpy.at(0).at(1).toString();
    QVERIFY2(message.contains(QStringLiteral("code 3")), qPrintable(message));
    QVERIFY2(message.contains(QStringLiteral("Resource not found")), qPrintable(message));
}

void TestEngineSupervisor::testLaunchFailure()
{
    Task task(makeRecord(), testOptions(m_dir.filePath(QStringLiteral("no-such-engine"))));
    QSignalSpy finishedSpy(task.supervisor(), &EngineSupervisor::finished);
    QSignalSpy terminatedSpy(task.supervisor(), &EngineSupervisor::engineTerminated);

    QVERIFY(task.start());
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(finishedSpy.at(0).at(0).value<TaskStatus>(), TaskStatus::Error);
    QVERIFY(finishedSpy.at(0).at(1).toString().contains(QStringLiteral("EngineLaunchFailure")));
    QCOMPARE(terminatedSpy.count(), 0);
}

void TestEngineSupervisor::testPauseResumeStop()
{
    Task task(makeRecord(), testOptions(blockingEngine(m_dir)));
    EngineSupervisor* supervisor = task.supervisor();
    QSignalSpy sampleSpy(supervisor, &EngineSupervisor::progressSampled);
    QSignalSpy statusSpy(supervisor, &EngineSupervisor::statusReported);
    QSignalSpy finishedSpy(supervisor, &EngineSupervisor::finished);
    QSignalSpy terminatedSpy(supervisor, &EngineSupervisor::engineTerminated);

    QVERIFY(task.start());
    QTRY_COMPARE(sampleSpy.count(), 1);

    QVERIFY(task.pause());
    QVERIFY(!task.pause());
    QTRY_COMPARE(statusSpy.count(), 1);
    QCOMPARE(statusSpy.at(0).at(0).value<TaskStatus>(), TaskStatus::Paused);
    QCOMPARE(supervisor->state(), EngineSupervisor::State::PausedWait);
    QCOMPARE(terminatedSpy.count(), 1);
    QVERIFY(supervisor->isActive());

    // The owner applies the reported status, then the user resumes
    task.commit(task.withStatus(TaskStatus::Paused));
    QVERIFY(task.resume());
    QTRY_COMPARE(statusSpy.count(), 2);
    QCOMPARE(statusSpy.at(1).at(0).value<TaskStatus>(), TaskStatus::Downloading);
    QTRY_COMPARE(sampleSpy.count(), 2);
    QCOMPARE(supervisor->launchCount(), 2);

    QVERIFY(task.stop());
    QTRY_COMPARE(finishedSpy.count(), 1);
    QCOMPARE(finishedSpy.at(0).at(0).value<TaskStatus>(), TaskStatus::Stopped);
    QCOMPARE(terminatedSpy.count(), 2);
}

void TestEngineSupervisor::testStopDuringPausedWait()
{
    Task task(makeRecord(), testOptions(blockingEngine(m_dir)));
    EngineSupervisor* supervisor = task.supervisor();
    QSignalSpy sampleSpy(supervisor, &EngineSupervisor::progressSampled);
    QSignalSpy statusSpy(supervisor, &EngineSupervisor::statusReported);
    QSignalSpy finishedSpy(supervisor, &EngineSupervisor::finished);

    QVERIFY(task.start());
    QTRY_COMPARE(sampleSpy.count(), 1);
    QVERIFY(task.pause());
    QTRY_COMPARE(statusSpy.count(), 1);

    task.commit(task.withStatus(TaskStatus::Paused));
    QVERIFY(task.stop());
    QTRY_COMPARE(finishedSpy.count(), 1);

    QCOMPARE(finishedSpy.at(0).at(0).value<TaskStatus>(), TaskStatus::Stopped);
    QCOMPARE(supervisor->launchCount(), 1);
}

void TestEngineSupervisor::testPauseBeforeRelaunch()
{
    Task task(makeRecord(), testOptions(blockingEngine(m_dir)));
    EngineSupervisor* supervisor = task.supervisor();
    QSignalSpy sampleSpy(supervisor, &EngineSupervisor::progressSampled);
    QSignalSpy statusSpy(supervisor, &EngineSupervisor::statusReported);

    QVERIFY(task.start());
    QTRY_COMPARE(sampleSpy.count(), 1);
    QVERIFY(task.pause());
    QTRY_COMPARE(statusSpy.count(), 1);
    task.commit(task.withStatus(TaskStatus::Paused));

    QVERIFY(task.resume());
    QVERIFY(!task.isEngineRunning());
    QVERIFY(task.pause());
    QCOMPARE(task.status(), TaskStatus::Paused);

    QTest::qWait(200);
    QCOMPARE(supervisor->state(), EngineSupervisor::State::PausedWait);
    QCOMPARE(supervisor->launchCount(), 1);
    QCOMPARE(statusSpy.count(), 1);

    QVERIFY(task.resume());
    QTRY_COMPARE(supervisor->launchCount(), 2);
    QTRY_COMPARE(sampleSpy.count(), 2);
}

void TestEngineSupervisor::testStopWhileStreaming()
{
    Task task(makeRecord(), testOptions(blockingEngine(m_dir)));
    QSignalSpy sampleSpy(task.supervisor(), &EngineSupervisor::progressSampled);
    QSignalSpy finishedSpy(task.supervisor(), &EngineSupervisor::finished);
    QSignalSpy terminatedSpy(task.supervisor(), &EngineSupervisor::engineTerminated);

    QVERIFY(task.start());
    QTRY_COMPARE(sampleSpy.count(), 1);

    QVERIFY(task.stop());
    QTRY_COMPARE(finishedSpy.count(), 1);
    QCOMPARE(finishedSpy.at(0).at(0).value<TaskStatus>(), TaskStatus::Stopped);
    QCOMPARE(terminatedSpy.count(), 1);
}

void TestEngineSupervisor::testShutdownIsSilent()
{
    Task task(makeRecord(), testOptions(blockingEngine(m_dir)));
    QSignalSpy sampleSpy(task.supervisor(), &EngineSupervisor::progressSampled);
    QSignalSpy finishedSpy(task.supervisor(), &EngineSupervisor::finished);

    QVERIFY(task.start());
    QTRY_COMPARE(sampleSpy.count(), 1);

    task.supervisor()->shutdown();
    QVERIFY(!task.supervisor()->isActive());

    QTest::qWait(200);
    QCOMPARE(finishedSpy.count(), 0);
}

void TestEngineSupervisor::testLocateConfiguredEngine()
{
    const QString engine = finishingEngine(m_dir, 0);
    QCOMPARE(EngineOptions::locateEngine(engine), QFileInfo(engine).absoluteFilePath());

    Settings settings;
    settings.enginePath = engine;
    settings.connections = 4;
    const EngineOptions options = EngineOptions::fromSettings(settings);
    QCOMPARE(options.program, QFileInfo(engine).absoluteFilePath());
    QCOMPARE(options.connections, 4);
}

QTEST_MAIN(TestEngineSupervisor)
#include "test_enginesupervisor.moc"
