/**
 * @file assemblyworker_test.cpp
 * @brief AssemblyWorker on its own QThread, and the exit codes derived from a run
 */

#include <QtTest/QtTest>
#include <QEventLoop>
#include <QTemporaryDir>
#include <QThread>

#include "assemblyworker.h"
#include "fakeprocessrunner.h"
#include "jobregistry.h"

class AssemblyWorkerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testExitCode_data();
    void testExitCode();
    void testWorker_validationIssuesStillExitZero();
    void testWorker_encoderFailureExitsOne();
    void testWorker_mixedBatchExitsZero();
    void testWorker_allJobsFailedExitsOne();

private:
    struct RunOutcome
    {
        int succeeded = -1;
        int failed = -1;
        QStringList finishedJobs;
        Qt::HANDLE workerThread = nullptr;
    };

    RunOutcome runOnThread(const QList<AssemblyRequest>& requests, JobRegistry* registry);
    AssemblyRequest request(const QString& jobId, double estimatedDuration = 24.0) const;

    QTemporaryDir* m_dir = nullptr;
    FakeProcessRunner* m_runner = nullptr;
    QByteArray m_outputProbe;
    bool m_ffmpegFails = false;
};

void AssemblyWorkerTest::initTestCase()
{
    qRegisterMetaType<AssemblyResult>();
    qRegisterMetaType<AssemblyError>();
    qRegisterMetaType<LogCategory>();
}

void AssemblyWorkerTest::init()
{
    m_dir = new QTemporaryDir();
    m_runner = new FakeProcessRunner();
    m_outputProbe = FakeProcessRunner::probeJson(1080, 1920, 28.0, 12LL * 1024 * 1024, true);
    m_ffmpegFails = false;

    // Runs in the worker thread only; the test thread reads after wait()
    m_runner->handler = [this](const QString& program, const QStringList& arguments,
                               const ProcessRunner::OutputCallback&) {
        if (program == "ffprobe")
        {
            return FakeProcessRunner::success(m_outputProbe);
        }
        if (m_ffmpegFails)
        {
            return FakeProcessRunner::failure(1, "Error while opening encoder");
        }
        FakeProcessRunner::touch(arguments.last());
        return FakeProcessRunner::success();
    };

    FakeProcessRunner::touch(m_dir->filePath("voiceover.mp3"));
}

void AssemblyWorkerTest::cleanup()
{
    delete m_runner;
    delete m_dir;
}

AssemblyRequest AssemblyWorkerTest::request(const QString& jobId, double estimatedDuration) const
{
    AssemblyRequest req;
    req.jobId = jobId;
    req.audioPath = m_dir->filePath("voiceover.mp3");
    req.audioDuration = 28.0;
    req.estimatedDuration = estimatedDuration;
    req.background = BackgroundSource::flatColor(QColor(10, 20, 30));
    req.outputPath = m_dir->filePath(jobId + "/final_video.mp4");
    req.workDir = m_dir->filePath(jobId + "/work");

    SubtitleCue cue;
    cue.start = 0.0;
    cue.end = 24.0;
    cue.text = "Only line";
    req.cues.append(cue);
    return req;
}

AssemblyWorkerTest::RunOutcome AssemblyWorkerTest::runOnThread(const QList<AssemblyRequest>& requests,
                                                               JobRegistry* registry)
{
    AssemblyConfig config;
    config.ffmpegPath = "ffmpeg";
    config.ffprobePath = "ffprobe";
    config.fallbackColor = QColor(20, 20, 40);

    RunOutcome outcome;
    QThread* thread = new QThread();
    AssemblyWorker* worker = new AssemblyWorker(config, requests, registry, m_runner);
    worker->moveToThread(thread);

    QEventLoop loop;
    connect(thread, &QThread::started, worker, &AssemblyWorker::start);
    connect(worker, &AssemblyWorker::jobFinished, this,
            [&outcome](const QString& jobId, bool, const AssemblyResult&, const AssemblyError&) {
                outcome.finishedJobs.append(jobId);
            });
    connect(worker, &AssemblyWorker::finished, this, [&outcome, thread](int succeeded, int failed) {
        outcome.succeeded = succeeded;
        outcome.failed = failed;
        outcome.workerThread = QThread::currentThreadId();
        thread->quit();
    }, Qt::DirectConnection);
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, &loop, &QEventLoop::quit);

    thread->start();
    QTimer::singleShot(30000, &loop, &QEventLoop::quit);
    loop.exec();
    thread->wait();
    delete thread;
    // Queued jobFinished deliveries
    QCoreApplication::processEvents();
    return outcome;
}

// ============================================================================
// Exit code rules
// ============================================================================

void AssemblyWorkerTest::testExitCode_data()
{
    QTest::addColumn<int>("jobs");
    QTest::addColumn<int>("succeeded");
    QTest::addColumn<int>("expected");

    QTest::newRow("single ok") << 1 << 1 << int(ExitOk);
    QTest::newRow("single failed") << 1 << 0 << int(ExitFailure);
    QTest::newRow("batch partly ok") << 3 << 1 << int(ExitOk);
    QTest::newRow("batch all failed") << 3 << 0 << int(ExitFailure);
    QTest::newRow("nothing loaded") << 0 << 0 << int(ExitFailure);
}

void AssemblyWorkerTest::testExitCode()
{
    QFETCH(int, jobs);
    QFETCH(int, succeeded);
    QFETCH(int, expected);
    QCOMPARE(AssemblyWorker::exitCode(jobs, succeeded), expected);
}

// ============================================================================
// Worker thread
// ============================================================================

/**
 * @brief Test: the produced file is 1280x720
 * Expected: the job still succeeds and the run exits 0
 */
void AssemblyWorkerTest::testWorker_validationIssuesStillExitZero()
{
    m_outputProbe = FakeProcessRunner::probeJson(1280, 720, 28.0, 1024, false);

    JobRegistry registry;
    const RunOutcome outcome = runOnThread({request("job_1")}, &registry);

    QCOMPARE(outcome.succeeded, 1);
    QCOMPARE(outcome.failed, 0);
    QVERIFY(outcome.workerThread != QThread::currentThreadId());
    QCOMPARE(outcome.finishedJobs, QStringList({"job_1"}));
    QCOMPARE(AssemblyWorker::exitCode(1, outcome.succeeded), int(ExitOk));

    JobProgress progress;
    QVERIFY(registry.snapshot("job_1", progress));
    QCOMPARE(progress.stage, QString("Done"));
}

void AssemblyWorkerTest::testWorker_encoderFailureExitsOne()
{
    m_ffmpegFails = true;

    JobRegistry registry;
    const RunOutcome outcome = runOnThread({request("job_1")}, &registry);

    QCOMPARE(outcome.succeeded, 0);
    QCOMPARE(outcome.failed, 1);
    QCOMPARE(AssemblyWorker::exitCode(1, outcome.succeeded), int(ExitFailure));

    JobProgress progress;
    QVERIFY(registry.snapshot("job_1", progress));
    QCOMPARE(progress.stage, QString("Failed"));
}

void AssemblyWorkerTest::testWorker_mixedBatchExitsZero()
{
    JobRegistry registry;
    const QList<AssemblyRequest> requests = {request("job_a"), request("job_b", -1.0), request("job_c")};
    const RunOutcome outcome = runOnThread(requests, &registry);

    QCOMPARE(outcome.succeeded, 2);
    QCOMPARE(outcome.failed, 1);
    QCOMPARE(outcome.finishedJobs, QStringList({"job_a", "job_b", "job_c"}));
    QCOMPARE(AssemblyWorker::exitCode(requests.size(), outcome.succeeded), int(ExitOk));
}

void AssemblyWorkerTest::testWorker_allJobsFailedExitsOne()
{
    JobRegistry registry;
    const QList<AssemblyRequest> requests = {request("job_a", -1.0), request("job_b", -2.0)};
    const RunOutcome outcome = runOnThread(requests, &registry);

    QCOMPARE(outcome.succeeded, 0);
    QCOMPARE(outcome.failed, 2);
    QCOMPARE(m_runner->callCount("ffmpeg"), 0);
    QCOMPARE(AssemblyWorker::exitCode(requests.size(), outcome.succeeded), int(ExitFailure));
}

QTEST_MAIN(AssemblyWorkerTest)
#include "assemblyworker_test.moc"
