/**
 * @file jobregistry_test.cpp
 * @brief Unit tests for JobRegistry and JobContext
 */

#include <QtTest/QtTest>
#include <QThread>

#include "jobregistry.h"

class JobRegistryTest : public QObject
{
    Q_OBJECT

private slots:
    void testContext_publishesIdleOnCreation();
    void testContext_stageResetsPercent();
    void testContext_percentIsBounded();
    void testContext_withoutRegistry();
    void testSnapshot_unknownJob();
    void testRemove();
    void testConcurrentWriters();
};

void JobRegistryTest::testContext_publishesIdleOnCreation()
{
    JobRegistry registry;
    JobContext context("job_1", &registry);

    JobProgress progress;
    QVERIFY(registry.snapshot("job_1", progress));
    QCOMPARE(progress.stage, QString("Idle"));
    QCOMPARE(progress.percent, 0);
}

void JobRegistryTest::testContext_stageResetsPercent()
{
    JobRegistry registry;
    JobContext context("job_1", &registry);

    context.setStage("Compositing", "encoding");
    context.setPercent(40);
    JobProgress progress;
    QVERIFY(registry.snapshot("job_1", progress));
    QCOMPARE(progress.stage, QString("Compositing"));
    QCOMPARE(progress.percent, 40);
    QCOMPARE(progress.message, QString("encoding"));

    context.setStage("Validating");
    QVERIFY(registry.snapshot("job_1", progress));
    QCOMPARE(progress.stage, QString("Validating"));
    QCOMPARE(progress.percent, 0);
}

void JobRegistryTest::testContext_percentIsBounded()
{
    JobRegistry registry;
    JobContext context("job_1", &registry);

    context.setPercent(150);
    QCOMPARE(context.current().percent, 100);
    context.setPercent(-3);
    QCOMPARE(context.current().percent, 0);
}

void JobRegistryTest::testContext_withoutRegistry()
{
    JobContext context("solo");
    context.setStage("Done");
    context.setPercent(100);
    QCOMPARE(context.jobId(), QString("solo"));
    QCOMPARE(context.current().stage, QString("Done"));
    QCOMPARE(context.current().percent, 100);
}

void JobRegistryTest::testSnapshot_unknownJob()
{
    JobRegistry registry;
    JobProgress progress;
    progress.stage = "untouched";
    QVERIFY(!registry.snapshot("missing", progress));
    QCOMPARE(progress.stage, QString("untouched"));
    QVERIFY(!registry.contains("missing"));
}

void JobRegistryTest::testRemove()
{
    JobRegistry registry;
    JobContext context("job_1", &registry);
    QVERIFY(registry.contains("job_1"));
    registry.remove("job_1");
    QVERIFY(!registry.contains("job_1"));
    QVERIFY(registry.snapshotAll().isEmpty());
}

void JobRegistryTest::testConcurrentWriters()
{
    JobRegistry registry;
    const int jobCount = 4;
    QList<QThread*> threads;

    for (int i = 0; i < jobCount; ++i)
    {
        const QString jobId = QString("job_%1").arg(i + 1);
        threads.append(QThread::create([&registry, jobId]() {
            JobContext context(jobId, &registry);
            context.setStage("Compositing");
            for (int p = 0; p <= 100; ++p)
            {
                context.setPercent(p);
                registry.snapshotAll();
            }
            context.setStage("Done");
            context.setPercent(100);
        }));
    }

    for (QThread* thread : threads)
    {
        thread->start();
    }
    for (QThread* thread : threads)
    {
        QVERIFY(thread->wait(10000));
        delete thread;
    }

    const QMap<QString, JobProgress> all = registry.snapshotAll();
    QCOMPARE(all.size(), jobCount);
    for (auto it = all.constBegin(); it != all.constEnd(); ++it)
    {
        QCOMPARE(it.value().stage, QString("Done"));
        QCOMPARE(it.value().percent, 100);
    }
}

QTEST_MAIN(JobRegistryTest)
#include "jobregistry_test.moc"
