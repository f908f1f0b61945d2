/**
 * @file logsink_test.cpp
 * @brief Unit tests for LogSink
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QThread>

#include "logsink.h"

class LogSinkTest : public QObject
{
    Q_OBJECT

private slots:
    void testFormatLine();
    void testLogFile_receivesEveryCategory();
    void testLogFile_blankMessagesDropped();
    void testLogFile_unwritablePath();
    void testLogFile_concurrentWriters();

private:
    static QStringList readLines(const QString& path);
};

QStringList LogSinkTest::readLines(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        return QStringList();
    }
    return QString::fromUtf8(file.readAll()).split('\n', Qt::SkipEmptyParts);
}

void LogSinkTest::testFormatLine()
{
    const QString line = LogSink::formatLine("  Encoding started \n", LogCategory::FFMPEG);
    static const QRegularExpression re(R"(^\[FFMPEG\] \d{2}:\d{2}:\d{2} - Encoding started$)");
    QVERIFY2(re.match(line).hasMatch(), qPrintable(line));
}

/**
 * @brief Test: only APP is echoed to the console
 * Expected: the file still gets every category, in order
 */
void LogSinkTest::testLogFile_receivesEveryCategory()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("assembly.log");
    {
        LogSink sink(path, {LogCategory::APP});
        QVERIFY(sink.isFileOpen());
        sink.logMessage("job started", LogCategory::APP);
        sink.logMessage("frame=10", LogCategory::FFMPEG);
        sink.logMessage("factor 1.1667", LogCategory::TIMING);
        sink.logMessage("Stage: Done", LogCategory::DEBUG);
    }

    const QStringList lines = readLines(path);
    QCOMPARE(lines.size(), 4);
    QVERIFY(lines.at(0).startsWith("[APP]"));
    QVERIFY(lines.at(1).startsWith("[FFMPEG]"));
    QVERIFY(lines.at(2).startsWith("[TIMING]"));
    QVERIFY(lines.at(3).startsWith("[DEBUG]"));
    QVERIFY(lines.at(2).endsWith("factor 1.1667"));
}

void LogSinkTest::testLogFile_blankMessagesDropped()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("assembly.log");
    {
        LogSink sink(path, {});
        sink.logMessage("   \n", LogCategory::FFMPEG);
        sink.logMessage(QString(), LogCategory::APP);
        sink.logMessage("kept", LogCategory::APP);
    }
    QCOMPARE(readLines(path).size(), 1);
}

void LogSinkTest::testLogFile_unwritablePath()
{
    LogSink sink("/nonexistent-dir/assembly.log", {});
    QVERIFY(!sink.isFileOpen());
    // Still usable without a file
    sink.logMessage("no file", LogCategory::APP);

    LogSink consoleOnly(QString(), {LogCategory::APP});
    QVERIFY(!consoleOnly.isFileOpen());
}

void LogSinkTest::testLogFile_concurrentWriters()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("assembly.log");
    const int threadCount = 4;
    const int perThread = 200;
    {
        LogSink sink(path, {});
        QList<QThread*> threads;
        for (int i = 0; i < threadCount; ++i)
        {
            threads.append(QThread::create([&sink, i]() {
                for (int n = 0; n < perThread; ++n)
                {
                    sink.logMessage(QString("worker %1 line %2").arg(i).arg(n), LogCategory::DEBUG);
                }
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
    }

    const QStringList lines = readLines(path);
    QCOMPARE(lines.size(), threadCount * perThread);
    for (const QString& line : lines)
    {
        QVERIFY2(line.startsWith("[DEBUG] ") && line.contains(" - worker "), qPrintable(line));
    }
}

QTEST_MAIN(LogSinkTest)
#include "logsink_test.moc"
