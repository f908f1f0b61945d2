/**
 * @file outputvalidator_test.cpp
 * @brief Unit tests for OutputValidator and MediaProber probe parsing
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "fakeprocessrunner.h"
#include "mediaprober.h"
#include "outputvalidator.h"

class OutputValidatorTest : public QObject
{
    Q_OBJECT

private slots:
    void testValidate_compliantFilePasses();
    void testValidate_wrongResolutionTooLongNoAudio();
    void testValidate_tooShort();
    void testValidate_tooLarge();
    void testValidate_boundariesInclusive();
    void testValidate_deterministic();
    void testValidateFile_missingFile();
    void testValidateFile_unprobeableFile();
    void testValidateFile_probesAndReturnsProbe();
    void testParseProbeJson_streams();
    void testParseProbeJson_invalid();

private:
    static MediaProbe probe(int width, int height, double duration, qint64 sizeBytes, bool audio);
};

MediaProbe OutputValidatorTest::probe(int width, int height, double duration, qint64 sizeBytes, bool audio)
{
    MediaProbe p;
    p.width = width;
    p.height = height;
    p.durationSeconds = duration;
    p.sizeBytes = sizeBytes;
    p.hasAudioStream = audio;
    p.hasVideoStream = true;
    p.videoCodec = "h264";
    return p;
}

/**
 * @brief Test: 1080x1920, 25.0 s, 12 MB, audio present
 * Expected: passed, no issues
 */
void OutputValidatorTest::testValidate_compliantFilePasses()
{
    const ValidationReport report =
        OutputValidator::validate(probe(1080, 1920, 25.0, 12LL * 1024 * 1024, true), PlatformConstraints());
    QVERIFY(report.passed);
    QVERIFY(report.issues.isEmpty());
}

/**
 * @brief Test: 1280x720, 70.0 s, no audio
 * Expected: not passed, exactly three issues (resolution, duration, audio)
 */
void OutputValidatorTest::testValidate_wrongResolutionTooLongNoAudio()
{
    const ValidationReport report =
        OutputValidator::validate(probe(1280, 720, 70.0, 8LL * 1024 * 1024, false), PlatformConstraints());
    QVERIFY(!report.passed);
    QCOMPARE(report.issues.size(), 3);
    QVERIFY(report.issues.at(0).contains("resolution"));
    QVERIFY(report.issues.at(0).contains("1280x720"));
    QVERIFY(report.issues.at(1).contains("too long"));
    QVERIFY(report.issues.at(2).contains("audio"));
}

void OutputValidatorTest::testValidate_tooShort()
{
    const ValidationReport report =
        OutputValidator::validate(probe(1080, 1920, 9.5, 1024, true), PlatformConstraints());
    QVERIFY(!report.passed);
    QCOMPARE(report.issues.size(), 1);
    QVERIFY(report.issues.first().contains("too short"));
}

void OutputValidatorTest::testValidate_tooLarge()
{
    const ValidationReport report =
        OutputValidator::validate(probe(1080, 1920, 30.0, 51LL * 1024 * 1024, true), PlatformConstraints());
    QVERIFY(!report.passed);
    QCOMPARE(report.issues.size(), 1);
    QVERIFY(report.issues.first().contains("too large"));
}

void OutputValidatorTest::testValidate_boundariesInclusive()
{
    const PlatformConstraints constraints;
    QVERIFY(OutputValidator::validate(probe(1080, 1920, 15.0, constraints.maxSizeBytes, true), constraints).passed);
    QVERIFY(OutputValidator::validate(probe(1080, 1920, 60.0, 1, true), constraints).passed);
}

void OutputValidatorTest::testValidate_deterministic()
{
    const MediaProbe p = probe(720, 1280, 61.0, 60LL * 1024 * 1024, false);
    const ValidationReport first = OutputValidator::validate(p, PlatformConstraints());
    for (int i = 0; i < 5; ++i)
    {
        const ValidationReport again = OutputValidator::validate(p, PlatformConstraints());
        QCOMPARE(again.passed, first.passed);
        QCOMPARE(again.issues, first.issues);
    }
    QCOMPARE(first.issues.size(), 4);
}

void OutputValidatorTest::testValidateFile_missingFile()
{
    FakeProcessRunner runner;
    MediaProber prober(&runner, "ffprobe");
    OutputValidator validator(&prober, PlatformConstraints());

    const ValidationReport report = validator.validateFile("/nonexistent/clip.mp4");
    QVERIFY(!report.passed);
    QCOMPARE(report.issues.size(), 1);
    QVERIFY(runner.calls.isEmpty());
}

void OutputValidatorTest::testValidateFile_unprobeableFile()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("garbage.mp4");
    QVERIFY(FakeProcessRunner::touch(path));

    FakeProcessRunner runner;
    runner.handler = [](const QString&, const QStringList&, const ProcessRunner::OutputCallback&)
    {
        return FakeProcessRunner::failure(1, "Invalid data found when processing input");
    };
    MediaProber prober(&runner, "ffprobe");
    OutputValidator validator(&prober, PlatformConstraints());

    const ValidationReport report = validator.validateFile(path);
    QVERIFY(!report.passed);
    QCOMPARE(report.issues.size(), 1);
    // The file is left in place
    QVERIFY(QFileInfo::exists(path));
}

void OutputValidatorTest::testValidateFile_probesAndReturnsProbe()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("final_video.mp4");
    QVERIFY(FakeProcessRunner::touch(path));

    FakeProcessRunner runner;
    runner.handler = [](const QString&, const QStringList&, const ProcessRunner::OutputCallback&)
    {
        return FakeProcessRunner::success(FakeProcessRunner::probeJson(1080, 1920, 25.0, 12LL * 1024 * 1024, true));
    };
    MediaProber prober(&runner, "ffprobe");
    OutputValidator validator(&prober, PlatformConstraints());

    MediaProbe fileProbe;
    const ValidationReport report = validator.validateFile(path, &fileProbe);
    QVERIFY(report.passed);
    QCOMPARE(fileProbe.durationSeconds, 25.0);
    QCOMPARE(runner.calls.size(), 1);
    QCOMPARE(runner.calls.first().arguments, MediaProber::probeArguments(path));
}

void OutputValidatorTest::testParseProbeJson_streams()
{
    MediaProbe p;
    QVERIFY(MediaProber::parseProbeJson(FakeProcessRunner::probeJson(1080, 1920, 27.4, 5000, true), p));
    QCOMPARE(p.width, 1080);
    QCOMPARE(p.height, 1920);
    QCOMPARE(p.durationSeconds, 27.4);
    QCOMPARE(p.sizeBytes, qint64(5000));
    QVERIFY(p.hasAudioStream);
    QVERIFY(p.hasVideoStream);
    QCOMPARE(p.videoCodec, QString("h264"));
}

void OutputValidatorTest::testParseProbeJson_invalid()
{
    MediaProbe p;
    QString problem;
    QVERIFY(!MediaProber::parseProbeJson("not json", p, &problem));
    QVERIFY(!problem.isEmpty());
    QVERIFY(!MediaProber::parseProbeJson("{\"streams\": []}", p, &problem));
}

QTEST_MAIN(OutputValidatorTest)
#include "outputvalidator_test.moc"
