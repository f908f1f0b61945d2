#include "timelinecompositor.h"
#include "processrunner.h"

#include <QDir>
#include <QFileInfo>

TimelineCompositor::TimelineCompositor(ProcessRunner *runner, const QString &ffmpegPath,
                                       const EncodingSettings &encoding, QObject *parent)
    : QObject(parent),
    m_runner(runner),
    m_ffmpegPath(ffmpegPath),
    m_encoding(encoding)
{}

QString TimelineCompositor::buildFilterGraph(const BackgroundTrack &background, const QList<RasterizedCue> &cues,
                                             int firstCueInput, QString *outputLabel)
{
    QStringList graph;
    const QString baseChain = background.filterChain.isEmpty() ? QString("null") : background.filterChain;
    graph << QString("[0:v]%1[bg]").arg(baseChain);

    QString previous = "bg";
    for (int i = 0; i < cues.size(); ++i) {
        const RasterizedCue &cue = cues.at(i);
        const QString label = QString("v%1").arg(i + 1);
        graph << QString("[%1][%2:v]overlay=x=(W-w)/2:y=%3:enable='gte(t,%4)*lt(t,%5)'[%6]")
                     .arg(previous)
                     .arg(firstCueInput + i)
                     .arg(cue.verticalPosition)
                     .arg(BackgroundCompositor::formatSeconds(cue.start))
                     .arg(BackgroundCompositor::formatSeconds(cue.start + cue.duration))
                     .arg(label);
        previous = label;
    }

    if (outputLabel) {
        *outputLabel = previous;
    }
    return graph.join(';');
}

QStringList TimelineCompositor::buildArguments(const BackgroundTrack &background, const QString &audioPath,
                                               const QList<RasterizedCue> &cues, const QString &outputPath) const
{
    QStringList args;
    args << "-y" << "-hide_banner";
    args << background.inputArguments;

    int nextInput = 1;
    QString audioMap = "0:a";
    if (!background.carriesAudio) {
        args << "-i" << audioPath;
        audioMap = QString("%1:a").arg(nextInput);
        ++nextInput;
    }

    for (const RasterizedCue &cue : cues) {
        args << "-i" << cue.imagePath;
    }

    QString videoLabel;
    args << "-filter_complex" << buildFilterGraph(background, cues, nextInput, &videoLabel);
    args << "-map" << QString("[%1]").arg(videoLabel)
         << "-map" << audioMap;

    args << "-c:v" << m_encoding.videoCodec
         << "-preset" << m_encoding.preset
         << "-crf" << QString::number(m_encoding.crf)
         << "-pix_fmt" << m_encoding.pixelFormat
         << "-r" << QString::number(m_encoding.fps)
         << "-c:a" << m_encoding.audioCodec
         << "-b:a" << m_encoding.audioBitrate;

    args << "-shortest"
         << "-t" << BackgroundCompositor::formatSeconds(background.duration)
         << "-movflags" << "+faststart"
         << "-progress" << "pipe:1"
         << "-nostats";

    args << outputPath;
    return args;
}

int TimelineCompositor::progressPercent(qint64 outTimeUs, double totalDuration)
{
    const qint64 totalDurationUs = static_cast<qint64>(totalDuration * 1000000);
    if (totalDurationUs <= 0 || outTimeUs <= 0) {
        return 0;
    }
    return static_cast<int>(qMin<qint64>(100, (outTimeUs * 100) / totalDurationUs));
}

bool TimelineCompositor::compose(const BackgroundTrack &background, const QString &audioPath,
                                 const QList<RasterizedCue> &cues, const QString &outputPath, AssemblyError *error)
{
    if (!background.carriesAudio && !QFileInfo::exists(audioPath)) {
        return fail(error, AssemblyError::Kind::InvalidInput, "Audio file not found: " + audioPath);
    }

    const QString outputDir = QFileInfo(outputPath).absolutePath();
    if (!QDir().mkpath(outputDir)) {
        return fail(error, AssemblyError::Kind::InvalidInput, "Cannot create output directory: " + outputDir);
    }

    const QStringList args = buildArguments(background, audioPath, cues, outputPath);
    emit logMessage(QString("Encoding %1 (%2 s, %3 subtitle layers, background: %4)")
                        .arg(QFileInfo(outputPath).fileName())
                        .arg(BackgroundCompositor::formatSeconds(background.duration))
                        .arg(cues.size())
                        .arg(backgroundStrategyToString(background.strategy)),
                    LogCategory::APP);
    emit logMessage(m_ffmpegPath + " " + args.join(' '), LogCategory::FFMPEG);

    // -progress writes key=value lines; a chunk may end mid-line
    QString pending;
    int lastPercent = -1;
    auto onOutput = [&](const QString &chunk) {
        pending.append(chunk);
        int newline = pending.indexOf('\n');
        while (newline != -1) {
            const QString line = pending.left(newline).trimmed();
            pending.remove(0, newline + 1);
            newline = pending.indexOf('\n');

            int percent = -1;
            if (line.startsWith("out_time_us=")) {
                percent = progressPercent(line.section('=', 1).toLongLong(), background.duration);
            } else if (line == "progress=end") {
                percent = 100;
            }
            if (percent > lastPercent) {
                lastPercent = percent;
                emit progressChanged(percent);
            }
        }
    };

    ProcessResult result = m_runner->run(m_ffmpegPath, args, onOutput);

    if (!result.succeeded()) {
        const QString reason = !result.started ? QString("ffmpeg could not be started")
                               : result.crashed ? QString("ffmpeg crashed")
                                                : QString("ffmpeg exited with code %1").arg(result.exitCode);
        emit logMessage(result.standardError.trimmed(), LogCategory::FFMPEG);
        return fail(error, AssemblyError::Kind::EncodingFailed, reason, result.standardError);
    }

    if (!QFileInfo::exists(outputPath)) {
        return fail(error, AssemblyError::Kind::EncodingFailed,
                    "ffmpeg finished but produced no file: " + outputPath, result.standardError);
    }

    if (lastPercent < 100) {
        emit progressChanged(100);
    }
    emit logMessage("Encoding finished: " + QFileInfo(outputPath).fileName(), LogCategory::APP);
    return true;
}
