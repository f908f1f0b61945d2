#ifndef TIMELINECOMPOSITOR_H
#define TIMELINECOMPOSITOR_H

#include "appsettings.h"
#include "assemblytypes.h"
#include "backgroundcompositor.h"
#include "subtitlerasterizer.h"

#include <QList>
#include <QObject>
#include <QStringList>

class ProcessRunner;

/**
 * @brief Layers background, audio and cue bitmaps and runs the encoder once
 *
 * Input 0 is the background, input 1 the narration (absent when the
 * background carries it), then one input per cue bitmap. Each bitmap is
 * overlaid only while its cue is active. The encoder call blocks until
 * ffmpeg exits; it is never retried here.
 */
class TimelineCompositor : public QObject
{
    Q_OBJECT
public:
    explicit TimelineCompositor(ProcessRunner *runner, const QString &ffmpegPath, const EncodingSettings &encoding,
                                QObject *parent = nullptr);

    bool compose(const BackgroundTrack &background, const QString &audioPath, const QList<RasterizedCue> &cues,
                 const QString &outputPath, AssemblyError *error = nullptr);

    QStringList buildArguments(const BackgroundTrack &background, const QString &audioPath,
                               const QList<RasterizedCue> &cues, const QString &outputPath) const;

    static QString buildFilterGraph(const BackgroundTrack &background, const QList<RasterizedCue> &cues,
                                    int firstCueInput, QString *outputLabel = nullptr);
    static int progressPercent(qint64 outTimeUs, double totalDuration);

signals:
    void logMessage(const QString &message, LogCategory category = LogCategory::APP);
    void progressChanged(int percent);

private:
    ProcessRunner *m_runner;
    QString m_ffmpegPath;
    EncodingSettings m_encoding;
};

#endif // TIMELINECOMPOSITOR_H
