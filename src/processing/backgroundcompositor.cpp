#include "backgroundcompositor.h"
#include "mediaprober.h"

#include <QFileInfo>
#include <QtMath>

BackgroundCompositor::BackgroundCompositor(MediaProber *prober, const EncodingSettings &encoding,
                                           const QColor &fallbackColor, QObject *parent)
    : QObject(parent),
    m_prober(prober),
    m_encoding(encoding),
    m_fallbackColor(fallbackColor)
{}

QString BackgroundCompositor::formatSeconds(double seconds)
{
    return QString::number(seconds, 'f', 3);
}

int BackgroundCompositor::loopCopies(double sourceDuration, double targetDuration)
{
    if (sourceDuration <= 0.0 || targetDuration <= sourceDuration) {
        return 1;
    }
    return static_cast<int>(qCeil(targetDuration / sourceDuration));
}

QString BackgroundCompositor::scaleCropFilter(int sourceWidth, int sourceHeight, int targetWidth, int targetHeight)
{
    // Resize to the target height keeping the aspect ratio, width rounded to even
    QStringList filters;
    filters << QString("scale=-2:%1").arg(targetHeight);

    int resizedWidth = targetWidth;
    if (sourceWidth > 0 && sourceHeight > 0) {
        resizedWidth = qRound(static_cast<double>(sourceWidth) * targetHeight / sourceHeight / 2.0) * 2;
    }

    if (resizedWidth > targetWidth) {
        filters << QString("crop=%1:%2:(iw-%1)/2:0").arg(targetWidth).arg(targetHeight);
    } else if (resizedWidth < targetWidth) {
        filters << QString("pad=%1:%2:(ow-iw)/2:0:black").arg(targetWidth).arg(targetHeight);
    }
    filters << "setsar=1";
    return filters.join(',');
}

BackgroundTrack BackgroundCompositor::flatColor(const QColor &color, double targetDuration) const
{
    BackgroundTrack track;
    track.strategy = BackgroundStrategy::FlatColor;
    track.color = color;
    track.sourceDuration = targetDuration;
    track.duration = targetDuration;
    track.loopCopies = 1;

    QString hex = color.name(QColor::HexRgb);
    hex.replace('#', "0x");
    track.inputArguments << "-f" << "lavfi" << "-i"
                         << QString("color=c=%1:s=%2x%3:r=%4:d=%5")
                                .arg(hex)
                                .arg(m_encoding.width).arg(m_encoding.height)
                                .arg(m_encoding.fps)
                                .arg(formatSeconds(targetDuration));
    return track;
}

bool BackgroundCompositor::prepareFromProbe(const BackgroundSource &source, const MediaProbe &probe,
                                            double targetDuration, BackgroundTrack &track, AssemblyError *error)
{
    switch (source.kind) {
    case BackgroundSource::Kind::None:
        track = flatColor(m_fallbackColor, targetDuration);
        return true;
    case BackgroundSource::Kind::Color:
        track = flatColor(source.color.isValid() ? source.color : m_fallbackColor, targetDuration);
        return true;
    case BackgroundSource::Kind::Visual:
    case BackgroundSource::Kind::AvatarClip:
        break;
    }

    const QString fileName = QFileInfo(source.path).fileName();
    if (!probe.hasVideoStream) {
        return fail(error, AssemblyError::Kind::BackgroundUnavailable,
                    "Background has no video stream: " + fileName);
    }
    if (probe.durationSeconds <= 0.0) {
        return fail(error, AssemblyError::Kind::BackgroundUnavailable,
                    "Background has no usable duration: " + fileName);
    }
    if (targetDuration <= 0.0) {
        return fail(error, AssemblyError::Kind::InvalidInput,
                    QString("Target duration %1 s is not positive").arg(targetDuration));
    }

    const bool isAvatar = source.kind == BackgroundSource::Kind::AvatarClip;
    if (isAvatar && !probe.hasAudioStream) {
        return fail(error, AssemblyError::Kind::BackgroundUnavailable,
                    "Avatar clip carries no narration: " + fileName);
    }

    BackgroundTrack result;
    result.strategy = isAvatar ? BackgroundStrategy::AvatarPassthrough : BackgroundStrategy::Visual;
    result.sourceDuration = probe.durationSeconds;
    result.duration = targetDuration;
    result.carriesAudio = isAvatar;
    result.loopCopies = loopCopies(probe.durationSeconds, targetDuration);

    if (result.loopCopies > 1) {
        // -stream_loop counts repetitions after the first play
        result.inputArguments << "-stream_loop" << QString::number(result.loopCopies - 1);
        emit logMessage(QString("Background %1 s < %2 s: %3 copies, trimmed to %2 s")
                            .arg(formatSeconds(probe.durationSeconds))
                            .arg(formatSeconds(targetDuration))
                            .arg(result.loopCopies),
                        LogCategory::APP);
    } else {
        emit logMessage(QString("Background %1 s trimmed to [0, %2] s")
                            .arg(formatSeconds(probe.durationSeconds), formatSeconds(targetDuration)),
                        LogCategory::APP);
    }
    result.inputArguments << "-i" << source.path;

    QStringList filters;
    filters << QString("trim=duration=%1").arg(formatSeconds(targetDuration))
            << "setpts=PTS-STARTPTS"
            << scaleCropFilter(probe.width, probe.height, m_encoding.width, m_encoding.height)
            << QString("fps=%1").arg(m_encoding.fps);
    result.filterChain = filters.join(',');

    track = result;
    return true;
}

bool BackgroundCompositor::prepare(const BackgroundSource &source, double targetDuration, BackgroundTrack &track,
                                   AssemblyError *error)
{
    if (source.kind == BackgroundSource::Kind::None || source.kind == BackgroundSource::Kind::Color) {
        return prepareFromProbe(source, MediaProbe(), targetDuration, track, error);
    }

    MediaProbe probe;
    AssemblyError probeError;
    if (!m_prober->probe(source.path, probe, &probeError)) {
        return fail(error, AssemblyError::Kind::BackgroundUnavailable,
                    "Background cannot be opened: " + probeError.message, probeError.diagnostics);
    }
    return prepareFromProbe(source, probe, targetDuration, track, error);
}
